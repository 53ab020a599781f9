#pragma once

#include <netrelay/stream.hpp>

#include <atomic>
#include <memory>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace netrelay {

    // TCP stream implementation using BSD sockets
    // Reliable, ordered, connection-oriented transport
    class TcpStream : public Stream {
      private:
        std::atomic<dp::i32> fd_;
        std::atomic<bool> connected_;
        bool listening_;
        std::atomic<bool> read_closed_;
        std::atomic<bool> write_closed_;
        TcpEndpoint local_endpoint_;
        TcpEndpoint remote_endpoint_;

        // Private constructor for accepted connections
        TcpStream(dp::i32 fd, const TcpEndpoint &local, const TcpEndpoint &remote)
            : fd_(fd), connected_(true), listening_(false), read_closed_(false), write_closed_(false),
              local_endpoint_(local), remote_endpoint_(remote) {
            echo::debug("TcpStream created from accepted connection fd=", fd);
        }

      public:
        TcpStream()
            : fd_(-1), connected_(false), listening_(false), read_closed_(false), write_closed_(false),
              local_endpoint_{"", 0}, remote_endpoint_{"", 0} {
            echo::trace("TcpStream constructed");
        }

        ~TcpStream() override { close(); }

        TcpStream(const TcpStream &) = delete;
        TcpStream &operator=(const TcpStream &) = delete;

        // Client side: connect to remote endpoint
        dp::Res<void> connect(const TcpEndpoint &endpoint) {
            echo::trace("connecting to ", endpoint.to_string());

            struct sockaddr_in addr = {};
            auto res = resolve_ipv4(endpoint.host, endpoint.port, SOCK_STREAM, addr);
            if (res.is_err()) {
                return res;
            }

            // Create socket
            dp::i32 fd = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("socket created fd=", fd);

            if (::connect(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                echo::error("connect failed: ", strerror(errno));
                ::close(fd);
                return dp::result::err(dp::Error::io_error("connect failed"));
            }

            fd_ = fd;
            connected_ = true;
            remote_endpoint_ = endpoint;
            echo::debug("connected to ", endpoint.to_string());
            echo::info("TcpStream connected to ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: bind and listen
        dp::Res<void> listen(const TcpEndpoint &endpoint) {
            echo::trace("listening on ", endpoint.to_string());

            struct sockaddr_in addr = {};
            auto res = resolve_ipv4(endpoint.host, endpoint.port, SOCK_STREAM, addr);
            if (res.is_err()) {
                return res;
            }

            // Create socket
            dp::i32 fd = ::socket(AF_INET, SOCK_STREAM, 0);
            if (fd < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("socket created fd=", fd);

            // Set SO_REUSEADDR to avoid "address already in use" errors
            dp::i32 opt = 1;
            if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            if (::bind(fd, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                echo::error("bind failed: ", strerror(errno));
                ::close(fd);
                return dp::result::err(dp::Error::io_error("bind failed"));
            }

            // A relay serves exactly one peer
            if (::listen(fd, 1) < 0) {
                echo::error("listen failed: ", strerror(errno));
                ::close(fd);
                return dp::result::err(dp::Error::io_error("listen failed"));
            }

            fd_ = fd;
            listening_ = true;
            local_endpoint_ = endpoint;
            echo::debug("listening on ", endpoint.to_string());

            return dp::result::ok();
        }

        // Server side: accept incoming connection
        dp::Res<std::unique_ptr<TcpStream>> accept() {
            if (!listening_) {
                echo::error("accept called but not listening");
                return dp::result::err(dp::Error::invalid_argument("not listening"));
            }

            echo::trace("waiting for connection on fd=", fd_.load());

            struct sockaddr_in client_addr = {};
            socklen_t client_len = sizeof(client_addr);

            dp::i32 client_fd;
            do {
                client_fd = ::accept(fd_.load(), (struct sockaddr *)&client_addr, &client_len);
            } while (client_fd < 0 && errno == EINTR);

            if (client_fd < 0) {
                echo::error("accept failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("accept failed"));
            }

            TcpEndpoint client_endpoint = to_tcp_endpoint(client_addr);
            echo::debug("accepted connection from ", client_endpoint.to_string(), " fd=", client_fd);

            auto client_stream = std::unique_ptr<TcpStream>(new TcpStream(client_fd, local_endpoint_, client_endpoint));
            return dp::result::ok(std::move(client_stream));
        }

        dp::Res<Chunk> read(dp::u8 *buffer, dp::usize capacity) override {
            if (read_closed_) {
                return dp::result::ok(eof_chunk());
            }
            if (!connected_) {
                echo::error("read called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            auto res = read_some(fd_.load(), buffer, capacity);
            if (res.is_ok() && res.value().eof) {
                echo::debug("peer ", remote_endpoint_.to_string(), " finished sending");
            }
            return res;
        }

        dp::Res<dp::usize> write(const dp::u8 *buffer, dp::usize size) override {
            if (write_closed_) {
                return dp::result::err(dp::Error::not_found("write side closed"));
            }
            if (!connected_) {
                echo::error("write called but not connected");
                return dp::result::err(dp::Error::not_found("not connected"));
            }

            auto res = write_exact(fd_.load(), buffer, size, true);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return dp::result::ok(size);
        }

        void close_read() override {
            if (!read_closed_.exchange(true)) {
                dp::i32 fd = fd_.load();
                if (fd >= 0 && connected_) {
                    echo::trace("shutdown read side fd=", fd);
                    if (::shutdown(fd, SHUT_RD) < 0 && errno != ENOTCONN) {
                        echo::warn("shutdown failed: ", strerror(errno));
                    }
                }
            }
        }

        void close_write() override {
            if (!write_closed_.exchange(true)) {
                dp::i32 fd = fd_.load();
                if (fd >= 0 && connected_) {
                    echo::trace("shutdown write side fd=", fd);
                    if (::shutdown(fd, SHUT_WR) < 0 && errno != ENOTCONN) {
                        echo::warn("shutdown failed: ", strerror(errno));
                    }
                }
            }
        }

        // Close the connection
        void close() override {
            dp::i32 fd = fd_.exchange(-1);
            if (fd >= 0) {
                echo::trace("closing fd=", fd);
                ::close(fd);
                connected_ = false;
                listening_ = false;
                read_closed_ = true;
                write_closed_ = true;
                echo::debug("TcpStream closed");
            }
        }

        bool is_connected() const { return connected_; }

        TcpEndpoint local_endpoint() const { return local_endpoint_; }

        TcpEndpoint remote_endpoint() const override { return remote_endpoint_; }
    };

} // namespace netrelay
