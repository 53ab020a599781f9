#pragma once

#include <netrelay/datagram.hpp>

#include <atomic>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace netrelay {

    // UDP datagram implementation using BSD sockets
    // Unreliable, unordered, connectionless transport
    // Message boundaries preserved - no framing needed
    //
    // bind() gives a listen-mode endpoint without a peer; connect() gives a dial-mode
    // endpoint whose peer is fixed. close() only shuts the socket down so that a thread
    // still blocked in recv_from() returns; the descriptor is released by the destructor.
    class UdpDatagram : public Datagram {
      private:
        dp::i32 fd_;
        bool bound_;
        bool has_peer_;
        std::atomic<bool> closed_;
        UdpEndpoint local_endpoint_;
        UdpEndpoint peer_;

        dp::Res<void> create_socket() {
            if (fd_ >= 0) {
                return dp::result::ok();
            }
            fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
            if (fd_ < 0) {
                echo::error("socket creation failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("io error"));
            }
            echo::trace("udp socket created fd=", fd_);
            return dp::result::ok();
        }

        dp::Res<void> check_size(dp::usize size) const {
            if (size > MAX_UNIT_SIZE) {
                echo::warn("datagram too large: ", size, " > ", MAX_UNIT_SIZE);
                return dp::result::err(
                    dp::Error::invalid_argument(dp::String("datagram too large: ") + std::to_string(size).c_str()));
            }
            return dp::result::ok();
        }

      public:
        UdpDatagram()
            : fd_(-1), bound_(false), has_peer_(false), closed_(false), local_endpoint_{"", 0}, peer_{"", 0} {
            echo::trace("UdpDatagram constructed");
        }

        ~UdpDatagram() override {
            close();
            if (fd_ >= 0) {
                echo::trace("releasing fd=", fd_);
                ::close(fd_);
                fd_ = -1;
            }
        }

        UdpDatagram(const UdpDatagram &) = delete;
        UdpDatagram &operator=(const UdpDatagram &) = delete;

        // Listen mode: bind to a local address, the peer is learned from the first unit received
        dp::Res<void> bind(const UdpEndpoint &endpoint) {
            echo::trace("binding to ", endpoint.to_string());

            struct sockaddr_in addr = {};
            auto res = resolve_ipv4(endpoint.host, endpoint.port, SOCK_DGRAM, addr);
            if (res.is_err()) {
                return res;
            }

            res = create_socket();
            if (res.is_err()) {
                return res;
            }

            // Set SO_REUSEADDR
            dp::i32 opt = 1;
            if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
                echo::warn("setsockopt SO_REUSEADDR failed: ", strerror(errno));
            }

            if (::bind(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                echo::error("bind failed: ", strerror(errno));
                ::close(fd_);
                fd_ = -1;
                return dp::result::err(dp::Error::io_error("bind failed"));
            }

            bound_ = true;
            local_endpoint_ = endpoint;
            echo::debug("UdpDatagram bound to ", endpoint.to_string());

            return dp::result::ok();
        }

        // Dial mode: fix the peer address, all units go to and come from it
        dp::Res<void> connect(const UdpEndpoint &endpoint) {
            echo::trace("connecting to ", endpoint.to_string());

            struct sockaddr_in addr = {};
            auto res = resolve_ipv4(endpoint.host, endpoint.port, SOCK_DGRAM, addr);
            if (res.is_err()) {
                return res;
            }

            res = create_socket();
            if (res.is_err()) {
                return res;
            }

            if (::connect(fd_, (struct sockaddr *)&addr, sizeof(addr)) < 0) {
                echo::error("connect failed: ", strerror(errno));
                ::close(fd_);
                fd_ = -1;
                return dp::result::err(dp::Error::io_error("connect failed"));
            }

            bound_ = true;
            has_peer_ = true;
            peer_ = to_udp_endpoint(addr);
            echo::debug("UdpDatagram connected to ", peer_.to_string());

            return dp::result::ok();
        }

        dp::Res<Chunk> recv_from(dp::u8 *buffer, dp::usize capacity, UdpEndpoint &sender) override {
            if (closed_) {
                return dp::result::ok(eof_chunk());
            }
            if (!bound_) {
                echo::error("recv_from called but not bound");
                return dp::result::err(dp::Error::invalid_argument("not bound"));
            }

            struct sockaddr_in src_addr = {};
            socklen_t src_len = sizeof(src_addr);

            dp::isize n;
            do {
                n = ::recvfrom(fd_, buffer, capacity, 0, (struct sockaddr *)&src_addr, &src_len);
            } while (n < 0 && errno == EINTR);

            // A shutdown from another thread wakes recvfrom with 0 bytes
            if (closed_) {
                echo::trace("recv_from woken by close (fd=", fd_, ")");
                return dp::result::ok(eof_chunk());
            }

            if (n < 0) {
                dp::i32 err = errno;
                echo::debug("recvfrom failed: ", strerror(err));
                return dp::result::err(errno_error("recvfrom", err));
            }

            sender = to_udp_endpoint(src_addr);
            echo::trace("recvfrom got ", n, " bytes from ", sender.to_string());

            return dp::result::ok(data_chunk(static_cast<dp::usize>(n)));
        }

        dp::Res<dp::usize> send(const dp::u8 *buffer, dp::usize size) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("endpoint closed"));
            }
            if (!has_peer_) {
                echo::error("send called without a fixed peer");
                return dp::result::err(dp::Error::invalid_argument("no peer address"));
            }
            auto size_res = check_size(size);
            if (size_res.is_err()) {
                return dp::result::err(size_res.error());
            }

            dp::isize n;
            do {
                n = ::send(fd_, buffer, size, MSG_NOSIGNAL);
            } while (n < 0 && errno == EINTR);

            if (n < 0) {
                dp::i32 err = errno;
                echo::debug("send failed: ", strerror(err));
                return dp::result::err(errno_error("send", err));
            }

            echo::trace("sent ", n, " bytes to ", peer_.to_string());
            return dp::result::ok(static_cast<dp::usize>(n));
        }

        dp::Res<dp::usize> send_to(const dp::u8 *buffer, dp::usize size, const UdpEndpoint &dest) override {
            if (closed_) {
                return dp::result::err(dp::Error::not_found("endpoint closed"));
            }
            if (has_peer_) {
                // Same restriction as sendto on a connected socket with a different address
                echo::error("send_to called on an endpoint with a fixed peer");
                return dp::result::err(dp::Error::invalid_argument("endpoint already has a peer"));
            }
            auto size_res = check_size(size);
            if (size_res.is_err()) {
                return dp::result::err(size_res.error());
            }

            auto res = create_socket();
            if (res.is_err()) {
                return dp::result::err(res.error());
            }

            struct sockaddr_in addr = {};
            res = resolve_ipv4(dest.host, dest.port, SOCK_DGRAM, addr);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }

            dp::isize n;
            do {
                n = ::sendto(fd_, buffer, size, MSG_NOSIGNAL, (struct sockaddr *)&addr, sizeof(addr));
            } while (n < 0 && errno == EINTR);

            if (n < 0) {
                dp::i32 err = errno;
                echo::debug("sendto failed: ", strerror(err));
                return dp::result::err(errno_error("sendto", err));
            }

            echo::trace("sent ", n, " bytes to ", dest.to_string());
            return dp::result::ok(static_cast<dp::usize>(n));
        }

        // Set receive timeout in milliseconds
        dp::Res<void> set_recv_timeout(dp::u32 timeout_ms) {
            if (fd_ < 0) {
                echo::error("set_recv_timeout called but socket not created");
                return dp::result::err(dp::Error::invalid_argument("socket not created"));
            }

            struct timeval tv;
            tv.tv_sec = timeout_ms / 1000;
            tv.tv_usec = (timeout_ms % 1000) * 1000;

            if (::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0) {
                echo::error("setsockopt SO_RCVTIMEO failed: ", strerror(errno));
                return dp::result::err(dp::Error::io_error("failed to set timeout"));
            }

            echo::trace("set recv timeout to ", timeout_ms, "ms");
            return dp::result::ok();
        }

        bool has_peer() const override { return has_peer_; }

        UdpEndpoint peer() const override { return peer_; }

        // Actual local address, including an ephemeral port chosen by the kernel
        UdpEndpoint local_endpoint() const {
            if (fd_ < 0) {
                return local_endpoint_;
            }
            struct sockaddr_in addr = {};
            socklen_t len = sizeof(addr);
            if (::getsockname(fd_, (struct sockaddr *)&addr, &len) < 0) {
                return local_endpoint_;
            }
            return to_udp_endpoint(addr);
        }

        bool is_closed() const { return closed_; }

        void close() override {
            if (closed_.exchange(true)) {
                return;
            }
            if (fd_ >= 0) {
                echo::trace("shutting down fd=", fd_);
                // Unconnected UDP sockets report ENOTCONN here but blocked readers are still woken
                if (::shutdown(fd_, SHUT_RDWR) < 0 && errno != ENOTCONN) {
                    echo::warn("shutdown failed: ", strerror(errno));
                }
                echo::debug("UdpDatagram closed");
            }
        }
    };

} // namespace netrelay
