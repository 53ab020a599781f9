#pragma once

#include <netrelay/endpoint.hpp>

#include <atomic>

namespace netrelay {

    // Move whatever fd refers to onto a fresh descriptor, then point fd at target
    // Returns the fresh descriptor; anything later written to fd lands on target
    inline dp::Res<dp::i32> divert_fd(dp::i32 fd, dp::i32 target) {
        dp::i32 kept = ::dup(fd);
        if (kept < 0) {
            return dp::result::err(errno_error("dup", errno));
        }
        if (::dup2(target, fd) < 0) {
            dp::Error error = errno_error("dup2", errno);
            ::close(kept);
            return dp::result::err(error);
        }
        echo::trace("fd ", fd, " diverted to fd ", target, ", original kept as fd ", kept);
        return dp::result::ok(kept);
    }

    // Source side of a copy loop
    // Addressable readers (an unbound datagram endpoint) report the sender of every unit
    // and need the session to learn its peer from the first one
    class Reader {
      public:
        virtual ~Reader() = default;

        // Read one chunk/unit into buffer
        // Blocks until data, end-of-data or an error
        virtual dp::Res<Chunk> read(dp::u8 *buffer, dp::usize capacity) = 0;

        // Same as read() but also reports who sent the unit
        virtual dp::Res<Chunk> read_from(dp::u8 *buffer, dp::usize capacity, UdpEndpoint &sender) {
            sender = UdpEndpoint{};
            return read(buffer, capacity);
        }

        // True if the peer address must be learned from what this reader receives
        virtual bool learns_peer() const { return false; }

        // Release the source; safe to call more than once
        virtual void close() = 0;
    };

    // Sink side of a copy loop
    class Writer {
      public:
        virtual ~Writer() = default;

        // Write the whole buffer, returns the number of bytes written
        virtual dp::Res<dp::usize> write(const dp::u8 *buffer, dp::usize size) = 0;

        // Write to an explicit destination (unbound datagram endpoint)
        virtual dp::Res<dp::usize> write_to(const dp::u8 *buffer, dp::usize size, const UdpEndpoint &dest) {
            (void)dest;
            return write(buffer, size);
        }

        // True if writes need an explicit destination
        virtual bool needs_destination() const { return false; }

        // Release the sink; safe to call more than once
        virtual void close() = 0;
    };

    // Reader over a plain file descriptor (standard input, a pipe, a file)
    class FdReader : public Reader {
      private:
        std::atomic<dp::i32> fd_;

      public:
        explicit FdReader(dp::i32 fd) : fd_(fd) { echo::trace("FdReader constructed fd=", fd); }

        ~FdReader() override { close(); }

        FdReader(const FdReader &) = delete;
        FdReader &operator=(const FdReader &) = delete;

        dp::Res<Chunk> read(dp::u8 *buffer, dp::usize capacity) override {
            dp::i32 fd = fd_.load();
            if (fd < 0) {
                return dp::result::ok(eof_chunk());
            }
            return read_some(fd, buffer, capacity);
        }

        void close() override {
            dp::i32 fd = fd_.exchange(-1);
            if (fd >= 0) {
                echo::trace("closing reader fd=", fd);
                ::close(fd);
            }
        }

        bool is_open() const { return fd_.load() >= 0; }
    };

    // Writer over a plain file descriptor (standard output, a pipe, a file)
    class FdWriter : public Writer {
      private:
        std::atomic<dp::i32> fd_;

      public:
        explicit FdWriter(dp::i32 fd) : fd_(fd) { echo::trace("FdWriter constructed fd=", fd); }

        ~FdWriter() override { close(); }

        FdWriter(const FdWriter &) = delete;
        FdWriter &operator=(const FdWriter &) = delete;

        dp::Res<dp::usize> write(const dp::u8 *buffer, dp::usize size) override {
            dp::i32 fd = fd_.load();
            if (fd < 0) {
                return dp::result::err(dp::Error::not_found("writer closed"));
            }
            auto res = write_exact(fd, buffer, size);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            return dp::result::ok(size);
        }

        void close() override {
            dp::i32 fd = fd_.exchange(-1);
            if (fd >= 0) {
                echo::trace("closing writer fd=", fd);
                ::close(fd);
            }
        }

        bool is_open() const { return fd_.load() >= 0; }
    };

} // namespace netrelay
