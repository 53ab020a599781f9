#pragma once

#include <datapod/datapod.hpp>
#include <echo/echo.hpp>

#include <cerrno>
#include <cstring>
#include <sys/socket.h>
#include <unistd.h>

namespace netrelay {

    // Message type - just a vector of bytes
    using Message = dp::Vector<dp::u8>;

    // Sufficient to handle a full-size UDP datagram or TCP segment in one step
    constexpr dp::usize MAX_UNIT_SIZE = 65535;

    // A datagram carrying this sequence (optionally followed by one byte, e.g. '\n')
    // finishes the receiving direction of a datagram session
    constexpr char DISCONNECT_SEQUENCE[] = "~.";
    constexpr dp::usize DISCONNECT_SEQUENCE_LEN = sizeof(DISCONNECT_SEQUENCE) - 1;

    // Outcome of a single successful read
    // eof is set when the source reached end-of-data; size is 0 in that case
    struct Chunk {
        dp::usize size;
        bool eof;
    };

    inline Chunk data_chunk(dp::usize size) { return Chunk{size, false}; }

    inline Chunk eof_chunk() { return Chunk{0, true}; }

    // Map an errno value from a failed read/write onto the error categories used across netrelay
    // ERROR CATEGORIZATION:
    // - timeout: EAGAIN/EWOULDBLOCK (expected with SO_RCVTIMEO)
    // - not_found: connection closed (ECONNRESET, EPIPE, EBADF, ENOTCONN)
    // - io_error: everything else, with strerror text
    inline dp::Error errno_error(const char *op, dp::i32 err) {
        if (err == EAGAIN || err == EWOULDBLOCK) {
            return dp::Error::timeout(dp::String(op) + " timeout");
        }
        if (err == ECONNRESET) {
            return dp::Error::not_found("connection reset by peer");
        }
        if (err == EPIPE) {
            return dp::Error::not_found("broken pipe");
        }
        if (err == EBADF) {
            return dp::Error::not_found("bad file descriptor");
        }
        if (err == ENOTCONN) {
            return dp::Error::not_found("socket not connected");
        }
        return dp::Error::io_error(dp::String(op) + " error: " + strerror(err));
    }

    // Read whatever is available (at most capacity bytes) from a file descriptor
    // Returns eof_chunk() when the descriptor reports end-of-data
    inline dp::Res<Chunk> read_some(dp::i32 fd, dp::u8 *buffer, dp::usize capacity) {
        while (true) {
            dp::isize n = ::read(fd, buffer, capacity);
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("read interrupted by signal, retrying");
                    continue;
                }
                dp::i32 err = errno;
                echo::trace("read failed: ", strerror(err), " (errno=", err, ", fd=", fd, ")");
                return dp::result::err(errno_error("read", err));
            }

            if (n == 0) {
                echo::trace("end of data (fd=", fd, ")");
                return dp::result::ok(eof_chunk());
            }

            echo::trace("read ", n, " bytes (fd=", fd, ")");
            return dp::result::ok(data_chunk(static_cast<dp::usize>(n)));
        }
    }

    // Helper to write exactly n bytes to a file descriptor
    // Sockets are written with MSG_NOSIGNAL so a vanished peer is an error instead of SIGPIPE
    // Returns dp::Res<void> - ok if all bytes written, error otherwise
    inline dp::Res<void> write_exact(dp::i32 fd, const dp::u8 *buffer, dp::usize count, bool is_socket = false) {
        dp::usize total_written = 0;
        while (total_written < count) {
            dp::isize n = is_socket ? ::send(fd, buffer + total_written, count - total_written, MSG_NOSIGNAL)
                                    : ::write(fd, buffer + total_written, count - total_written);
            if (n < 0) {
                // EINTR: Interrupted by signal - retry transparently
                if (errno == EINTR) {
                    echo::trace("write interrupted by signal, retrying");
                    continue;
                }
                dp::i32 err = errno;
                echo::trace("write failed: ", strerror(err), " (errno=", err, ", fd=", fd, ")");
                return dp::result::err(errno_error("write", err));
            }

            total_written += static_cast<dp::usize>(n);
            echo::trace("wrote ", n, " bytes, total=", total_written, "/", count, " (fd=", fd, ")");
        }
        return dp::result::ok();
    }

    // True when a received unit asks to finish the session:
    // the unit without its final byte is "~.", or the unit is exactly "~."
    // Empty and one-byte units never match
    inline bool is_disconnect_sequence(const dp::u8 *data, dp::usize size) {
        if (size != DISCONNECT_SEQUENCE_LEN && size != DISCONNECT_SEQUENCE_LEN + 1) {
            return false;
        }
        return std::memcmp(data, DISCONNECT_SEQUENCE, DISCONNECT_SEQUENCE_LEN) == 0;
    }

} // namespace netrelay
