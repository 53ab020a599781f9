#pragma once

#include <netrelay/io.hpp>

namespace netrelay {

    // Abstract base class for connected, reliable byte streams
    // Data is passed through verbatim: no framing, any chunk size
    class Stream {
      public:
        virtual ~Stream() = default;

        // Read whatever the peer has sent, up to capacity bytes
        // Returns eof_chunk() once the peer finished sending or the read side was closed
        virtual dp::Res<Chunk> read(dp::u8 *buffer, dp::usize capacity) = 0;

        // Write the whole buffer to the peer
        virtual dp::Res<dp::usize> write(const dp::u8 *buffer, dp::usize size) = 0;

        // Half-close: stop receiving
        virtual void close_read() = 0;

        // Half-close: tell the peer no more data follows
        virtual void close_write() = 0;

        // Close both directions and release the connection; idempotent
        virtual void close() = 0;

        // Address of the connected peer
        virtual TcpEndpoint remote_endpoint() const = 0;
    };

    // Inbound side of a stream session: reads from the stream, close() shuts the read side
    class StreamReader : public Reader {
      private:
        Stream &stream_;

      public:
        explicit StreamReader(Stream &stream) : stream_(stream) {}

        dp::Res<Chunk> read(dp::u8 *buffer, dp::usize capacity) override { return stream_.read(buffer, capacity); }

        void close() override { stream_.close_read(); }
    };

    // Outbound side of a stream session: writes to the stream, close() shuts the write side
    class StreamWriter : public Writer {
      private:
        Stream &stream_;

      public:
        explicit StreamWriter(Stream &stream) : stream_(stream) {}

        dp::Res<dp::usize> write(const dp::u8 *buffer, dp::usize size) override { return stream_.write(buffer, size); }

        void close() override { stream_.close_write(); }
    };

} // namespace netrelay
