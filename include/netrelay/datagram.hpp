#pragma once

#include <netrelay/io.hpp>

namespace netrelay {

    // Abstract base class for connectionless, message-oriented transports
    // One send is one unit on the wire; boundaries are preserved by the transport
    // An endpoint either has a fixed peer (dial mode) or learns it later (listen mode)
    class Datagram {
      public:
        virtual ~Datagram() = default;

        // Receive one unit into buffer, reporting the sender
        // Returns eof_chunk() once the endpoint has been closed locally
        virtual dp::Res<Chunk> recv_from(dp::u8 *buffer, dp::usize capacity, UdpEndpoint &sender) = 0;

        // Send one unit to the fixed peer
        virtual dp::Res<dp::usize> send(const dp::u8 *buffer, dp::usize size) = 0;

        // Send one unit to an explicit destination (endpoints without a fixed peer only)
        virtual dp::Res<dp::usize> send_to(const dp::u8 *buffer, dp::usize size, const UdpEndpoint &dest) = 0;

        // True if the peer address was fixed when the endpoint was created
        virtual bool has_peer() const = 0;

        virtual UdpEndpoint peer() const = 0;

        // Stop the endpoint; wakes a blocked recv_from; idempotent
        virtual void close() = 0;
    };

    class DatagramReader : public Reader {
      private:
        Datagram &datagram_;

      public:
        explicit DatagramReader(Datagram &datagram) : datagram_(datagram) {}

        dp::Res<Chunk> read(dp::u8 *buffer, dp::usize capacity) override {
            UdpEndpoint sender{"", 0};
            return datagram_.recv_from(buffer, capacity, sender);
        }

        dp::Res<Chunk> read_from(dp::u8 *buffer, dp::usize capacity, UdpEndpoint &sender) override {
            return datagram_.recv_from(buffer, capacity, sender);
        }

        bool learns_peer() const override { return !datagram_.has_peer(); }

        void close() override { datagram_.close(); }
    };

    class DatagramWriter : public Writer {
      private:
        Datagram &datagram_;

      public:
        explicit DatagramWriter(Datagram &datagram) : datagram_(datagram) {}

        dp::Res<dp::usize> write(const dp::u8 *buffer, dp::usize size) override { return datagram_.send(buffer, size); }

        dp::Res<dp::usize> write_to(const dp::u8 *buffer, dp::usize size, const UdpEndpoint &dest) override {
            return datagram_.send_to(buffer, size, dest);
        }

        bool needs_destination() const override { return !datagram_.has_peer(); }

        void close() override { datagram_.close(); }
    };

} // namespace netrelay
