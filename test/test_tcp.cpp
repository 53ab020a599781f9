#include <chrono>
#include <doctest/doctest.h>
#include <netrelay/stream/tcp.hpp>
#include <thread>

#include "test_helpers.hpp"

namespace {
    // Read from a stream until count bytes or end-of-data
    std::string read_n(netrelay::Stream &stream, size_t count) {
        std::string out;
        dp::u8 buffer[1024];
        while (out.size() < count) {
            auto res = stream.read(buffer, sizeof(buffer));
            if (res.is_err() || res.value().eof) {
                break;
            }
            out.append(reinterpret_cast<const char *>(buffer), res.value().size);
        }
        return out;
    }

    bool send_text(netrelay::Stream &stream, const std::string &text) {
        auto res = stream.write(reinterpret_cast<const dp::u8 *>(text.data()), text.size());
        return res.is_ok() && res.value() == text.size();
    }
} // namespace

TEST_CASE("TcpStream - Basic connection") {
    SUBCASE("Server listen and client connect") {
        netrelay::TcpStream server;
        netrelay::TcpEndpoint endpoint{"127.0.0.1", 19001};

        // Server listens
        auto listen_res = server.listen(endpoint);
        REQUIRE(listen_res.is_ok());

        // Client connects in separate thread
        std::thread client_thread([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            netrelay::TcpStream client;
            auto connect_res = client.connect(endpoint);
            CHECK(connect_res.is_ok());
            CHECK(client.is_connected());
            CHECK(client.remote_endpoint().to_string() == "127.0.0.1:19001");
            client.close();
        });

        // Server accepts
        auto accept_res = server.accept();
        REQUIRE(accept_res.is_ok());

        auto client_stream = std::move(accept_res.value());
        CHECK(client_stream->is_connected());
        CHECK(client_stream->remote_endpoint().host == "127.0.0.1");

        client_thread.join();
        server.close();
    }

    SUBCASE("Connect to non-existent server fails") {
        netrelay::TcpStream client;
        netrelay::TcpEndpoint endpoint{"127.0.0.1", 19999};

        auto connect_res = client.connect(endpoint);
        CHECK(connect_res.is_err());
        CHECK_FALSE(client.is_connected());
    }

    SUBCASE("Accept without listen fails") {
        netrelay::TcpStream server;
        auto accept_res = server.accept();
        CHECK(accept_res.is_err());
    }

    SUBCASE("Read and write without connection fail") {
        netrelay::TcpStream stream;
        dp::u8 buffer[4] = {1, 2, 3, 4};
        CHECK(stream.read(buffer, sizeof(buffer)).is_err());
        CHECK(stream.write(buffer, sizeof(buffer)).is_err());
    }
}

TEST_CASE("TcpStream - Raw byte passthrough") {
    netrelay::TcpStream server;
    netrelay::TcpEndpoint endpoint{"127.0.0.1", 19002};
    REQUIRE(server.listen(endpoint).is_ok());

    std::unique_ptr<netrelay::TcpStream> accepted;
    std::thread accept_thread([&]() {
        auto accept_res = server.accept();
        if (accept_res.is_ok()) {
            accepted = std::move(accept_res.value());
        }
    });

    netrelay::TcpStream client;
    REQUIRE(client.connect(endpoint).is_ok());
    accept_thread.join();
    REQUIRE(accepted != nullptr);

    SUBCASE("Bytes arrive unframed") {
        REQUIRE(send_text(client, "hello"));
        CHECK(read_n(*accepted, 5) == "hello");

        REQUIRE(send_text(*accepted, "hi"));
        CHECK(read_n(client, 2) == "hi");
    }

    SUBCASE("Large payload arrives intact") {
        std::string payload = pattern(300000);
        std::thread writer([&]() { CHECK(send_text(client, payload)); });
        CHECK(read_n(*accepted, payload.size()) == payload);
        writer.join();
    }

    SUBCASE("close_write gives the peer end-of-data, other direction keeps working") {
        REQUIRE(send_text(client, "last"));
        client.close_write();

        CHECK(read_n(*accepted, 100) == "last");

        dp::u8 buffer[8];
        auto res = accepted->read(buffer, sizeof(buffer));
        REQUIRE(res.is_ok());
        CHECK(res.value().eof);

        REQUIRE(send_text(*accepted, "reply"));
        CHECK(read_n(client, 5) == "reply");

        dp::u8 byte = 0x01;
        CHECK(client.write(&byte, 1).is_err());
    }

    SUBCASE("close_read makes local reads end-of-data") {
        accepted->close_read();

        dp::u8 buffer[8];
        auto res = accepted->read(buffer, sizeof(buffer));
        REQUIRE(res.is_ok());
        CHECK(res.value().eof);
    }

    SUBCASE("Half-closes and close are idempotent") {
        client.close_write();
        client.close_write();
        client.close_read();
        client.close_read();
        client.close();
        client.close();
        CHECK_FALSE(client.is_connected());

        dp::u8 buffer[8];
        auto res = accepted->read(buffer, sizeof(buffer));
        REQUIRE(res.is_ok());
        CHECK(res.value().eof);
    }

    accepted->close();
    client.close();
    server.close();
}
