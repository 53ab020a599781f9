#include <atomic>
#include <chrono>
#include <doctest/doctest.h>
#include <netrelay/session/stream.hpp>
#include <netrelay/stream/tcp.hpp>
#include <thread>

#include "test_helpers.hpp"

namespace {
    // Connected pair of TCP streams on loopback
    struct TcpPair {
        netrelay::TcpStream listener;
        netrelay::TcpStream client;
        std::unique_ptr<netrelay::TcpStream> server;

        bool open(dp::u16 port) {
            netrelay::TcpEndpoint endpoint{"127.0.0.1", port};
            if (listener.listen(endpoint).is_err()) {
                return false;
            }
            std::thread accept_thread([&]() {
                auto accept_res = listener.accept();
                if (accept_res.is_ok()) {
                    server = std::move(accept_res.value());
                }
            });
            bool connected = client.connect(endpoint).is_ok();
            accept_thread.join();
            listener.close();
            return connected && server != nullptr;
        }
    };

    std::string read_stream(netrelay::Stream &stream) {
        std::string out;
        dp::u8 buffer[4096];
        while (true) {
            auto res = stream.read(buffer, sizeof(buffer));
            if (res.is_err() || res.value().eof) {
                break;
            }
            out.append(reinterpret_cast<const char *>(buffer), res.value().size);
        }
        return out;
    }
} // namespace

TEST_CASE("Stream session - Two relays talking to each other") {
    TcpPair pair;
    REQUIRE(pair.open(19201));

    TestPipe client_in, client_out, server_in, server_out;
    REQUIRE(client_in.ok());
    REQUIRE(client_out.ok());
    REQUIRE(server_in.ok());
    REQUIRE(server_out.ok());

    netrelay::FdReader client_reader(client_in.release_read());
    netrelay::FdWriter client_writer(client_out.release_write());
    netrelay::FdReader server_reader(server_in.release_read());
    netrelay::FdWriter server_writer(server_out.release_write());

    // Client types "hello" then closes its input, the server has nothing to say
    REQUIRE(write_all(client_in.write_fd, "hello"));
    client_in.close_write();
    server_in.close_write();

    netrelay::SessionStats client_stats{0, 0, ""};
    netrelay::SessionStats server_stats{0, 0, ""};
    std::thread client_session(
        [&]() { client_stats = netrelay::run_stream_session(pair.client, client_reader, client_writer); });
    std::thread server_session(
        [&]() { server_stats = netrelay::run_stream_session(*pair.server, server_reader, server_writer); });

    CHECK(read_all(server_out.read_fd) == "hello");
    CHECK(read_all(client_out.read_fd) == "");

    client_session.join();
    server_session.join();

    CHECK(client_stats.bytes_sent == 5);
    CHECK(client_stats.bytes_received == 0);
    CHECK(server_stats.bytes_received == 5);
    CHECK(server_stats.bytes_sent == 0);
    CHECK(client_stats.peer == "127.0.0.1:19201");
    CHECK(server_stats.peer.find("127.0.0.1:") == 0);

    // Both local ends are closed by the session
    CHECK_FALSE(client_reader.is_open());
    CHECK_FALSE(client_writer.is_open());
    CHECK_FALSE(server_reader.is_open());
    CHECK_FALSE(server_writer.is_open());
    CHECK_FALSE(pair.server->is_connected());
}

TEST_CASE("Stream session - Verbatim passthrough in both directions") {
    TcpPair pair;
    REQUIRE(pair.open(19202));

    TestPipe local_in, local_out;
    REQUIRE(local_in.ok());
    REQUIRE(local_out.ok());
    netrelay::FdReader reader(local_in.release_read());
    netrelay::FdWriter writer(local_out.release_write());

    // Larger than one transfer chunk, with every byte value
    std::string to_peer = pattern(3 * netrelay::MAX_UNIT_SIZE + 17);
    std::string from_peer = pattern(200000);

    netrelay::SessionStats stats{0, 0, ""};
    std::thread session([&]() { stats = netrelay::run_stream_session(*pair.server, reader, writer); });

    std::string received_locally;
    std::thread local_reader([&]() { received_locally = read_all(local_out.read_fd); });
    std::thread local_writer([&]() {
        CHECK(write_all(local_in.write_fd, to_peer));
        local_in.close_write();
    });
    std::thread peer_writer([&]() {
        auto res = pair.client.write(reinterpret_cast<const dp::u8 *>(from_peer.data()), from_peer.size());
        CHECK(res.is_ok());
        pair.client.close_write();
    });

    std::string received_by_peer = read_stream(pair.client);

    peer_writer.join();
    local_writer.join();
    local_reader.join();
    session.join();

    CHECK(received_by_peer == to_peer);
    CHECK(received_locally == from_peer);
    CHECK(stats.bytes_sent == to_peer.size());
    CHECK(stats.bytes_received == from_peer.size());
}

TEST_CASE("Stream session - Error in one direction leaves the other running") {
    TcpPair pair;
    REQUIRE(pair.open(19203));

    TestPipe local_in;
    REQUIRE(local_in.ok());
    netrelay::FdReader reader(local_in.release_read());
    FailingWriter writer;

    std::atomic<bool> done{false};
    netrelay::SessionStats stats{0, 0, ""};
    std::thread session([&]() {
        stats = netrelay::run_stream_session(*pair.server, reader, writer);
        done = true;
    });

    // Inbound direction fails on its first write to local output
    std::string text = "doomed";
    REQUIRE(pair.client.write(reinterpret_cast<const dp::u8 *>(text.data()), text.size()).is_ok());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    CHECK_FALSE(done.load());

    // Outbound direction still relays
    REQUIRE(write_all(local_in.write_fd, "still here"));
    local_in.close_write();
    CHECK(read_stream(pair.client) == "still here");

    session.join();
    CHECK(done.load());
    CHECK(writer.is_closed());
    CHECK(stats.bytes_received == 0);
    CHECK(stats.bytes_sent == 10);
}

TEST_CASE("Stream session - Peer hanging up first") {
    TcpPair pair;
    REQUIRE(pair.open(19204));

    TestPipe local_in, local_out;
    REQUIRE(local_in.ok());
    REQUIRE(local_out.ok());
    netrelay::FdReader reader(local_in.release_read());
    netrelay::FdWriter writer(local_out.release_write());

    netrelay::SessionStats stats{0, 0, ""};
    std::thread session([&]() { stats = netrelay::run_stream_session(*pair.server, reader, writer); });

    std::string text = "bye";
    REQUIRE(pair.client.write(reinterpret_cast<const dp::u8 *>(text.data()), text.size()).is_ok());
    pair.client.close_write();

    // Local output sees the data then end-of-data while local input is still open
    CHECK(read_all(local_out.read_fd) == "bye");

    // The session only returns once the outbound direction ends as well
    REQUIRE(write_all(local_in.write_fd, "ok"));
    local_in.close_write();
    session.join();

    CHECK(read_stream(pair.client) == "ok");
    CHECK(stats.bytes_received == 3);
    CHECK(stats.bytes_sent == 2);
}
