#pragma once

#include <netrelay/datagram/udp.hpp>
#include <netrelay/options.hpp>
#include <netrelay/session/datagram.hpp>
#include <netrelay/session/stream.hpp>
#include <netrelay/stream/tcp.hpp>

namespace netrelay {

    /// Establish the endpoint described by config and relay it with local_in/local_out
    /// Returns an error only when the endpoint cannot be set up; once a session runs
    /// it always completes with its stats
    inline dp::Res<SessionStats> relay(const Config &config, Reader &local_in, Writer &local_out) {
        switch (config.mode) {
        case Mode::TcpListen: {
            // Listen on every interface, serve exactly one connection
            TcpEndpoint local{"0.0.0.0", config.port};
            TcpStream listener;
            auto res = listener.listen(local);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            echo::info("Listening on tcp:", config.port);

            auto accept_res = listener.accept();
            if (accept_res.is_err()) {
                return dp::result::err(accept_res.error());
            }
            listener.close();

            auto stream = std::move(accept_res.value());
            echo::info("[", stream->remote_endpoint().to_string().c_str(), "]: Connection has been opened");
            return dp::result::ok(run_stream_session(*stream, local_in, local_out));
        }
        case Mode::TcpConnect: {
            TcpEndpoint remote{config.host, config.port};
            TcpStream stream;
            auto res = stream.connect(remote);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            echo::info("Connected to ", remote.to_string());
            return dp::result::ok(run_stream_session(stream, local_in, local_out));
        }
        case Mode::UdpListen: {
            UdpEndpoint local{"0.0.0.0", config.port};
            UdpDatagram datagram;
            auto res = datagram.bind(local);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            // The peer is unknown until the first datagram arrives
            echo::info("Listening on udp:", config.port);
            return dp::result::ok(run_datagram_session(datagram, local_in, local_out));
        }
        case Mode::UdpConnect: {
            UdpEndpoint remote{config.host, config.port};
            UdpDatagram datagram;
            auto res = datagram.connect(remote);
            if (res.is_err()) {
                return dp::result::err(res.error());
            }
            echo::info("Sending datagrams to ", remote.to_string());
            return dp::result::ok(run_datagram_session(datagram, local_in, local_out));
        }
        default:
            return dp::result::err(dp::Error::invalid_argument("unknown mode"));
        }
    }

} // namespace netrelay
