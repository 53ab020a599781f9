#pragma once

#include <netrelay/endpoint.hpp>

#include <CLI/CLI.hpp>
#include <string>

namespace netrelay {

    // Transport and role of a relay invocation
    enum class Mode : dp::u8 {
        TcpListen,
        TcpConnect,
        UdpListen,
        UdpConnect,
    };

    inline const char *mode_name(Mode mode) {
        switch (mode) {
        case Mode::TcpListen:
            return "tcp listen";
        case Mode::TcpConnect:
            return "tcp connect";
        case Mode::UdpListen:
            return "udp listen";
        case Mode::UdpConnect:
            return "udp connect";
        default:
            return "unknown";
        }
    }

    // Command-line options as typed by the user
    struct Options {
        std::string host;
        std::string port = ":9999";
        std::string proto = "tcp";
        bool listen = false;
        bool help = false;
    };

    // Validated configuration the relay runs with
    struct Config {
        Mode mode;
        dp::String host;
        dp::u16 port;
    };

    inline void add_options(CLI::App &app, Options &options) {
        app.add_option("--host", options.host, "Remote host to connect, i.e. 127.0.0.1");
        app.add_option("--port", options.port,
                       "Port to listen on or connect to (prepended by colon), i.e. :9999")
            ->capture_default_str();
        app.add_option("--proto", options.proto, "TCP/UDP mode")->capture_default_str();
        app.add_flag("-l,--listen", options.listen, "Listen mode");
    }

    inline std::string usage() {
        Options options;
        CLI::App app{"Relay standard input/output to a TCP or UDP peer", "netrelay"};
        add_options(app, options);
        return app.help();
    }

    /// Parse argv into Options
    /// --help is not an error: the result has help set and nothing else is validated
    inline dp::Res<Options> parse_options(int argc, const char *const *argv) {
        Options options;
        CLI::App app{"Relay standard input/output to a TCP or UDP peer", "netrelay"};
        add_options(app, options);

        try {
            app.parse(argc, argv);
        } catch (const CLI::CallForHelp &) {
            options.help = true;
            return dp::result::ok(options);
        } catch (const CLI::ParseError &e) {
            return dp::result::err(dp::Error::invalid_argument(e.what()));
        }

        echo::trace("options: host=", options.host.c_str(), " port=", options.port.c_str(),
                    " proto=", options.proto.c_str(), " listen=", options.listen);
        return dp::result::ok(options);
    }

    /// Pick the relay mode and resolve the port
    /// Listening wins over a host; without either there is nothing to do
    inline dp::Res<Config> make_config(const Options &options) {
        auto port_res = parse_port(dp::String(options.port.c_str()));
        if (port_res.is_err()) {
            return dp::result::err(port_res.error());
        }

        Config config{Mode::TcpConnect, dp::String(options.host.c_str()), port_res.value()};
        if (options.proto == "tcp") {
            config.mode = options.listen ? Mode::TcpListen : Mode::TcpConnect;
        } else if (options.proto == "udp") {
            config.mode = options.listen ? Mode::UdpListen : Mode::UdpConnect;
        } else {
            return dp::result::err(dp::Error::invalid_argument(dp::String("unknown proto: ") + options.proto.c_str()));
        }

        if (!options.listen && options.host.empty()) {
            return dp::result::err(dp::Error::invalid_argument("either --listen or --host is required"));
        }

        return dp::result::ok(config);
    }

} // namespace netrelay
