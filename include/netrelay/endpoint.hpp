#pragma once

#include <netrelay/common.hpp>

#include <arpa/inet.h>
#include <cstdlib>
#include <netdb.h>
#include <netinet/in.h>
#include <string>

namespace netrelay {

    // TCP endpoint - host and port
    struct TcpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    // UDP endpoint - host and port
    struct UdpEndpoint {
        dp::String host; // IP address or hostname
        dp::u16 port;

        inline dp::String to_string() const { return host + ":" + dp::String(std::to_string(port).c_str()); }
    };

    inline bool operator==(const UdpEndpoint &a, const UdpEndpoint &b) { return a.host == b.host && a.port == b.port; }

    inline bool operator!=(const UdpEndpoint &a, const UdpEndpoint &b) { return !(a == b); }

    // Parse a port given as "9999" or ":9999"
    inline dp::Res<dp::u16> parse_port(const dp::String &text) {
        std::string digits(text.c_str());
        if (!digits.empty() && digits[0] == ':') {
            digits.erase(0, 1);
        }
        if (digits.empty() || digits.size() > 5) {
            return dp::result::err(dp::Error::invalid_argument(dp::String("invalid port: ") + text.c_str()));
        }
        for (char c : digits) {
            if (c < '0' || c > '9') {
                return dp::result::err(dp::Error::invalid_argument(dp::String("invalid port: ") + text.c_str()));
            }
        }
        unsigned long value = std::strtoul(digits.c_str(), nullptr, 10);
        if (value > 65535) {
            return dp::result::err(dp::Error::invalid_argument(dp::String("port out of range: ") + text.c_str()));
        }
        return dp::result::ok(static_cast<dp::u16>(value));
    }

    // Resolve host:port into an IPv4 socket address
    // An empty host or "0.0.0.0" means INADDR_ANY
    inline dp::Res<void> resolve_ipv4(const dp::String &host, dp::u16 port, dp::i32 socktype, struct sockaddr_in &out) {
        out = {};
        out.sin_family = AF_INET;
        out.sin_port = htons(port);

        if (host.empty() || host == "0.0.0.0") {
            out.sin_addr.s_addr = INADDR_ANY;
            return dp::result::ok();
        }

        if (::inet_pton(AF_INET, host.c_str(), &out.sin_addr) == 1) {
            return dp::result::ok();
        }

        struct addrinfo hints = {};
        hints.ai_family = AF_INET;
        hints.ai_socktype = socktype;

        struct addrinfo *result = nullptr;
        dp::i32 ret = ::getaddrinfo(host.c_str(), nullptr, &hints, &result);
        if (ret != 0) {
            echo::error("getaddrinfo failed for ", host.c_str(), ": ", gai_strerror(ret));
            return dp::result::err(dp::Error::invalid_argument(dp::String("cannot resolve host: ") + host.c_str()));
        }

        out.sin_addr = reinterpret_cast<struct sockaddr_in *>(result->ai_addr)->sin_addr;
        ::freeaddrinfo(result);
        echo::trace("resolved ", host.c_str());
        return dp::result::ok();
    }

    // Convert a socket address back into host and port
    inline UdpEndpoint to_udp_endpoint(const struct sockaddr_in &addr) {
        char ip[INET_ADDRSTRLEN];
        ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        return UdpEndpoint{dp::String(ip), ntohs(addr.sin_port)};
    }

    inline TcpEndpoint to_tcp_endpoint(const struct sockaddr_in &addr) {
        char ip[INET_ADDRSTRLEN];
        ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
        return TcpEndpoint{dp::String(ip), ntohs(addr.sin_port)};
    }

} // namespace netrelay
