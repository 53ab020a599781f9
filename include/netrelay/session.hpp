#pragma once

#include <netrelay/io.hpp>
#include <netrelay/progress.hpp>

#include <thread>
#include <utility>

namespace netrelay {

    /// Outcome of a relay session, filled from the final progress reports
    /// Informational only: a session never fails from the caller's point of view
    struct SessionStats {
        dp::u64 bytes_received; // peer -> local output
        dp::u64 bytes_sent;     // local input -> peer
        dp::String peer;        // peer label used in status lines
    };

    // Label used to tag status lines while the peer may still be unknown
    inline dp::String peer_label(bool known, const UdpEndpoint &peer) {
        return known ? peer.to_string() : dp::String("<nil>");
    }

    namespace detail {

        // Status line tagged with the peer it concerns
        template <typename... Args> inline void report(const dp::String &peer, Args &&...args) {
            echo::info("[", peer.c_str(), "]: ", std::forward<Args>(args)...);
        }

        inline void report_error(const dp::String &peer, const dp::Error &error) {
            echo::error("[", peer.c_str(), "]: ERROR: ", error.message.c_str());
        }

        // Record a final byte count and tell the user which side stopped
        inline void account(SessionStats &stats, const Progress &progress) {
            if (progress.direction == Direction::Inbound) {
                stats.bytes_received = progress.bytes;
                report(stats.peer, "Connection has been closed by remote peer, ", progress.bytes,
                       " bytes have been received");
            } else {
                stats.bytes_sent = progress.bytes;
                report(stats.peer, "Local peer has been stopped, ", progress.bytes, " bytes have been sent");
            }
        }

    } // namespace detail

} // namespace netrelay
