#pragma once

#include <netrelay/datagram.hpp>
#include <netrelay/session.hpp>

namespace netrelay {

    namespace detail {

        // Relay one unit per read from source to sink until end-of-data, an error or the
        // disconnect sequence. When the source has to learn the peer and none is known yet,
        // the sender of the first unit becomes the peer and is posted to progress exactly once.
        // Closes both ends on exit and returns the number of bytes written.
        inline dp::u64 copy_units(Reader &source, Writer &sink, bool peer_known, UdpEndpoint peer,
                                  ProgressChannel &progress) {
            Message buffer(MAX_UNIT_SIZE);
            dp::u64 total = 0;

            while (true) {
                UdpEndpoint sender{"", 0};
                auto read_res = source.read_from(buffer.data(), buffer.size(), sender);
                if (read_res.is_ok() && !read_res.value().eof && !peer_known && source.learns_peer()) {
                    peer = sender;
                    peer_known = true;
                    progress.post(Progress::learned(peer));
                }
                if (read_res.is_err()) {
                    report_error(peer_label(peer_known, peer), read_res.error());
                    break;
                }
                Chunk chunk = read_res.value();
                if (chunk.eof) {
                    break;
                }

                if (is_disconnect_sequence(buffer.data(), chunk.size)) {
                    echo::debug("[", peer_label(peer_known, peer).c_str(), "]: disconnect sequence received");
                    break;
                }

                dp::Res<dp::usize> write_res = dp::result::ok(static_cast<dp::usize>(0));
                if (sink.needs_destination()) {
                    if (!peer_known) {
                        echo::error("[<nil>]: ERROR: no destination for outgoing datagram");
                        break;
                    }
                    write_res = sink.write_to(buffer.data(), chunk.size, peer);
                } else {
                    write_res = sink.write(buffer.data(), chunk.size);
                }
                if (write_res.is_err()) {
                    report_error(peer_label(peer_known, peer), write_res.error());
                    break;
                }
                total += write_res.value();
            }

            source.close();
            sink.close();
            return total;
        }

    } // namespace detail

    /// Relay a datagram endpoint and the local input/output until both directions finish
    ///
    /// Every read is forwarded as exactly one write. With a fixed peer (dial mode) both
    /// directions start at once. Without one (listen mode) the inbound direction starts
    /// alone, learns the peer from the first datagram and only then is the outbound
    /// direction started, so every outgoing datagram has a destination. A direction reading
    /// the disconnect sequence stops without forwarding it. Errors are logged, never returned.
    inline SessionStats run_datagram_session(Datagram &datagram, Reader &local_in, Writer &local_out) {
        ProgressChannel progress;
        DatagramReader net_in(datagram);
        DatagramWriter net_out(datagram);

        bool peer_known = datagram.has_peer();
        UdpEndpoint peer = datagram.peer();
        SessionStats stats{0, 0, peer_label(peer_known, peer)};

        std::thread inbound([&, peer_known, peer]() {
            dp::u64 bytes = detail::copy_units(net_in, local_out, peer_known, peer, progress);
            progress.post(Progress::finished(Direction::Inbound, bytes));
        });

        int finished = 0;
        if (!peer_known) {
            Progress first = progress.receive();
            if (first.has_remote) {
                peer = first.remote;
                peer_known = true;
                stats.peer = peer.to_string();
                detail::report(stats.peer, "Datagram has been received");
            } else {
                // Inbound ended before anything arrived
                detail::account(stats, first);
                finished++;
            }
        }

        std::thread outbound;
        if (peer_known) {
            outbound = std::thread([&, peer]() {
                dp::u64 bytes = detail::copy_units(local_in, net_out, true, peer, progress);
                progress.post(Progress::finished(Direction::Outbound, bytes));
            });
        } else {
            echo::warn("[", stats.peer.c_str(), "]: no peer address learned, nothing will be sent");
            local_in.close();
            progress.post(Progress::finished(Direction::Outbound, 0));
        }

        while (finished < 2) {
            Progress next = progress.receive();
            if (next.has_remote) {
                continue;
            }
            detail::account(stats, next);
            finished++;
        }

        inbound.join();
        if (outbound.joinable()) {
            outbound.join();
        }
        datagram.close();
        return stats;
    }

} // namespace netrelay
