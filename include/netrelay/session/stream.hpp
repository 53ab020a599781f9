#pragma once

#include <netrelay/session.hpp>
#include <netrelay/stream.hpp>

namespace netrelay {

    namespace detail {

        // Copy chunks verbatim from source to sink until end-of-data or an error
        // Closes both ends on exit and returns the number of bytes written
        inline dp::u64 copy_stream(Reader &source, Writer &sink, const dp::String &peer) {
            Message buffer(MAX_UNIT_SIZE);
            dp::u64 total = 0;

            while (true) {
                auto read_res = source.read(buffer.data(), buffer.size());
                if (read_res.is_err()) {
                    report_error(peer, read_res.error());
                    break;
                }
                Chunk chunk = read_res.value();
                if (chunk.eof) {
                    break;
                }

                auto write_res = sink.write(buffer.data(), chunk.size);
                if (write_res.is_err()) {
                    report_error(peer, write_res.error());
                    break;
                }
                total += write_res.value();
            }

            source.close();
            sink.close();
            return total;
        }

    } // namespace detail

    /// Relay a connected stream and the local input/output until both directions finish
    ///
    /// Inbound (stream -> local_out) and outbound (local_in -> stream) run on their own
    /// threads. Each one ends on end-of-data or on an error of its own, closing the stream
    /// side it used (read or write) together with its local end; the other direction keeps
    /// running. Errors are logged, never returned. The stream is fully closed on return.
    inline SessionStats run_stream_session(Stream &stream, Reader &local_in, Writer &local_out) {
        SessionStats stats{0, 0, stream.remote_endpoint().to_string()};
        ProgressChannel progress;
        StreamReader net_in(stream);
        StreamWriter net_out(stream);

        const dp::String peer = stats.peer;
        std::thread inbound([&]() {
            dp::u64 bytes = detail::copy_stream(net_in, local_out, peer);
            progress.post(Progress::finished(Direction::Inbound, bytes));
        });
        std::thread outbound([&]() {
            dp::u64 bytes = detail::copy_stream(local_in, net_out, peer);
            progress.post(Progress::finished(Direction::Outbound, bytes));
        });

        // Whichever direction finishes first is reported first
        for (int i = 0; i < 2; i++) {
            detail::account(stats, progress.receive());
        }

        inbound.join();
        outbound.join();
        stream.close();
        return stats;
    }

} // namespace netrelay
