#pragma once

#include <netrelay/endpoint.hpp>

#include <condition_variable>
#include <mutex>
#include <queue>

namespace netrelay {

    enum class Direction : dp::u8 {
        Inbound,  // peer -> local output
        Outbound, // local input -> peer
    };

    inline const char *direction_name(Direction direction) {
        switch (direction) {
        case Direction::Inbound:
            return "inbound";
        case Direction::Outbound:
            return "outbound";
        default:
            return "unknown";
        }
    }

    // Report sent by a copy loop to the session that launched it
    // Either the peer address just learned (sent at most once, before any byte count)
    // or the final byte count of a finished direction
    struct Progress {
        Direction direction;
        bool has_remote;
        UdpEndpoint remote;
        dp::u64 bytes;

        static Progress learned(const UdpEndpoint &remote) { return Progress{Direction::Inbound, true, remote, 0}; }

        static Progress finished(Direction direction, dp::u64 bytes) {
            return Progress{direction, false, UdpEndpoint{"", 0}, bytes};
        }
    };

    /// Completion channel shared by the two directions of a session and its orchestrator
    /// Unbounded FIFO: posting never blocks, receiving blocks until a report is available
    class ProgressChannel {
      private:
        std::mutex mutex_;
        std::condition_variable cv_;
        std::queue<Progress> reports_;

      public:
        void post(const Progress &progress) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                reports_.push(progress);
            }
            cv_.notify_one();
        }

        Progress receive() {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return !reports_.empty(); });
            Progress progress = reports_.front();
            reports_.pop();
            return progress;
        }
    };

} // namespace netrelay
