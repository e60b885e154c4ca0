#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>

namespace terminal::session {

enum class PopStatus {
    Message,
    Timeout,
    Closed
};

// Many writers (message POSTs), one reader (the session's protocol loop).
// Frames come out in the order their push() calls took the lock.
class InboundQueue {
public:
    // Returns false once the queue has been closed.
    bool push(nlohmann::json frame);

    // Waits up to `timeout` for the next frame.
    PopStatus pop(nlohmann::json& out, std::chrono::milliseconds timeout);

    // Wakes the reader and rejects later pushes. Pending frames are dropped;
    // returns how many.
    std::size_t close();

    bool is_closed() const;
    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<nlohmann::json> frames_;
    bool closed_ = false;
};

}  // namespace terminal::session
