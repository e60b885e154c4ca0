#include "session/inbound_queue.hpp"

#include <utility>

namespace terminal::session {

bool InboundQueue::push(nlohmann::json frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        frames_.push_back(std::move(frame));
    }
    ready_.notify_one();
    return true;
}

PopStatus InboundQueue::pop(nlohmann::json& out, const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool woke = ready_.wait_for(lock, timeout,
                                      [this] { return closed_ || !frames_.empty(); });
    if (!woke) {
        return PopStatus::Timeout;
    }
    if (closed_) {
        return PopStatus::Closed;
    }
    out = std::move(frames_.front());
    frames_.pop_front();
    return PopStatus::Message;
}

std::size_t InboundQueue::close() {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        dropped = frames_.size();
        frames_.clear();
    }
    ready_.notify_all();
    return dropped;
}

bool InboundQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t InboundQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

}  // namespace terminal::session
