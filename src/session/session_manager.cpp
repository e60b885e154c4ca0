#include "session/session_manager.hpp"

#include <utility>
#include <vector>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace terminal::session {

using core::errors::ErrorCategory;
using core::errors::TerminalError;

core::errors::Result<std::shared_ptr<Session>> SessionManager::create_session() {
    std::lock_guard<std::mutex> lock(mutex_);
    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string session_id = core::config::generate_session_id();
        if (sessions_.find(session_id) != sessions_.end()) {
            continue;
        }

        auto session = std::make_shared<Session>(session_id);
        sessions_.emplace(session_id, session);
        LOG_INFO("SessionManager: session " + session_id + " created (" +
                 std::to_string(sessions_.size()) + " open)");
        return session;
    }

    return TerminalError{ErrorCategory::Internal,
                         "Unable to allocate unique session ID.",
                         "session_id_generation_failed"};
}

core::errors::Result<std::shared_ptr<Session>> SessionManager::find(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return TerminalError{ErrorCategory::NotFound,
                             "Could not find session: " + session_id,
                             "session_not_found"};
    }
    return it->second;
}

core::errors::Result<core::errors::Done> SessionManager::deliver(
    const std::string& session_id, nlohmann::json frame) {
    auto found = find(session_id);
    if (core::errors::is_error(found)) {
        return core::errors::get_error(found);
    }
    const auto& session = core::errors::get_value(found);

    // The lookup lock is released here, so the connection may have dropped
    // in between; the queue itself is the source of truth.
    if (!session->inbound().push(std::move(frame))) {
        return TerminalError{ErrorCategory::NotFound,
                             "Session is closed: " + session_id, "session_closed"};
    }
    return core::errors::Done{};
}

void SessionManager::close_session(const std::string& session_id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return;
        }
        session = std::move(it->second);
        sessions_.erase(it);
    }

    const std::size_t dropped = session->inbound().size();
    if (session->close()) {
        LOG_INFO("SessionManager: session " + session_id + " closed");
    }
    if (dropped > 0) {
        LOG_WARN("SessionManager: dropped " + std::to_string(dropped) +
                 " undelivered message(s) for session " + session_id);
    }
}

std::size_t SessionManager::close_all() {
    std::vector<std::shared_ptr<Session>> open;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : sessions_) {
            open.push_back(std::move(entry.second));
        }
        sessions_.clear();
    }

    for (const auto& session : open) {
        session->close();
    }
    if (!open.empty()) {
        LOG_INFO("SessionManager: closed " + std::to_string(open.size()) + " session(s)");
    }
    return open.size();
}

std::size_t SessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace terminal::session
