#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/terminal_errors.hpp"
#include "session/session.hpp"

namespace terminal::session {

// Owns every open session, keyed by id. Connection threads hold a
// shared_ptr for as long as they serve one.
class SessionManager {
public:
    core::errors::Result<std::shared_ptr<Session>> create_session();

    // session_not_found when no open session has this id.
    core::errors::Result<std::shared_ptr<Session>> find(const std::string& session_id) const;

    // Enqueue a frame for the session's protocol loop. session_not_found when
    // the id is unknown, session_closed when it closed while we were looking.
    core::errors::Result<core::errors::Done> deliver(const std::string& session_id,
                                                     nlohmann::json frame);

    // Idempotent. Marks the session closed and forgets it.
    void close_session(const std::string& session_id);

    // Server shutdown: close everything. Returns how many sessions were open.
    std::size_t close_all();

    std::size_t session_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace terminal::session
