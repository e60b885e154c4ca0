#pragma once

#include <atomic>
#include <string>
#include "session/inbound_queue.hpp"

namespace terminal::session {

enum class SessionState {
    Connecting,
    Active,
    Closed
};

std::string to_string(SessionState state);

// One connected client. The id is the only handle remote callers get.
class Session {
public:
    explicit Session(std::string id);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    SessionState state() const { return state_.load(); }
    bool is_closed() const { return state() == SessionState::Closed; }

    // connecting -> active. No effect on a closed session.
    bool activate();

    // Any state -> closed. Closes the inbound queue; returns false if the
    // session was already closed.
    bool close();

    InboundQueue& inbound() { return inbound_; }

private:
    const std::string id_;
    std::atomic<SessionState> state_{SessionState::Connecting};
    InboundQueue inbound_;
};

}  // namespace terminal::session
