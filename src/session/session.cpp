#include "session/session.hpp"

#include <utility>

namespace terminal::session {

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Active:
            return "active";
        case SessionState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

Session::Session(std::string id)
    : id_(std::move(id)) {}

bool Session::activate() {
    SessionState expected = SessionState::Connecting;
    return state_.compare_exchange_strong(expected, SessionState::Active);
}

bool Session::close() {
    const SessionState previous = state_.exchange(SessionState::Closed);
    inbound_.close();
    return previous != SessionState::Closed;
}

}  // namespace terminal::session
