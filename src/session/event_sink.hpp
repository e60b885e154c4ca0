#pragma once

#include <string>

namespace terminal::session {

// Outbound half of a session. Exactly one writer: the session's protocol loop.
class EventSink {
public:
    virtual ~EventSink() = default;

    // Writes one server-sent event. Returns false when the peer is gone.
    virtual bool send(const std::string& event, const std::string& data) = 0;

    // Called while the session is idle; keeps intermediaries from timing the
    // stream out and reports whether the peer is still there.
    virtual bool keepalive() = 0;

    // Cheap check made before each frame is dispatched.
    virtual bool connected() = 0;
};

}  // namespace terminal::session
