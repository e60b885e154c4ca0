#pragma once

#include <chrono>
#include "runtime/protocol_dispatcher.hpp"
#include "session/event_sink.hpp"
#include "session/session.hpp"
#include "tools/tool_registry.hpp"

namespace terminal::runtime {

enum class LoopExit {
    QueueClosed,  // session closed by the manager (shutdown or teardown)
    SinkFailed    // the event stream peer went away
};

std::string to_string(LoopExit exit);

// Drives one session: waits for inbound frames, dispatches them in arrival
// order and writes each reply to the session's event stream. Blocks the
// calling thread until the session ends.
class ProtocolLoop {
public:
    ProtocolLoop(const tools::ToolRegistry& registry, ServerIdentity identity,
                 std::chrono::milliseconds idle_interval);

    LoopExit run(session::Session& session, session::EventSink& sink) const;

private:
    const tools::ToolRegistry& registry_;
    ServerIdentity identity_;
    std::chrono::milliseconds idle_interval_;
};

}  // namespace terminal::runtime
