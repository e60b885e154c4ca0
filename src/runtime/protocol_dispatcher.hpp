#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/frame_codec.hpp"
#include "tools/tool_registry.hpp"

namespace terminal::runtime {

enum class ProtocolState {
    Connecting,
    Initialized,
    Serving,
    Closed
};

std::string to_string(ProtocolState state);

struct ServerIdentity {
    std::string name = "terminal";
    std::string version = "1.0.0";
    std::string instructions =
        "Run shell commands in the server workspace with run_command.";
};

// Per-session protocol state machine. Not thread-safe: one dispatcher belongs
// to one session's loop.
class ProtocolDispatcher {
public:
    ProtocolDispatcher(const tools::ToolRegistry& registry, const ServerIdentity& identity);

    // Returns the frame to send back, or nothing for notifications.
    std::optional<nlohmann::json> handle(const nlohmann::json& frame);

    ProtocolState state() const { return state_; }
    void close() { state_ = ProtocolState::Closed; }

private:
    std::optional<nlohmann::json> handle_request(const protocol::InboundFrame& frame);
    void handle_notification(const protocol::InboundFrame& frame);
    nlohmann::json handle_tool_frame(const protocol::InboundFrame& frame);

    nlohmann::json initialize_result(const nlohmann::json& params);
    nlohmann::json tools_list_result() const;
    nlohmann::json tools_call(const nlohmann::json& id, const nlohmann::json& params) const;

    bool accepts_requests() const;
    void mark_serving();

    const tools::ToolRegistry& registry_;
    const ServerIdentity& identity_;
    ProtocolState state_ = ProtocolState::Connecting;
};

}  // namespace terminal::runtime
