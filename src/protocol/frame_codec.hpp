#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "protocol/tool_contract.hpp"

namespace terminal::protocol {

    // JSON-RPC 2.0 error codes used on the channel
    constexpr int kInvalidRequest = -32600;
    constexpr int kMethodNotFound = -32601;
    constexpr int kInvalidParams = -32602;
    constexpr int kInternalError = -32603;
    constexpr int kNotInitialized = -32002;

    // Newest first; the first entry is offered when the client asks for an
    // unknown version.
    constexpr const char* kSupportedProtocolVersions[] = {"2025-06-18", "2025-03-26",
                                                         "2024-11-05"};

    enum class FrameKind {
        Request,         // JSON-RPC message with a method and an id
        Notification,    // JSON-RPC message with a method and no id
        Response,        // JSON-RPC result/error sent by the client
        ToolInvocation,  // {"tool": ..., "arguments": {...}}
        Invalid
    };

    struct InboundFrame {
        FrameKind kind = FrameKind::Invalid;
        std::optional<nlohmann::json> id;
        std::string method;
        nlohmann::json params = nlohmann::json::object();
        ToolCall tool_call;
        std::string problem;  // why the frame is Invalid
        bool jsonrpc = false; // carried a "jsonrpc" envelope
    };

    InboundFrame classify(const nlohmann::json& frame);

    std::string negotiate_protocol_version(const std::string& requested);

    nlohmann::json make_rpc_result(const nlohmann::json& id, nlohmann::json result);
    nlohmann::json make_rpc_error(const nlohmann::json& id, int code,
                                  const std::string& message);

    // Simplified tool frames: {"result": text} / {"error": text}, plus "id"
    // when the request carried one.
    nlohmann::json make_tool_result(const std::optional<nlohmann::json>& id,
                                    const std::string& text);
    nlohmann::json make_tool_error(const std::optional<nlohmann::json>& id,
                                   const std::string& message);

    // text/event-stream framing
    std::string encode_sse_event(const std::string& event, const std::string& data);
    std::string encode_sse_comment(const std::string& text);

} // namespace terminal::protocol
