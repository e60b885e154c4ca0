#include "runtime/protocol_dispatcher.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace terminal::runtime {

using nlohmann::json;
using protocol::FrameKind;
using protocol::InboundFrame;

std::string to_string(const ProtocolState state) {
    switch (state) {
        case ProtocolState::Connecting:
            return "connecting";
        case ProtocolState::Initialized:
            return "initialized";
        case ProtocolState::Serving:
            return "serving";
        case ProtocolState::Closed:
            return "closed";
        default:
            return "unknown";
    }
}

ProtocolDispatcher::ProtocolDispatcher(const tools::ToolRegistry& registry,
                                       const ServerIdentity& identity)
    : registry_(registry), identity_(identity) {}

bool ProtocolDispatcher::accepts_requests() const {
    return state_ == ProtocolState::Initialized || state_ == ProtocolState::Serving;
}

void ProtocolDispatcher::mark_serving() {
    if (state_ == ProtocolState::Initialized) {
        state_ = ProtocolState::Serving;
    }
}

std::optional<json> ProtocolDispatcher::handle(const json& message) {
    if (state_ == ProtocolState::Closed) {
        return std::nullopt;
    }

    const InboundFrame frame = protocol::classify(message);
    switch (frame.kind) {
        case FrameKind::Request:
            return handle_request(frame);
        case FrameKind::Notification:
            handle_notification(frame);
            return std::nullopt;
        case FrameKind::Response:
            LOG_DEBUG("Ignoring client response frame");
            return std::nullopt;
        case FrameKind::ToolInvocation:
            return handle_tool_frame(frame);
        case FrameKind::Invalid:
        default:
            LOG_WARN("Rejected frame: " + frame.problem);
            if (frame.jsonrpc) {
                return protocol::make_rpc_error(frame.id.value_or(json(nullptr)),
                                                protocol::kInvalidRequest,
                                                "Invalid request: " + frame.problem);
            }
            return protocol::make_tool_error(frame.id, "Invalid frame: " + frame.problem);
    }
}

std::optional<json> ProtocolDispatcher::handle_request(const InboundFrame& frame) {
    const json& id = frame.id.value();
    LOG_DEBUG("Dispatching request '" + frame.method + "' in state " + to_string(state_));

    if (frame.method == "initialize") {
        json result = initialize_result(frame.params);
        if (state_ == ProtocolState::Connecting) {
            state_ = ProtocolState::Initialized;
        }
        return protocol::make_rpc_result(id, std::move(result));
    }
    if (frame.method == "ping") {
        return protocol::make_rpc_result(id, json::object());
    }
    if (!accepts_requests()) {
        return protocol::make_rpc_error(id, protocol::kNotInitialized,
                                        "Received request before initialization was complete");
    }

    mark_serving();
    if (frame.method == "tools/list") {
        return protocol::make_rpc_result(id, tools_list_result());
    }
    if (frame.method == "tools/call") {
        return tools_call(id, frame.params);
    }
    return protocol::make_rpc_error(id, protocol::kMethodNotFound,
                                    "Method not found: " + frame.method);
}

void ProtocolDispatcher::handle_notification(const InboundFrame& frame) {
    if (frame.method == "notifications/initialized") {
        if (state_ == ProtocolState::Initialized) {
            state_ = ProtocolState::Serving;
        }
        return;
    }
    LOG_DEBUG("Ignoring notification '" + frame.method + "'");
}

json ProtocolDispatcher::handle_tool_frame(const InboundFrame& frame) {
    if (!accepts_requests()) {
        return protocol::make_tool_error(frame.id, "Session is not initialized");
    }
    mark_serving();

    const auto& call = frame.tool_call;
    auto invoked = registry_.invoke(call.name, call.arguments);
    if (core::errors::is_error(invoked)) {
        const auto& err = core::errors::get_error(invoked);
        LOG_WARN("Tool '" + call.name + "' failed [" + err.code + "]: " + err.message);
        return protocol::make_tool_error(call.correlation_id, err.message);
    }
    return protocol::make_tool_result(call.correlation_id, core::errors::get_value(invoked));
}

json ProtocolDispatcher::initialize_result(const json& params) {
    std::string requested;
    if (params.is_object()) {
        if (auto version = params.find("protocolVersion");
            version != params.end() && version->is_string()) {
            requested = version->get<std::string>();
        }
        if (auto client = params.find("clientInfo"); client != params.end() &&
                                                     client->is_object() &&
                                                     client->contains("name")) {
            LOG_INFO("Client connected: " + client->at("name").dump());
        }
    }

    return json{{"protocolVersion", protocol::negotiate_protocol_version(requested)},
                {"capabilities", {{"tools", {{"listChanged", false}}}}},
                {"serverInfo", {{"name", identity_.name}, {"version", identity_.version}}},
                {"instructions", identity_.instructions}};
}

json ProtocolDispatcher::tools_list_result() const {
    json tools = json::array();
    for (const auto& descriptor : registry_.list()) {
        tools.push_back(protocol::to_json(descriptor));
    }
    return json{{"tools", tools}};
}

json ProtocolDispatcher::tools_call(const json& id, const json& params) const {
    if (!params.is_object() || !params.contains("name") || !params.at("name").is_string()) {
        return protocol::make_rpc_error(id, protocol::kInvalidParams,
                                        "tools/call requires a string 'name'");
    }

    const std::string name = params.at("name").get<std::string>();
    json arguments = json::object();
    if (auto it = params.find("arguments"); it != params.end()) {
        arguments = *it;
    }

    auto invoked = registry_.invoke(name, arguments);
    bool is_error = false;
    std::string text;
    if (core::errors::is_error(invoked)) {
        const auto& err = core::errors::get_error(invoked);
        LOG_WARN("Tool '" + name + "' failed [" + err.code + "]: " + err.message);
        is_error = true;
        text = err.message;
    } else {
        text = core::errors::get_value(invoked);
    }

    json content = json::array();
    content.push_back({{"type", "text"}, {"text", text}});
    return protocol::make_rpc_result(id, json{{"content", content}, {"isError", is_error}});
}

}  // namespace terminal::runtime
