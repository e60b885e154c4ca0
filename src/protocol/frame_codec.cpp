#include "protocol/frame_codec.hpp"

#include <sstream>
#include <utility>

namespace terminal::protocol {

using nlohmann::json;

namespace {

bool is_valid_id(const json& id) {
    return id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

InboundFrame invalid(std::string problem, std::optional<json> id, bool jsonrpc) {
    InboundFrame frame;
    frame.kind = FrameKind::Invalid;
    frame.problem = std::move(problem);
    frame.id = std::move(id);
    frame.jsonrpc = jsonrpc;
    return frame;
}

InboundFrame classify_tool_frame(const json& message) {
    std::optional<json> id;
    if (auto it = message.find("id"); it != message.end() && !it->is_null()) {
        id = *it;
    }

    const auto& tool = message.at("tool");
    if (!tool.is_string()) {
        return invalid("\"tool\" must be a string", id, false);
    }

    InboundFrame frame;
    frame.kind = FrameKind::ToolInvocation;
    frame.id = id;
    frame.tool_call.name = tool.get<std::string>();
    frame.tool_call.correlation_id = id;
    if (auto args = message.find("arguments"); args != message.end()) {
        frame.tool_call.arguments = *args;
    }
    return frame;
}

InboundFrame classify_rpc_frame(const json& message) {
    std::optional<json> id;
    if (auto it = message.find("id"); it != message.end() && !it->is_null()) {
        if (!is_valid_id(*it)) {
            return invalid("\"id\" must be a string or an integer", json(nullptr), true);
        }
        id = *it;
    }

    const auto version = message.find("jsonrpc");
    if (version == message.end() || *version != "2.0") {
        return invalid("\"jsonrpc\" must be \"2.0\"", id, true);
    }

    const auto method = message.find("method");
    if (method == message.end()) {
        if (id.has_value() && (message.contains("result") || message.contains("error"))) {
            InboundFrame frame;
            frame.kind = FrameKind::Response;
            frame.id = id;
            frame.jsonrpc = true;
            return frame;
        }
        return invalid("missing \"method\"", id, true);
    }
    if (!method->is_string()) {
        return invalid("\"method\" must be a string", id, true);
    }

    InboundFrame frame;
    frame.kind = id.has_value() ? FrameKind::Request : FrameKind::Notification;
    frame.id = id;
    frame.jsonrpc = true;
    frame.method = method->get<std::string>();
    if (auto params = message.find("params"); params != message.end() && !params->is_null()) {
        frame.params = *params;
    }
    return frame;
}

}  // namespace

InboundFrame classify(const json& message) {
    if (!message.is_object()) {
        return invalid("frame must be a JSON object", std::nullopt, false);
    }
    if (message.contains("tool")) {
        return classify_tool_frame(message);
    }
    if (message.contains("jsonrpc") || message.contains("method")) {
        return classify_rpc_frame(message);
    }

    std::optional<json> id;
    if (auto it = message.find("id"); it != message.end() && !it->is_null()) {
        id = *it;
    }
    return invalid("frame is neither a tool invocation nor a JSON-RPC message", id, false);
}

std::string negotiate_protocol_version(const std::string& requested) {
    for (const char* supported : kSupportedProtocolVersions) {
        if (requested == supported) {
            return requested;
        }
    }
    return kSupportedProtocolVersions[0];
}

json make_rpc_result(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_rpc_error(const json& id, const int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

json make_tool_result(const std::optional<json>& id, const std::string& text) {
    json frame{{"result", text}};
    if (id.has_value()) {
        frame["id"] = *id;
    }
    return frame;
}

json make_tool_error(const std::optional<json>& id, const std::string& message) {
    json frame{{"error", message}};
    if (id.has_value()) {
        frame["id"] = *id;
    }
    return frame;
}

std::string encode_sse_event(const std::string& event, const std::string& data) {
    std::ostringstream out;
    out << "event: " << event << "\r\n";

    // Each line of the payload becomes its own data field.
    std::istringstream lines(data);
    std::string line;
    bool wrote_data = false;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        out << "data: " << line << "\r\n";
        wrote_data = true;
    }
    if (!wrote_data) {
        out << "data: \r\n";
    }
    out << "\r\n";
    return out.str();
}

std::string encode_sse_comment(const std::string& text) {
    return ": " + text + "\r\n\r\n";
}

}  // namespace terminal::protocol
