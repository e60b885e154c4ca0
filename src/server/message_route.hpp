#pragma once

#include <map>
#include <string>
#include "core/errors/terminal_errors.hpp"

namespace terminal::server {

constexpr const char* kEventStreamPath = "/sse";
constexpr const char* kMessagesPath = "/messages/";

enum class Route {
    EventStream,  // GET /sse
    Messages,     // POST /messages/?session_id=<id> or /messages/<id>
    Unknown
};

struct RequestTarget {
    std::string path;
    std::map<std::string, std::string> query;
};

// Splits "/path?a=1&b=2" and percent-decodes the query values.
RequestTarget parse_target(const std::string& target);

Route match_route(const RequestTarget& target);

// Session id from the query string, or from the path segment after
// /messages/. missing_session_id / invalid_session_id on failure. The
// returned id is lowercased.
core::errors::Result<std::string> extract_session_id(const RequestTarget& target);

// Where a client should POST its frames for this session.
std::string message_endpoint_for(const std::string& session_id);

}  // namespace terminal::server
