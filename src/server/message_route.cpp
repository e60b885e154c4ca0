#include "server/message_route.hpp"

#include <cctype>
#include "core/config/session_id.hpp"

namespace terminal::server {

using core::errors::ErrorCategory;
using core::errors::TerminalError;

namespace {

int hex_value(const char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '+') {
            out.push_back(' ');
            continue;
        }
        if (c == '%' && i + 2 < text.size()) {
            const int hi = hex_value(text[i + 1]);
            const int lo = hex_value(text[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

const std::string kMessagesPrefix = kMessagesPath;

}  // namespace

RequestTarget parse_target(const std::string& target) {
    RequestTarget parsed;
    const auto query_pos = target.find('?');
    parsed.path = target.substr(0, query_pos);
    if (query_pos == std::string::npos) {
        return parsed;
    }

    const std::string query = target.substr(query_pos + 1);
    std::size_t start = 0;
    while (start <= query.size()) {
        auto end = query.find('&', start);
        if (end == std::string::npos) {
            end = query.size();
        }
        const std::string pair = query.substr(start, end - start);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            const std::string key = percent_decode(pair.substr(0, eq));
            const std::string value =
                eq == std::string::npos ? "" : percent_decode(pair.substr(eq + 1));
            // First occurrence wins.
            parsed.query.emplace(key, value);
        }
        start = end + 1;
    }
    return parsed;
}

Route match_route(const RequestTarget& target) {
    if (target.path == kEventStreamPath) {
        return Route::EventStream;
    }
    if (target.path == "/messages" || target.path.rfind(kMessagesPrefix, 0) == 0) {
        return Route::Messages;
    }
    return Route::Unknown;
}

core::errors::Result<std::string> extract_session_id(const RequestTarget& target) {
    std::string candidate;
    if (auto it = target.query.find("session_id"); it != target.query.end()) {
        candidate = it->second;
    } else if (target.path.rfind(kMessagesPrefix, 0) == 0) {
        candidate = target.path.substr(kMessagesPrefix.size());
        if (!candidate.empty() && candidate.back() == '/') {
            candidate.pop_back();
        }
    }

    if (candidate.empty()) {
        return TerminalError{ErrorCategory::Input, "session_id is required",
                             "missing_session_id"};
    }
    if (!core::config::is_valid_session_id(candidate)) {
        return TerminalError{ErrorCategory::Input, "Invalid session ID",
                             "invalid_session_id"};
    }
    return core::config::normalize_session_id(candidate);
}

std::string message_endpoint_for(const std::string& session_id) {
    return kMessagesPrefix + "?session_id=" + session_id;
}

}  // namespace terminal::server
