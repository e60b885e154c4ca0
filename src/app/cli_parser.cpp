#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <system_error>
#include <vector>

namespace terminal::app::cli {

    using namespace terminal::core::errors;
    using terminal::core::config::ServerConfig;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> workspace;
        std::optional<std::string> log_level;
        std::optional<std::string> keepalive_ms;
        std::optional<std::string> command_timeout_ms;
        bool help = false;
    };

    namespace {

        // Exception-free integer parsing; the whole token must be consumed.
        std::optional<std::uint32_t> parse_uint(const std::string& text) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end || text.empty()) {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    std::string usage() {
        return "Usage: mcp_terminal [--host HOST] [--port PORT] [--workspace DIR]\n"
               "                    [--log-level debug|info|warn|error]\n"
               "                    [--keepalive-ms MS] [--command-timeout-ms MS]\n"
               "\n"
               "Run the MCP terminal server (SSE transport).\n"
               "  --host               Host to bind to (default 0.0.0.0)\n"
               "  --port               Port to listen on (default 8081)\n"
               "  --workspace          Command working directory (default ~/mcp)\n"
               "  --log-level          Minimum log level (default info)\n"
               "  --keepalive-ms       Idle interval between SSE pings (default 15000)\n"
               "  --command-timeout-ms Kill commands running longer than this (default 0, never)\n";
    }

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) { // Start at 1 to skip program name
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--host") {
                if (i + 1 < args.size()) raw.host = args[++i];
                else return TerminalError{ErrorCategory::Input, "Missing value for --host", "missing_value"};
            } else if (args[i] == "--port") {
                if (i + 1 < args.size()) raw.port = args[++i];
                else return TerminalError{ErrorCategory::Input, "Missing value for --port", "missing_value"};
            } else if (args[i] == "--workspace") {
                if (i + 1 < args.size()) raw.workspace = args[++i];
                else return TerminalError{ErrorCategory::Input, "Missing value for --workspace", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return TerminalError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--keepalive-ms") {
                if (i + 1 < args.size()) raw.keepalive_ms = args[++i];
                else return TerminalError{ErrorCategory::Input, "Missing value for --keepalive-ms", "missing_value"};
            } else if (args[i] == "--command-timeout-ms") {
                if (i + 1 < args.size()) raw.command_timeout_ms = args[++i];
                else return TerminalError{ErrorCategory::Input, "Missing value for --command-timeout-ms", "missing_value"};
            } else if (args[i] == "--help" || args[i] == "-h") {
                raw.help = true;
            } else {
                return TerminalError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", usage()};
            }
        }

        if (raw.help) {
            return TerminalError{ErrorCategory::Input, "Help requested", "help_requested", usage()};
        }

        // 3. Validator Phase: Enforce logic and bounds
        ServerConfig config;

        if (raw.host) {
            if (raw.host->empty()) {
                return TerminalError{ErrorCategory::Input, "--host cannot be empty", "invalid_host"};
            }
            config.host = raw.host.value();
        }

        if (raw.port) {
            const auto port = parse_uint(raw.port.value());
            if (!port) {
                return TerminalError{ErrorCategory::Input, "Invalid number for --port", "invalid_integer", "Provide a port between 1 and 65535."};
            }
            if (*port == 0 || *port > 65535) {
                return TerminalError{ErrorCategory::Input, "--port out of bounds", "bounds_error", "Must be between 1 and 65535."};
            }
            config.port = static_cast<std::uint16_t>(*port);
        }

        if (raw.log_level) {
            const auto level = terminal::core::logging::parse_level(raw.log_level.value());
            if (!level) {
                return TerminalError{ErrorCategory::Input, "Unknown log level: " + raw.log_level.value(), "invalid_log_level", "Use debug, info, warn or error."};
            }
            config.log_level = *level;
        }

        if (raw.keepalive_ms) {
            const auto keepalive = parse_uint(raw.keepalive_ms.value());
            if (!keepalive) {
                return TerminalError{ErrorCategory::Input, "Invalid number for --keepalive-ms", "invalid_integer"};
            }
            if (*keepalive < 10) {
                return TerminalError{ErrorCategory::Input, "--keepalive-ms out of bounds", "bounds_error", "Must be at least 10."};
            }
            config.keepalive_ms = *keepalive;
        }

        if (raw.command_timeout_ms) {
            const auto timeout = parse_uint(raw.command_timeout_ms.value());
            if (!timeout) {
                return TerminalError{ErrorCategory::Input, "Invalid number for --command-timeout-ms", "invalid_integer"};
            }
            config.command_timeout_ms = *timeout;
        }

        // Path resolution: the workspace is created at startup, so it need not exist yet
        if (raw.workspace) {
            if (raw.workspace->empty()) {
                return TerminalError{ErrorCategory::Input, "--workspace cannot be empty", "invalid_path"};
            }
            std::error_code path_ec;
            auto absolute = std::filesystem::absolute(raw.workspace.value(), path_ec);
            if (path_ec) {
                return TerminalError{ErrorCategory::Input, "Failed to resolve workspace path", "invalid_path"};
            }
            config.workspace_root = absolute.lexically_normal();
        } else {
            auto resolved = terminal::core::config::resolve_default_workspace();
            if (is_error(resolved)) {
                return get_error(resolved);
            }
            config.workspace_root = get_value(resolved);
        }

        return config;
    }

} // namespace terminal::app::cli
