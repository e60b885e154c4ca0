#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/terminal_errors.hpp"
#include "core/logging/logger.hpp"

namespace terminal::core::config {

constexpr const char* kDefaultHost = "0.0.0.0";
constexpr std::uint16_t kDefaultPort = 8081;
constexpr std::uint32_t kDefaultKeepaliveMs = 15000;
constexpr const char* kServerName = "terminal";
constexpr const char* kServerVersion = "1.0.0";

// Everything the process needs, resolved once at startup and then read-only.
struct ServerConfig {
    std::string host = kDefaultHost;
    std::uint16_t port = kDefaultPort;
    std::filesystem::path workspace_root;
    logging::LogLevel log_level = logging::LogLevel::INFO;
    std::uint32_t keepalive_ms = kDefaultKeepaliveMs;
    std::uint32_t command_timeout_ms = 0;  // 0 disables the timeout
    std::string server_name = kServerName;
    std::string server_version = kServerVersion;

    std::filesystem::path log_dir() const { return workspace_root / "logs"; }
    std::filesystem::path log_file() const { return log_dir() / "mcp_terminal.log"; }
};

// $HOME/mcp, falling back to the password database when HOME is unset.
errors::Result<std::filesystem::path> resolve_default_workspace();

// Creates the workspace and its log directory; returns the canonical root.
errors::Result<std::filesystem::path> prepare_workspace(const ServerConfig& config);

}  // namespace terminal::core::config
