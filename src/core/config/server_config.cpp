#include "core/config/server_config.hpp"

#include <cstdlib>
#include <pwd.h>
#include <system_error>
#include <unistd.h>

namespace terminal::core::config {

using errors::ErrorCategory;
using errors::TerminalError;

errors::Result<std::filesystem::path> resolve_default_workspace() {
    std::string home;
    if (const char* env_home = std::getenv("HOME"); env_home != nullptr) {
        home = env_home;
    }
    if (home.empty()) {
        if (const passwd* entry = getpwuid(getuid()); entry != nullptr &&
                                                     entry->pw_dir != nullptr) {
            home = entry->pw_dir;
        }
    }
    if (home.empty()) {
        return TerminalError{ErrorCategory::Internal,
                             "Unable to determine the home directory.",
                             "home_unresolved",
                             "Set HOME or pass --workspace."};
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(std::filesystem::path(home) / "mcp", ec);
    if (ec) {
        return TerminalError{ErrorCategory::Internal,
                             "Unable to resolve workspace under " + home,
                             "workspace_unresolved"};
    }
    return absolute.lexically_normal();
}

errors::Result<std::filesystem::path> prepare_workspace(const ServerConfig& config) {
    if (config.workspace_root.empty()) {
        return TerminalError{ErrorCategory::Input, "Workspace path is empty.",
                             "invalid_workspace_root"};
    }

    std::error_code ec;
    std::filesystem::create_directories(config.log_dir(), ec);
    if (ec) {
        return TerminalError{ErrorCategory::Internal,
                             "Unable to create workspace directories: " +
                                 config.log_dir().string() + " (" + ec.message() + ")",
                             "workspace_create_failed"};
    }

    if (!std::filesystem::is_directory(config.workspace_root, ec) || ec) {
        return TerminalError{ErrorCategory::Input,
                             "Workspace root is not a directory: " +
                                 config.workspace_root.string(),
                             "invalid_workspace_root"};
    }

    auto canonical_root = std::filesystem::canonical(config.workspace_root, ec);
    if (ec) {
        return TerminalError{ErrorCategory::Internal,
                             "Unable to canonicalize workspace root: " +
                                 config.workspace_root.string(),
                             "invalid_workspace_root"};
    }
    return canonical_root;
}

}  // namespace terminal::core::config
