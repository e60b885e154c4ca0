#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/terminal_errors.hpp"

namespace terminal::tools {

struct ExecutorOptions {
    std::string shell = "/bin/sh";
    std::uint32_t timeout_ms = 0;  // 0 waits for the command however long it runs
};

struct CommandOutcome {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs arbitrary shell commands inside one fixed workspace directory.
// Commands are not validated or escaped.
class CommandExecutor {
public:
    explicit CommandExecutor(std::filesystem::path workspace_root,
                             ExecutorOptions options = {});

    // Spawns the shell and captures both streams. Fails only when the
    // process cannot be started at all.
    core::errors::Result<CommandOutcome> execute(const std::string& command) const;

    // Tool-facing form: stdout if non-empty, else stderr, else "". The exit
    // code is logged and not returned. Spawn failures come back as text.
    std::string run(const std::string& command) const;

    const std::filesystem::path& workspace_root() const { return workspace_root_; }

private:
    std::filesystem::path workspace_root_;
    ExecutorOptions options_;
};

}  // namespace terminal::tools
