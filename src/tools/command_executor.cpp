#include "tools/command_executor.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>
#include "core/logging/logger.hpp"

namespace terminal::tools {

using core::errors::ErrorCategory;
using core::errors::TerminalError;

namespace {

void set_nonblocking(const int fd) {
    const int flags = fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

void close_pipe(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd != -1) {
            static_cast<void>(close(fd));
            fd = -1;
        }
    }
}

void drain_pipe(const int fd, bool& is_open, std::string& out) {
    if (!is_open) {
        return;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            is_open = false;
            static_cast<void>(close(fd));
            return;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        is_open = false;
        static_cast<void>(close(fd));
        return;
    }
}

}  // namespace

CommandExecutor::CommandExecutor(std::filesystem::path workspace_root,
                                 ExecutorOptions options)
    : workspace_root_(std::move(workspace_root)), options_(std::move(options)) {}

core::errors::Result<CommandOutcome> CommandExecutor::execute(
    const std::string& command) const {
    if (access(options_.shell.c_str(), X_OK) != 0) {
        return TerminalError{ErrorCategory::Execution,
                             "Shell not available: " + options_.shell + " (" +
                                 std::strerror(errno) + ")",
                             "shell_unavailable"};
    }

    // Close-on-exec so children spawned concurrently by other sessions never
    // hold our write ends open.
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return TerminalError{ErrorCategory::Execution,
                             "Failed to create process pipes: " + reason,
                             "pipe_creation_failed"};
    }

    const char* shell = options_.shell.c_str();
    const char* cwd = workspace_root_.c_str();
    const auto started = std::chrono::steady_clock::now();
    const pid_t pid = fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return TerminalError{ErrorCategory::Execution,
                             "Failed to fork process: " + reason, "fork_failed"};
    }

    if (pid == 0) {
        if (chdir(cwd) != 0) {
            _exit(126);
        }
        const int dev_null = open("/dev/null", O_RDONLY);
        if (dev_null != -1) {
            static_cast<void>(dup2(dev_null, STDIN_FILENO));
        }
        static_cast<void>(dup2(stdout_pipe[1], STDOUT_FILENO));
        static_cast<void>(dup2(stderr_pipe[1], STDERR_FILENO));
        execl(shell, "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        _exit(127);
    }

    static_cast<void>(close(stdout_pipe[1]));
    static_cast<void>(close(stderr_pipe[1]));
    set_nonblocking(stdout_pipe[0]);
    set_nonblocking(stderr_pipe[0]);

    CommandOutcome outcome;
    bool stdout_open = true;
    bool stderr_open = true;
    bool child_exited = false;
    int status = 0;

    while (stdout_open || stderr_open || !child_exited) {
        const auto now = std::chrono::steady_clock::now();
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
        if (!outcome.timed_out && options_.timeout_ms > 0 &&
            elapsed > static_cast<std::int64_t>(options_.timeout_ms) && !child_exited) {
            outcome.timed_out = true;
            static_cast<void>(kill(pid, SIGKILL));
        }

        pollfd fds[2];
        nfds_t nfds = 0;
        if (stdout_open) {
            fds[nfds].fd = stdout_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }
        if (stderr_open) {
            fds[nfds].fd = stderr_pipe[0];
            fds[nfds].events = POLLIN;
            ++nfds;
        }

        if (nfds > 0) {
            static_cast<void>(poll(fds, nfds, 50));
        } else {
            static_cast<void>(poll(nullptr, 0, 10));
        }

        drain_pipe(stdout_pipe[0], stdout_open, outcome.stdout_text);
        drain_pipe(stderr_pipe[0], stderr_open, outcome.stderr_text);

        if (!child_exited) {
            const pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                child_exited = true;
            }
        }

        // A background grandchild may keep the pipes open after the shell
        // exits; once the deadline passes stop waiting for it.
        if (child_exited && outcome.timed_out) {
            break;
        }
    }

    if (stdout_open) {
        static_cast<void>(close(stdout_pipe[0]));
    }
    if (stderr_open) {
        static_cast<void>(close(stderr_pipe[0]));
    }

    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    } else {
        outcome.exit_code = -1;
    }

    const auto ended = std::chrono::steady_clock::now();
    outcome.duration_ms =
        std::chrono::duration<double, std::milli>(ended - started).count();
    return outcome;
}

std::string CommandExecutor::run(const std::string& command) const {
    LOG_INFO("Received command: " + command);
    LOG_DEBUG("Executing in workspace: " + workspace_root_.string());

    auto executed = execute(command);
    if (core::errors::is_error(executed)) {
        const auto& err = core::errors::get_error(executed);
        LOG_ERROR("Command execution failed [" + err.code + "]: " + err.message);
        return err.message;
    }
    const auto& outcome = core::errors::get_value(executed);

    LOG_INFO("Command finished | returncode=" + std::to_string(outcome.exit_code));
    if (outcome.timed_out) {
        LOG_WARN("Command killed after " + std::to_string(options_.timeout_ms) + " ms");
    }
    if (!outcome.stdout_text.empty()) {
        LOG_DEBUG("STDOUT:\n" + outcome.stdout_text);
    }
    if (!outcome.stderr_text.empty()) {
        LOG_WARN("STDERR:\n" + outcome.stderr_text);
    }

    if (!outcome.stdout_text.empty()) {
        return outcome.stdout_text;
    }
    if (!outcome.stderr_text.empty()) {
        return outcome.stderr_text;
    }
    if (outcome.timed_out) {
        return "Command timed out after " + std::to_string(options_.timeout_ms) + " ms";
    }
    return "";
}

}  // namespace terminal::tools
