#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "app/cli_parser.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/terminal_errors.hpp"
#include "core/logging/logger.hpp"
#include "runtime/protocol_loop.hpp"
#include "server/http_server.hpp"
#include "session/session_manager.hpp"
#include "tools/command_executor.hpp"
#include "tools/tool_registry.hpp"

int main(int argc, char* argv[]) {
    namespace errors = terminal::core::errors;
    auto& logger = terminal::core::logging::Logger::get();

    // 1. Parse CLI input and return normalized input errors
    auto parsed = terminal::app::cli::parse_and_validate(argc, argv);
    if (errors::is_error(parsed)) {
        const auto& err = errors::get_error(parsed);
        if (err.code == "help_requested") {
            std::cout << err.hint;
            return 0;
        }
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    auto config = errors::get_value(parsed);
    logger.set_level(config.log_level);

    // 2. Workspace and log file must exist before anything executes
    auto prepared = terminal::core::config::prepare_workspace(config);
    if (errors::is_error(prepared)) {
        const auto& err = errors::get_error(prepared);
        LOG_ERROR("Workspace setup failed [" + err.code + "]: " + err.message);
        return 3;
    }
    config.workspace_root = errors::get_value(prepared);

    logger.set_name(config.log_file().string());
    if (!logger.open_file(config.log_file())) {
        LOG_ERROR("Unable to open log file: " + config.log_file().string());
        return 3;
    }

    LOG_INFO("MCP Terminal starting");
    LOG_INFO("Default workspace set to: " + config.workspace_root.string());

    // 3. Wire the components; everything below is read-only once serving
    terminal::tools::ExecutorOptions executor_options;
    executor_options.timeout_ms = config.command_timeout_ms;
    const terminal::tools::CommandExecutor executor(config.workspace_root, executor_options);
    const auto registry = terminal::tools::make_builtin_registry(executor);

    terminal::runtime::ServerIdentity identity;
    identity.name = config.server_name;
    identity.version = config.server_version;
    const terminal::runtime::ProtocolLoop loop(registry, identity,
                                               std::chrono::milliseconds(config.keepalive_ms));

    terminal::session::SessionManager sessions;
    terminal::server::ListenOptions listen;
    listen.host = config.host;
    listen.port = config.port;
    terminal::server::HttpServer server(listen, sessions, loop);

    std::signal(SIGPIPE, SIG_IGN);
    auto started = server.start();
    if (errors::is_error(started)) {
        const auto& err = errors::get_error(started);
        LOG_ERROR("Server failed to start [" + err.code + "]: " + err.message);
        return 4;
    }

    // 4. Serve until SIGINT / SIGTERM
    boost::asio::io_context signal_ioc;
    boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        LOG_INFO("Received signal " + std::to_string(signal_number) + ", shutting down");
        server.stop();
    });
    signal_ioc.run();
    server.wait();

    LOG_INFO("MCP Terminal stopped");
    logger.close_file();
    return 0;
}
