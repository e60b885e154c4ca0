#pragma once
#include <string>
#include "core/config/server_config.hpp"
#include "core/errors/terminal_errors.hpp"

namespace terminal::app::cli {
    terminal::core::errors::Result<terminal::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
