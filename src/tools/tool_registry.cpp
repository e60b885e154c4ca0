#include "tools/tool_registry.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace terminal::tools {

using core::errors::ErrorCategory;
using core::errors::TerminalError;
using nlohmann::json;

ToolRegistry::ToolRegistry(std::vector<Tool> tools) {
    for (auto& tool : tools) {
        const std::string name = tool.descriptor.name;
        if (tools_.count(name) != 0) {
            LOG_WARN("ToolRegistry: duplicate tool '" + name + "' ignored");
            continue;
        }
        order_.push_back(name);
        tools_.emplace(name, std::move(tool));
    }
}

std::vector<protocol::ToolDescriptor> ToolRegistry::list() const {
    std::vector<protocol::ToolDescriptor> descriptors;
    descriptors.reserve(order_.size());
    for (const auto& name : order_) {
        descriptors.push_back(tools_.at(name).descriptor);
    }
    return descriptors;
}

bool ToolRegistry::contains(const std::string& name) const {
    return tools_.count(name) != 0;
}

core::errors::Result<std::string> ToolRegistry::invoke(
    const std::string& name, const json& arguments) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) {
        return TerminalError{ErrorCategory::NotFound, "Unknown tool: " + name,
                             "unknown_tool"};
    }

    // A missing argument mapping is the same as an empty one.
    const json normalized = arguments.is_null() ? json::object() : arguments;
    if (!normalized.is_object()) {
        return TerminalError{ErrorCategory::Input,
                             "Arguments for " + name + " must be a JSON object.",
                             "invalid_arguments"};
    }
    return it->second.handler(normalized);
}

ToolRegistry make_builtin_registry(const CommandExecutor& executor) {
    std::vector<Tool> tools;

    Tool run_command;
    run_command.descriptor.name = "run_command";
    run_command.descriptor.description =
        "Execute a shell command inside the configured MCP workspace directory.";
    run_command.descriptor.input_schema = json{
        {"type", "object"},
        {"properties", {{"command", {{"title", "Command"}, {"type", "string"}}}}},
        {"required", json::array({"command"})},
        {"title", "run_commandArguments"}};
    run_command.handler = [&executor](const json& arguments)
        -> core::errors::Result<std::string> {
        auto command = arguments.find("command");
        if (command == arguments.end() || !command->is_string()) {
            return TerminalError{ErrorCategory::Input,
                                 "run_command requires a string 'command' argument.",
                                 "invalid_arguments"};
        }
        return executor.run(command->get<std::string>());
    };
    tools.push_back(std::move(run_command));

    Tool hello_world;
    hello_world.descriptor.name = "hello_world";
    hello_world.descriptor.description = "Return a simple Hello World message.";
    hello_world.descriptor.input_schema = json{{"type", "object"},
                                               {"properties", json::object()},
                                               {"title", "hello_worldArguments"}};
    hello_world.handler = [](const json&) -> core::errors::Result<std::string> {
        LOG_INFO("hello_world tool invoked");
        return std::string("Hello World");
    };
    tools.push_back(std::move(hello_world));

    return ToolRegistry(std::move(tools));
}

}  // namespace terminal::tools
