#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/terminal_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/command_executor.hpp"

namespace terminal::tools {

using ToolHandler =
    std::function<core::errors::Result<std::string>(const nlohmann::json& arguments)>;

struct Tool {
    protocol::ToolDescriptor descriptor;
    ToolHandler handler;
};

// Fixed set of named tools. Everything is supplied to the constructor; there
// is no way to add or remove a tool afterwards, so concurrent readers need no
// locking.
class ToolRegistry {
public:
    explicit ToolRegistry(std::vector<Tool> tools);

    std::vector<protocol::ToolDescriptor> list() const;

    // unknown_tool (NotFound) for a name that is not registered,
    // invalid_arguments (Input) when the arguments are not a JSON object.
    core::errors::Result<std::string> invoke(const std::string& name,
                                             const nlohmann::json& arguments) const;

    bool contains(const std::string& name) const;
    std::size_t size() const { return order_.size(); }

private:
    std::vector<std::string> order_;
    std::unordered_map<std::string, Tool> tools_;
};

// run_command and hello_world, bound to the given executor. The executor
// must outlive the registry.
ToolRegistry make_builtin_registry(const CommandExecutor& executor);

}  // namespace terminal::tools
