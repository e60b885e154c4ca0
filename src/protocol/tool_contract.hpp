#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace terminal::protocol {

    // What a remote caller sees when it lists the available tools
    struct ToolDescriptor {
        std::string name;         // e.g., "run_command", "hello_world"
        std::string description;
        nlohmann::json input_schema = nlohmann::json::object();  // JSON Schema of the arguments
    };

    // How a remote caller asks for a tool to run
    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
        std::optional<nlohmann::json> correlation_id;  // echoed back on the response
    };

    inline nlohmann::json to_json(const ToolDescriptor& descriptor) {
        return nlohmann::json{{"name", descriptor.name},
                              {"description", descriptor.description},
                              {"inputSchema", descriptor.input_schema}};
    }

} // namespace terminal::protocol
