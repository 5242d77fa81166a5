#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace toolmux {

// Names of the tools the runtime serves itself.
namespace builtin_tools {
    constexpr const char* Execute = "execute";
    constexpr const char* Status  = "status";
    constexpr const char* Kill    = "kill";
} // namespace builtin_tools

// One entry of the published catalog. Built-ins have an empty provider_name.
struct ToolDescriptor {
    std::string qualified_name;
    std::string provider_name;
    std::string short_name;
    std::string description;
    nlohmann::json input_schema;

    bool is_builtin() const { return provider_name.empty(); }

    // {name, description, inputSchema}
    nlohmann::json to_json() const;

    // Namespace a provider's tool entry as {provider}_{tool}. The result has
    // an empty qualified_name when the entry has no usable name.
    static ToolDescriptor from_provider(const std::string& provider,
                                        const nlohmann::json& tool);
};

ToolDescriptor execute_tool_descriptor();
ToolDescriptor status_tool_descriptor();
ToolDescriptor kill_tool_descriptor();

} // namespace toolmux
