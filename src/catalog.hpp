#pragma once
#include "tool.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace toolmux {

class Supervisor;

// The published tool list: execute, then each provider's tools as
// {provider}_{tool} in provider order, then status and kill.
class ToolCatalog {
public:
    ToolCatalog();

    // Rebuild from the supervisor's providers. A qualified name that
    // collides with an earlier entry is skipped and logged.
    void rebuild(const Supervisor& supervisor);

    // Add one provider's tools (before the management tools). Returns the
    // number accepted.
    size_t add_provider_tools(const std::string& provider,
                              const std::vector<nlohmann::json>& tools);

    const ToolDescriptor* find(const std::string& qualified_name) const;

    const std::vector<ToolDescriptor>& tools() const { return tools_; }
    size_t size() const { return tools_.size(); }
    size_t provider_tool_count() const;

    // {"tools": [...]}
    nlohmann::json to_json() const;

private:
    void reset();
    bool insert(ToolDescriptor descriptor);

    std::vector<ToolDescriptor> tools_;
    std::unordered_map<std::string, size_t> index_;
};

// Split a qualified name on its first '_' into (provider, tool).
std::optional<std::pair<std::string, std::string>>
split_qualified_name(const std::string& name);

} // namespace toolmux
