#include "catalog.hpp"
#include "log.hpp"
#include "supervisor.hpp"
#include <algorithm>

namespace toolmux {

ToolCatalog::ToolCatalog() {
    reset();
}

void ToolCatalog::reset() {
    tools_.clear();
    index_.clear();
    insert(execute_tool_descriptor());
    insert(status_tool_descriptor());
    insert(kill_tool_descriptor());
}

bool ToolCatalog::insert(ToolDescriptor descriptor) {
    if (index_.count(descriptor.qualified_name)) return false;

    // Management tools stay last.
    auto pos = tools_.end();
    if (!descriptor.is_builtin() || descriptor.qualified_name == builtin_tools::Execute) {
        pos = std::find_if(tools_.begin(), tools_.end(), [](const ToolDescriptor& d) {
            return d.qualified_name == builtin_tools::Status ||
                   d.qualified_name == builtin_tools::Kill;
        });
    }
    tools_.insert(pos, std::move(descriptor));

    index_.clear();
    for (size_t i = 0; i < tools_.size(); i++) {
        index_[tools_[i].qualified_name] = i;
    }
    return true;
}

size_t ToolCatalog::add_provider_tools(const std::string& provider,
                                       const std::vector<nlohmann::json>& tools) {
    size_t accepted = 0;
    for (const auto& tool : tools) {
        ToolDescriptor d = ToolDescriptor::from_provider(provider, tool);
        if (d.qualified_name.empty()) {
            log_warn("catalog", "Skipping unnamed tool from " + provider);
            continue;
        }
        std::string name = d.qualified_name;
        if (!insert(std::move(d))) {
            log_warn("catalog", "Skipping duplicate tool " + name + " from " + provider);
            continue;
        }
        accepted++;
    }
    return accepted;
}

void ToolCatalog::rebuild(const Supervisor& supervisor) {
    reset();
    for (const auto& p : supervisor.providers()) {
        add_provider_tools(p->name(), p->tools());
    }
    log_info("catalog", std::to_string(tools_.size()) + " tool(s) published");
}

const ToolDescriptor* ToolCatalog::find(const std::string& qualified_name) const {
    auto it = index_.find(qualified_name);
    if (it == index_.end()) return nullptr;
    return &tools_[it->second];
}

size_t ToolCatalog::provider_tool_count() const {
    size_t n = 0;
    for (const auto& t : tools_) {
        if (!t.is_builtin()) n++;
    }
    return n;
}

nlohmann::json ToolCatalog::to_json() const {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& t : tools_) {
        list.push_back(t.to_json());
    }
    return {{"tools", list}};
}

std::optional<std::pair<std::string, std::string>>
split_qualified_name(const std::string& name) {
    auto pos = name.find('_');
    if (pos == std::string::npos || pos == 0 || pos + 1 >= name.size()) {
        return std::nullopt;
    }
    return std::make_pair(name.substr(0, pos), name.substr(pos + 1));
}

} // namespace toolmux
