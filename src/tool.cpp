#include "tool.hpp"

namespace toolmux {

static nlohmann::json empty_object_schema() {
    return {{"type", "object"}, {"properties", nlohmann::json::object()}};
}

nlohmann::json ToolDescriptor::to_json() const {
    return {
        {"name", qualified_name},
        {"description", description},
        {"inputSchema", input_schema}
    };
}

ToolDescriptor ToolDescriptor::from_provider(const std::string& provider,
                                             const nlohmann::json& tool) {
    ToolDescriptor d;
    if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
        return d;
    }
    std::string name = tool["name"].get<std::string>();
    if (name.empty()) return d;

    std::string description;
    if (tool.contains("description") && tool["description"].is_string()) {
        description = tool["description"].get<std::string>();
    }

    d.provider_name = provider;
    d.short_name = name;
    d.qualified_name = provider + "_" + name;
    d.description = "[" + provider + "] " + description;
    if (tool.contains("inputSchema") && tool["inputSchema"].is_object()) {
        d.input_schema = tool["inputSchema"];
    } else {
        d.input_schema = empty_object_schema();
    }
    return d;
}

ToolDescriptor execute_tool_descriptor() {
    ToolDescriptor d;
    d.qualified_name = builtin_tools::Execute;
    d.short_name = builtin_tools::Execute;
    d.description =
        "Execute code in a sandboxed child process. Supports nodejs, typescript, "
        "deno, bun, python, bash, go, rust, c and cpp. The runtime is detected "
        "from the code when not given. Running executions are listed by status "
        "and can be stopped with kill.";
    d.input_schema = {
        {"type", "object"},
        {"properties", {
            {"code", {
                {"type", "string"},
                {"description", "Source code to execute"}
            }},
            {"runtime", {
                {"type", "string"},
                {"description", "Runtime name, or \"auto\" to detect from the code"},
                {"default", "auto"}
            }},
            {"timeout", {
                {"type", "integer"},
                {"description", "Timeout in milliseconds"},
                {"default", 240000}
            }}
        }},
        {"required", nlohmann::json::array({"code"})}
    };
    return d;
}

ToolDescriptor status_tool_descriptor() {
    ToolDescriptor d;
    d.qualified_name = builtin_tools::Status;
    d.short_name = builtin_tools::Status;
    d.description =
        "Show providers, tool counts, history usage and running executions";
    d.input_schema = empty_object_schema();
    return d;
}

ToolDescriptor kill_tool_descriptor() {
    ToolDescriptor d;
    d.qualified_name = builtin_tools::Kill;
    d.short_name = builtin_tools::Kill;
    d.description = "Kill a running execution by its id";
    d.input_schema = {
        {"type", "object"},
        {"properties", {
            {"execId", {
                {"type", "string"},
                {"description", "Execution id as listed by status (exec_<n>)"}
            }}
        }},
        {"required", nlohmann::json::array({"execId"})}
    };
    return d;
}

} // namespace toolmux
