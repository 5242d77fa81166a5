#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace toolmux {

namespace fs = std::filesystem;

static constexpr const char* kSelfName = "toolmux";

nlohmann::ordered_json Config::defaults_json() {
    return {
        {"mcpServers", nlohmann::ordered_json::object()},
        {"runtime", {
            {"handshake_timeout_ms", 30000},
            {"request_timeout_ms", 30000},
            {"execute_timeout_ms", 240000}
        }},
        {"history", {
            {"max_tool_calls", 10},
            {"max_executions", 3},
            {"token_cap", 60000}
        }},
        {"log_level", "info"}
    };
}

static nlohmann::ordered_json merge_defaults(const nlohmann::ordered_json& existing,
                                             const nlohmann::ordered_json& defaults) {
    nlohmann::ordered_json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

std::string resolve_arg(const std::string& arg, const std::string& dir) {
    if (arg.empty() || arg[0] == '-' || arg[0] == '/' || dir.empty()) return arg;
    std::error_code ec;
    fs::path candidate = fs::path(dir) / arg;
    if (fs::exists(candidate, ec)) {
        return candidate.lexically_normal().string();
    }
    return arg;
}

// Positive integer field or the fallback.
static uint32_t read_positive(const nlohmann::ordered_json& obj, const char* key,
                              uint32_t fallback) {
    if (!obj.contains(key)) return fallback;
    const auto& v = obj[key];
    if (v.is_number_unsigned() && v.get<uint64_t>() > 0 &&
        v.get<uint64_t>() <= UINT32_MAX) {
        return v.get<uint32_t>();
    }
    log_warn("config", std::string("Ignoring invalid value for ") + key);
    return fallback;
}

static ProviderConfig parse_provider(const std::string& name,
                                     const nlohmann::ordered_json& entry,
                                     const std::string& base_dir) {
    if (!entry.is_object()) {
        throw ConfigError("Provider '" + name + "' must be an object");
    }
    if (!entry.contains("command") || !entry["command"].is_string() ||
        entry["command"].get<std::string>().empty()) {
        throw ConfigError("Provider '" + name + "' has no command");
    }

    ProviderConfig pc;
    pc.name = name;
    pc.command = entry["command"].get<std::string>();

    if (entry.contains("args")) {
        if (!entry["args"].is_array()) {
            throw ConfigError("Provider '" + name + "': args must be an array");
        }
        for (const auto& a : entry["args"]) {
            if (!a.is_string()) {
                throw ConfigError("Provider '" + name + "': args must be strings");
            }
            pc.args.push_back(resolve_arg(a.get<std::string>(), base_dir));
        }
    }

    if (entry.contains("env")) {
        if (!entry["env"].is_object()) {
            throw ConfigError("Provider '" + name + "': env must be an object");
        }
        for (auto& [key, value] : entry["env"].items()) {
            if (!value.is_string()) {
                throw ConfigError("Provider '" + name + "': env." + key + " must be a string");
            }
            pc.env[key] = value.get<std::string>();
        }
    }
    return pc;
}

Config Config::from_json(const nlohmann::ordered_json& document,
                         const std::string& base_dir) {
    if (!document.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    // {"config": {...}} wrapping is accepted as well
    const nlohmann::ordered_json* root = &document;
    if (!document.contains("mcpServers") && document.contains("config") &&
        document["config"].is_object()) {
        root = &document["config"];
    }
    nlohmann::ordered_json j = merge_defaults(*root, defaults_json());

    Config cfg;
    if (!j["mcpServers"].is_object()) {
        throw ConfigError("mcpServers must be an object");
    }
    for (auto& [name, entry] : j["mcpServers"].items()) {
        if (name == kSelfName) continue;
        cfg.providers.push_back(parse_provider(name, entry, base_dir));
    }

    if (j["runtime"].is_object()) {
        const auto& r = j["runtime"];
        cfg.runtime.handshake_timeout_ms =
            read_positive(r, "handshake_timeout_ms", cfg.runtime.handshake_timeout_ms);
        cfg.runtime.request_timeout_ms =
            read_positive(r, "request_timeout_ms", cfg.runtime.request_timeout_ms);
        cfg.runtime.execute_timeout_ms =
            read_positive(r, "execute_timeout_ms", cfg.runtime.execute_timeout_ms);
    }

    if (j["history"].is_object()) {
        const auto& h = j["history"];
        cfg.history.max_tool_calls =
            read_positive(h, "max_tool_calls", cfg.history.max_tool_calls);
        cfg.history.max_executions =
            read_positive(h, "max_executions", cfg.history.max_executions);
        cfg.history.token_cap = read_positive(h, "token_cap", cfg.history.token_cap);
    }

    if (j["log_level"].is_string()) {
        cfg.log_level = j["log_level"].get<std::string>();
    }
    return cfg;
}

Config Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Configuration file not found: " + path);
    }

    nlohmann::ordered_json document;
    try {
        document = nlohmann::ordered_json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Malformed configuration " + path + ": " + e.what());
    }

    std::error_code ec;
    fs::path abs = fs::absolute(path, ec);
    std::string base_dir = ec ? std::string() : abs.parent_path().string();

    Config cfg = from_json(document, base_dir);
    cfg.source_path = path;
    cfg.apply_env_overrides();

    if (cfg.providers.empty()) {
        throw ConfigError("No providers configured in " + path);
    }
    return cfg;
}

std::string Config::resolve_path(const std::string& cli_path) {
    if (!cli_path.empty()) return expand_home(cli_path);
    if (const char* v = std::getenv("TOOLMUX_CONFIG")) {
        if (*v) return expand_home(v);
    }
    return ".codemode.json";
}

static void override_timeout(const char* var, uint32_t& target) {
    const char* v = std::getenv(var);
    if (!v) return;
    try {
        unsigned long n = std::stoul(v);
        if (n > 0 && n <= UINT32_MAX) {
            target = static_cast<uint32_t>(n);
            return;
        }
    } catch (const std::exception&) {
        // fall through to the warning
    }
    log_warn("config", std::string("Ignoring invalid ") + var + "=" + v);
}

void Config::apply_env_overrides() {
    // Environment variables always override config file
    if (const char* v = std::getenv("TOOLMUX_LOG_LEVEL")) {
        if (*v) log_level = v;
    }
    override_timeout("TOOLMUX_REQUEST_TIMEOUT_MS", runtime.request_timeout_ms);
    override_timeout("TOOLMUX_EXECUTE_TIMEOUT_MS", runtime.execute_timeout_ms);
}

const ProviderConfig* Config::find_provider(const std::string& name) const {
    for (const auto& p : providers) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

} // namespace toolmux
