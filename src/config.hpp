#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolmux {

struct ProviderConfig {
    std::string name;
    std::string command;
    std::vector<std::string> args;             // resolved against the config dir
    std::map<std::string, std::string> env;    // merged into the child environment
};

struct RuntimeConfig {
    uint32_t handshake_timeout_ms = 30000;
    uint32_t request_timeout_ms = 30000;
    uint32_t execute_timeout_ms = 240000;
};

struct HistoryConfig {
    uint32_t max_tool_calls = 10;
    uint32_t max_executions = 3;
    uint32_t token_cap = 60000;
};

struct Config {
    std::vector<ProviderConfig> providers;     // document order
    RuntimeConfig runtime;
    HistoryConfig history;
    std::string log_level = "info";
    std::string source_path;

    // Read, merge with defaults, parse, then apply environment overrides.
    // Throws ConfigError.
    static Config load(const std::string& path);

    // Parse an already-read document. Relative args resolve against base_dir.
    // Throws ConfigError.
    static Config from_json(const nlohmann::ordered_json& document,
                            const std::string& base_dir);

    // Default config JSON (used by load() and tests)
    static nlohmann::ordered_json defaults_json();

    // --config value if given, else $TOOLMUX_CONFIG, else ./.codemode.json
    static std::string resolve_path(const std::string& cli_path);

    // TOOLMUX_LOG_LEVEL, TOOLMUX_REQUEST_TIMEOUT_MS, TOOLMUX_EXECUTE_TIMEOUT_MS
    void apply_env_overrides();

    const ProviderConfig* find_provider(const std::string& name) const;
};

// Resolve a provider argument against dir when it is not a flag or absolute
// path and the resolved path exists; otherwise return it unchanged.
std::string resolve_arg(const std::string& arg, const std::string& dir);

} // namespace toolmux
