#include <catch2/catch.hpp>
#include "config.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace toolmux;

// ── Defaults ─────────────────────────────────────────────────────

TEST_CASE("Config: default values", "[config]") {
    Config cfg;
    REQUIRE(cfg.runtime.handshake_timeout_ms == 30000);
    REQUIRE(cfg.runtime.request_timeout_ms == 30000);
    REQUIRE(cfg.runtime.execute_timeout_ms == 240000);
    REQUIRE(cfg.history.max_tool_calls == 10);
    REQUIRE(cfg.history.max_executions == 3);
    REQUIRE(cfg.history.token_cap == 60000);
    REQUIRE(cfg.log_level == "info");
}

TEST_CASE("Config::defaults_json: has every section", "[config]") {
    auto j = Config::defaults_json();
    REQUIRE(j.contains("mcpServers"));
    REQUIRE(j["runtime"]["request_timeout_ms"] == 30000);
    REQUIRE(j["history"]["token_cap"] == 60000);
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: providers keep document order", "[config]") {
    auto j = nlohmann::ordered_json::parse(R"({
        "mcpServers": {
            "zeta":  {"command": "z"},
            "alpha": {"command": "a", "args": ["--flag"]},
            "mid":   {"command": "m", "env": {"KEY": "v"}}
        }
    })");
    auto cfg = Config::from_json(j, "");
    REQUIRE(cfg.providers.size() == 3);
    REQUIRE(cfg.providers[0].name == "zeta");
    REQUIRE(cfg.providers[1].name == "alpha");
    REQUIRE(cfg.providers[1].args == std::vector<std::string>{"--flag"});
    REQUIRE(cfg.providers[2].env.at("KEY") == "v");
}

TEST_CASE("Config::from_json: accepts a config wrapper", "[config]") {
    auto j = nlohmann::ordered_json::parse(R"({
        "config": {"mcpServers": {"calc": {"command": "node"}}}
    })");
    auto cfg = Config::from_json(j, "");
    REQUIRE(cfg.providers.size() == 1);
    REQUIRE(cfg.find_provider("calc") != nullptr);
    REQUIRE(cfg.find_provider("other") == nullptr);
}

TEST_CASE("Config::from_json: skips its own entry", "[config]") {
    auto j = nlohmann::ordered_json::parse(R"({
        "mcpServers": {
            "toolmux": {"command": "toolmux"},
            "calc": {"command": "node"}
        }
    })");
    auto cfg = Config::from_json(j, "");
    REQUIRE(cfg.providers.size() == 1);
    REQUIRE(cfg.providers[0].name == "calc");
}

TEST_CASE("Config::from_json: runtime and history sections", "[config]") {
    auto j = nlohmann::ordered_json::parse(R"({
        "mcpServers": {},
        "runtime": {"request_timeout_ms": 500, "execute_timeout_ms": 1000},
        "history": {"max_tool_calls": 4, "token_cap": 100},
        "log_level": "debug"
    })");
    auto cfg = Config::from_json(j, "");
    REQUIRE(cfg.runtime.request_timeout_ms == 500);
    REQUIRE(cfg.runtime.execute_timeout_ms == 1000);
    REQUIRE(cfg.runtime.handshake_timeout_ms == 30000);
    REQUIRE(cfg.history.max_tool_calls == 4);
    REQUIRE(cfg.history.max_executions == 3);
    REQUIRE(cfg.history.token_cap == 100);
    REQUIRE(cfg.log_level == "debug");
}

TEST_CASE("Config::from_json: invalid numbers fall back to defaults", "[config]") {
    auto j = nlohmann::ordered_json::parse(R"({
        "mcpServers": {},
        "runtime": {"request_timeout_ms": -5, "execute_timeout_ms": "soon"}
    })");
    auto cfg = Config::from_json(j, "");
    REQUIRE(cfg.runtime.request_timeout_ms == 30000);
    REQUIRE(cfg.runtime.execute_timeout_ms == 240000);
}

TEST_CASE("Config::from_json: malformed entries throw ConfigError", "[config]") {
    REQUIRE_THROWS_AS(Config::from_json(nlohmann::ordered_json::array(), ""), ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(
        nlohmann::ordered_json::parse(R"({"mcpServers": {"x": {"args": []}}})"), ""),
        ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(
        nlohmann::ordered_json::parse(R"({"mcpServers": {"x": {"command": "c", "args": "a"}}})"), ""),
        ConfigError);
    REQUIRE_THROWS_AS(Config::from_json(
        nlohmann::ordered_json::parse(R"({"mcpServers": []})"), ""),
        ConfigError);
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "toolmux_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: temp dir for config files, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;

    ConfigTestGuard() {
        dir = make_temp_dir();
        unsetenv("TOOLMUX_CONFIG");
        unsetenv("TOOLMUX_LOG_LEVEL");
        unsetenv("TOOLMUX_REQUEST_TIMEOUT_MS");
        unsetenv("TOOLMUX_EXECUTE_TIMEOUT_MS");
    }

    ~ConfigTestGuard() {
        unsetenv("TOOLMUX_CONFIG");
        unsetenv("TOOLMUX_LOG_LEVEL");
        unsetenv("TOOLMUX_REQUEST_TIMEOUT_MS");
        unsetenv("TOOLMUX_EXECUTE_TIMEOUT_MS");
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.codemode.json"; }

    void write_config(const std::string& content) {
        std::ofstream f(config_path());
        f << content;
    }
};

TEST_CASE("Config::load: resolves existing relative args against the config dir", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());
    std::filesystem::create_directories(g.dir + "/servers");
    std::ofstream(g.dir + "/servers/calc.js") << "// server\n";

    g.write_config(R"({
        "mcpServers": {
            "calc": {"command": "node", "args": ["servers/calc.js", "--port", "missing.js", "/abs/x.js"]}
        }
    })");

    auto cfg = Config::load(g.config_path());
    REQUIRE(cfg.source_path == g.config_path());
    const auto& args = cfg.providers.at(0).args;
    REQUIRE(args.size() == 4);
    REQUIRE(std::filesystem::path(args[0]).is_absolute());
    REQUIRE(std::filesystem::exists(args[0]));
    REQUIRE(args[1] == "--port");
    REQUIRE(args[2] == "missing.js");
    REQUIRE(args[3] == "/abs/x.js");
}

TEST_CASE("Config::load: missing file throws ConfigError", "[config]") {
    ConfigTestGuard g;
    REQUIRE_THROWS_AS(Config::load(g.dir + "/nope.json"), ConfigError);
}

TEST_CASE("Config::load: malformed JSON throws ConfigError", "[config]") {
    ConfigTestGuard g;
    g.write_config("{ not json");
    REQUIRE_THROWS_AS(Config::load(g.config_path()), ConfigError);
}

TEST_CASE("Config::load: no providers throws ConfigError", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({"mcpServers": {"toolmux": {"command": "toolmux"}}})");
    REQUIRE_THROWS_AS(Config::load(g.config_path()), ConfigError);
}

TEST_CASE("Config::load: environment overrides the file", "[config]") {
    ConfigTestGuard g;
    g.write_config(R"({
        "mcpServers": {"calc": {"command": "node"}},
        "runtime": {"request_timeout_ms": 1000},
        "log_level": "warn"
    })");
    setenv("TOOLMUX_LOG_LEVEL", "debug", 1);
    setenv("TOOLMUX_REQUEST_TIMEOUT_MS", "250", 1);
    setenv("TOOLMUX_EXECUTE_TIMEOUT_MS", "not-a-number", 1);

    auto cfg = Config::load(g.config_path());
    REQUIRE(cfg.log_level == "debug");
    REQUIRE(cfg.runtime.request_timeout_ms == 250);
    REQUIRE(cfg.runtime.execute_timeout_ms == 240000);
}

// ── Path resolution ─────────────────────────────────────────────

TEST_CASE("Config::resolve_path: flag, then env, then default", "[config]") {
    ConfigTestGuard g;
    REQUIRE(Config::resolve_path("") == ".codemode.json");
    setenv("TOOLMUX_CONFIG", "/etc/toolmux.json", 1);
    REQUIRE(Config::resolve_path("") == "/etc/toolmux.json");
    REQUIRE(Config::resolve_path("/tmp/explicit.json") == "/tmp/explicit.json");
}

TEST_CASE("resolve_arg: leaves flags and absolute paths alone", "[config]") {
    REQUIRE(resolve_arg("-y", "/tmp") == "-y");
    REQUIRE(resolve_arg("/bin/sh", "/tmp") == "/bin/sh");
    REQUIRE(resolve_arg("no-such-file-here.js", "/tmp") == "no-such-file-here.js");
    REQUIRE(resolve_arg("x.js", "") == "x.js");
}
