#include <catch2/catch.hpp>
#include "app.hpp"
#include "test_helpers.hpp"
#include <unistd.h>

using namespace toolmux;
using toolmux_test::fake_provider;
using toolmux_test::have_program;
using nlohmann::json;

namespace {

Config one_provider_config() {
    Config config;
    config.providers.push_back(fake_provider("calc"));
    config.runtime.handshake_timeout_ms = 5000;
    config.runtime.request_timeout_ms = 5000;
    return config;
}

void write_fd(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        REQUIRE(n > 0);
        written += static_cast<size_t>(n);
    }
}

std::vector<json> read_responses(int fd) {
    std::string all;
    char buf[4096];
    ssize_t n;
    while ((n = ::read(fd, buf, sizeof(buf))) > 0) {
        all.append(buf, static_cast<size_t>(n));
    }
    std::vector<json> out;
    for (const auto& line : split(all, '\n')) {
        if (!line.empty()) out.push_back(json::parse(line));
    }
    return out;
}

} // namespace

TEST_CASE("App: serves a session over pipes until input closes", "[app]") {
    App app(one_provider_config());
    app.start();
    REQUIRE(app.catalog().size() == 8);

    int in_pipe[2];
    int out_pipe[2];
    REQUIRE(::pipe(in_pipe) == 0);
    REQUIRE(::pipe(out_pipe) == 0);

    std::string session =
        R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        "\n"
        // last line has no trailing newline
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"calc_add","arguments":{"a":20,"b":22}}})";
    write_fd(in_pipe[1], session);
    ::close(in_pipe[1]);

    int code = app.serve(in_pipe[0], out_pipe[1]);
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    REQUIRE(code == 0);

    auto responses = read_responses(out_pipe[0]);
    ::close(out_pipe[0]);

    REQUIRE(responses.size() == 3);
    REQUIRE(responses[0]["id"] == 1);
    REQUIRE(responses[0]["result"].contains("serverInfo"));
    REQUIRE(responses[1]["id"] == 2);
    REQUIRE(responses[1]["result"]["tools"][0]["name"] == "execute");
    REQUIRE(responses[2]["id"] == 3);
    REQUIRE(responses[2]["result"]["content"][0]["text"] == "42");

    REQUIRE(app.history().tool_calls().size() == 1);
    // serve shut the providers down on the way out
    REQUIRE(app.supervisor().provider_count() == 0);
}

TEST_CASE("App: no startable provider is a ConfigError", "[app]") {
    Config config;
    ProviderConfig ghost;
    ghost.name = "ghost";
    ghost.command = "/nonexistent/toolmux-provider";
    config.providers.push_back(ghost);
    config.providers.push_back(fake_provider("empty", {"--no-tools"}));

    App app(std::move(config));
    REQUIRE_THROWS_AS(app.start(), ConfigError);
}

TEST_CASE("App: history limits come from the configuration", "[app]") {
    HistoryConfig hc;
    hc.max_tool_calls = 4;
    hc.max_executions = 2;
    hc.token_cap = 1234;

    Config config = one_provider_config();
    config.history = hc;
    App app(std::move(config));
    REQUIRE(app.history().limits().max_tool_calls == 4);
    REQUIRE(app.history().limits().max_executions == 2);
    REQUIRE(app.history().limits().token_cap == 1234);
}

TEST_CASE("App: executed code sees the provider tools", "[app]") {
    if (!have_program("bash")) {
        WARN("Skipping: bash not available");
        return;
    }
    App app(one_provider_config());
    app.start();

    std::string output;
    bool done = false;
    ExecutionRequest req;
    req.code = "echo \"$TOOLMUX_TOOLS\"";
    req.runtime = "bash";
    app.sandbox().execute(req,
        [&](const ExecutionResult& r) { output = r.output; done = true; },
        [&](std::exception_ptr) { done = true; });
    REQUIRE(app.loop().run_until([&]() { return done; }, 15000));

    auto tools = json::parse(output);
    REQUIRE(tools.size() == 5);
    REQUIRE(tools[0]["name"] == "calc_add");
    for (const auto& tool : tools) {
        REQUIRE(tool["name"] != "execute");
        REQUIRE(tool["name"] != "status");
        REQUIRE(tool["name"] != "kill");
    }
    REQUIRE(app.sandbox().has_tool_handler());
}
