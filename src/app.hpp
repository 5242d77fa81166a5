#pragma once
#include "catalog.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "event_bus.hpp"
#include "event_loop.hpp"
#include "history.hpp"
#include "sandbox.hpp"
#include "supervisor.hpp"
#include <unistd.h>

namespace toolmux {

// Everything one server run needs, built once from the configuration.
// Members are declared in dependency order.
class App {
public:
    explicit App(Config config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    // Start every provider and publish the catalog. Throws ConfigError when
    // no provider could be started.
    void start();

    // Serve newline-delimited JSON-RPC from in_fd to out_fd until input
    // reaches EOF (and in-flight requests finish) or the loop is stopped.
    // Returns the process exit code.
    int serve(int in_fd = STDIN_FILENO, int out_fd = STDOUT_FILENO);

    // Terminate providers and running executions.
    void shutdown();

    const Config& config() const { return config_; }
    EventLoop& loop() { return loop_; }
    EventBus& bus() { return bus_; }
    HistoryLog& history() { return history_; }
    Supervisor& supervisor() { return supervisor_; }
    ToolCatalog& catalog() { return catalog_; }
    ExecutionSandbox& sandbox() { return sandbox_; }
    Dispatcher& dispatcher() { return dispatcher_; }

private:
    void write_response(const nlohmann::json& response);
    void on_input(int fd);

    Config config_;
    EventLoop loop_;
    EventBus bus_;
    HistoryLog history_;
    Supervisor supervisor_;
    ToolCatalog catalog_;
    ExecutionSandbox sandbox_;
    Dispatcher dispatcher_;

    LineBuffer input_;
    int out_fd_ = STDOUT_FILENO;
    bool input_closed_ = false;
    bool output_failed_ = false;
};

HistoryLimits history_limits(const HistoryConfig& config);

} // namespace toolmux
