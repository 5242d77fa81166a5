#pragma once
#include "config.hpp"
#include "provider.hpp"
#include <memory>
#include <string>
#include <vector>

namespace toolmux {

class EventBus;

// Spawns and owns every provider child, in configuration order.
class Supervisor {
public:
    Supervisor(EventLoop& loop, EventBus& bus, RuntimeConfig runtime);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    // Spawn the provider and drive the loop through the handshake
    // (initialize, notifications/initialized, tools/list). Throws
    // ProviderStartError; a failed provider is terminated and not kept.
    ProviderProcess& start_provider(const ProviderConfig& config);

    // Start every configured provider, logging and skipping failures.
    // Returns the number started.
    size_t start_all(const std::vector<ProviderConfig>& configs);

    // Correlated request to a named provider. Errors (unknown provider,
    // write failure, RPC error, timeout) arrive through on_error.
    void send_request(const std::string& provider, const std::string& method,
                      const nlohmann::json& params, ResultCallback on_result,
                      ErrorHandler on_error);

    // tools/call {name, arguments}
    void call_tool(const std::string& provider, const std::string& tool,
                   const nlohmann::json& arguments, ResultCallback on_result,
                   ErrorHandler on_error);

    ProviderProcess* find(const std::string& name) const;
    const std::vector<std::unique_ptr<ProviderProcess>>& providers() const {
        return providers_;
    }
    size_t provider_count() const { return providers_.size(); }
    size_t running_count() const;

    const RuntimeConfig& runtime() const { return runtime_; }

    // Terminate every provider and forget them.
    void shutdown();

private:
    EventLoop& loop_;
    EventBus& bus_;
    RuntimeConfig runtime_;
    std::vector<std::unique_ptr<ProviderProcess>> providers_;
};

} // namespace toolmux
