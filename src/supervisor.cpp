#include "supervisor.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "util.hpp"
#include "version.hpp"

namespace toolmux {

Supervisor::Supervisor(EventLoop& loop, EventBus& bus, RuntimeConfig runtime)
    : loop_(loop), bus_(bus), runtime_(runtime) {}

Supervisor::~Supervisor() {
    shutdown();
}

namespace {

// Shared with loop callbacks that may outlive start_provider's frame.
struct Handshake {
    bool done = false;
    std::string failure;
    nlohmann::json tools_result;
};

} // namespace

ProviderProcess& Supervisor::start_provider(const ProviderConfig& config) {
    if (find(config.name)) {
        throw ProviderStartError("Provider " + config.name + " is already running");
    }

    auto proc = std::make_unique<ProviderProcess>(config.name, loop_, &bus_);
    SpawnOptions options;
    options.command = config.command;
    options.args = config.args;
    options.env = config.env;
    proc->start(options);

    auto state = std::make_shared<Handshake>();
    ProviderProcess* p = proc.get();
    uint32_t timeout = runtime_.handshake_timeout_ms;

    auto fail = [state](std::exception_ptr err) {
        state->failure = error_message(err);
        state->done = true;
    };

    nlohmann::json init_params = {
        {"protocolVersion", kProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", kServerName}, {"version", kVersion}}}
    };

    p->send_request("initialize", init_params, timeout,
        [state, p, timeout, fail](const nlohmann::json&) {
            p->send_notification("notifications/initialized", nullptr);
            p->send_request("tools/list", nlohmann::json::object(), timeout,
                [state](const nlohmann::json& result) {
                    state->tools_result = result;
                    state->done = true;
                },
                fail);
        },
        fail);

    loop_.run_until([&]() { return state->done || p->exited(); }, timeout);

    std::string failure;
    if (!state->done) {
        if (p->exited()) {
            failure = "exited during handshake (" +
                      describe_wait_status(p->exit_status()) + ")";
        } else if (loop_.stopped()) {
            failure = "interrupted during handshake";
        } else {
            failure = "handshake timed out after " + std::to_string(timeout) + "ms";
        }
    } else if (!state->failure.empty()) {
        failure = state->failure;
    } else if (!state->tools_result.is_object() ||
               !state->tools_result.contains("tools") ||
               !state->tools_result["tools"].is_array()) {
        failure = "tools/list returned no tools array";
    } else if (state->tools_result["tools"].empty()) {
        failure = "provider returned no tools";
    }

    if (!failure.empty()) {
        std::string tail = trim(p->stderr_tail());
        p->stop();
        std::string message = "Provider " + config.name + " failed to start: " + failure;
        if (!tail.empty()) message += " (stderr: " + prefix(tail, 300) + ")";
        throw ProviderStartError(message);
    }

    std::vector<nlohmann::json> tools;
    for (const auto& t : state->tools_result["tools"]) {
        tools.push_back(t);
    }
    p->set_tools(std::move(tools));
    log_info("supervisor", "Provider " + config.name + " ready with " +
             std::to_string(p->tools().size()) + " tool(s)");

    providers_.push_back(std::move(proc));
    return *providers_.back();
}

size_t Supervisor::start_all(const std::vector<ProviderConfig>& configs) {
    size_t started = 0;
    for (const auto& config : configs) {
        if (loop_.stopped()) break;
        try {
            start_provider(config);
            started++;
        } catch (const ProviderStartError& e) {
            log_error("supervisor", e.what());
        }
    }
    log_info("supervisor", "Started " + std::to_string(started) + "/" +
             std::to_string(configs.size()) + " provider(s)");
    return started;
}

void Supervisor::send_request(const std::string& provider, const std::string& method,
                              const nlohmann::json& params, ResultCallback on_result,
                              ErrorHandler on_error) {
    ProviderProcess* p = find(provider);
    if (!p) {
        loop_.post([cb = std::move(on_error), provider]() {
            if (cb) cb(std::make_exception_ptr(RpcError("Unknown provider: " + provider)));
        });
        return;
    }
    p->send_request(method, params, runtime_.request_timeout_ms,
                    std::move(on_result), std::move(on_error));
}

void Supervisor::call_tool(const std::string& provider, const std::string& tool,
                           const nlohmann::json& arguments, ResultCallback on_result,
                           ErrorHandler on_error) {
    nlohmann::json params = {
        {"name", tool},
        {"arguments", arguments.is_null() ? nlohmann::json::object() : arguments}
    };
    send_request(provider, "tools/call", params, std::move(on_result), std::move(on_error));
}

ProviderProcess* Supervisor::find(const std::string& name) const {
    for (const auto& p : providers_) {
        if (p->name() == name) return p.get();
    }
    return nullptr;
}

size_t Supervisor::running_count() const {
    size_t n = 0;
    for (const auto& p : providers_) {
        if (p->running()) n++;
    }
    return n;
}

void Supervisor::shutdown() {
    if (providers_.empty()) return;
    log_info("supervisor", "Stopping " + std::to_string(providers_.size()) +
             " provider(s)");
    for (auto& p : providers_) {
        p->stop();
    }
    providers_.clear();
}

} // namespace toolmux
