#pragma once
#include "errors.hpp"
#include "json_rpc.hpp"
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace toolmux {

class EventBus;
class EventLoop;
class ExecutionSandbox;
class HistoryLog;
class Supervisor;
class ToolCatalog;
struct ExecutionResult;

// Receives every outbound JSON-RPC response.
using ReplyFn = std::function<void(const nlohmann::json& response)>;

// Routes inbound JSON-RPC messages: initialize, tools/list and tools/call.
// Tool failures come back as results with isError; only transport faults
// (bad JSON, unknown method) become JSON-RPC errors.
//
// Also answers tools/call requests from executed code, routed the same way
// as a client's provider-tool call.
class Dispatcher {
public:
    Dispatcher(EventBus& bus, Supervisor& supervisor, ToolCatalog& catalog,
               ExecutionSandbox& sandbox, HistoryLog& history, ReplyFn reply);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // One inbound line. Never throws.
    void handle_line(const std::string& line);
    void handle_message(const nlohmann::json& message);

    // Requests whose response has not been written yet.
    size_t in_flight() const { return in_flight_; }

    // Text of the status tool.
    std::string status_text() const;

private:
    void handle_tool_call(const nlohmann::json& id, const nlohmann::json& params);
    void call_execute(const nlohmann::json& id, const nlohmann::json& arguments);
    void call_kill(const nlohmann::json& id, const nlohmann::json& arguments);
    void call_provider(const nlohmann::json& id, const std::string& provider,
                       const std::string& tool, const nlohmann::json& arguments);
    void handle_bridge_call(const std::string& name, const nlohmann::json& arguments,
                            ResultCallback on_result, ErrorHandler on_error);
    // Catalog entry first, then the provider_ prefix of an uncatalogued name.
    bool resolve_provider_tool(const std::string& name, std::string& provider,
                               std::string& tool) const;
    void publish_tool_call(const std::string& provider, const std::string& tool,
                           const nlohmann::json& arguments, const nlohmann::json& payload);

    void reply_result(const nlohmann::json& id, const nlohmann::json& result);
    void reply_error(const nlohmann::json& id, int code, const std::string& message);
    void reply_tool_error(const nlohmann::json& id, const std::string& message);
    void finish_async(const nlohmann::json& id, const nlohmann::json& result);

    EventBus& bus_;
    Supervisor& supervisor_;
    ToolCatalog& catalog_;
    ExecutionSandbox& sandbox_;
    HistoryLog& history_;
    ReplyFn reply_;
    size_t in_flight_ = 0;
};

// Forward a provider result whose content starts with a text block as-is;
// wrap anything else in a single text block holding its JSON.
nlohmann::json normalize_tool_result(const nlohmann::json& result);

// Text of the first content block, or the result's JSON.
std::string result_text(const nlohmann::json& result);

} // namespace toolmux
