#include "dispatcher.hpp"
#include "catalog.hpp"
#include "event_bus.hpp"
#include "history.hpp"
#include "json_rpc.hpp"
#include "log.hpp"
#include "sandbox.hpp"
#include "supervisor.hpp"
#include "util.hpp"
#include "version.hpp"
#include <sstream>

namespace toolmux {

nlohmann::json normalize_tool_result(const nlohmann::json& result) {
    if (result.is_object() && result.contains("content") &&
        result["content"].is_array() && !result["content"].empty()) {
        const auto& first = result["content"][0];
        if (first.is_object() && first.value("type", "") == "text") {
            return result;
        }
    }
    return text_content(result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::string result_text(const nlohmann::json& result) {
    if (result.is_object() && result.contains("content") &&
        result["content"].is_array() && !result["content"].empty()) {
        const auto& first = result["content"][0];
        if (first.is_object() && first.contains("text") && first["text"].is_string()) {
            return first["text"].get<std::string>();
        }
    }
    return result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Dispatcher::Dispatcher(EventBus& bus, Supervisor& supervisor, ToolCatalog& catalog,
                       ExecutionSandbox& sandbox, HistoryLog& history, ReplyFn reply)
    : bus_(bus), supervisor_(supervisor), catalog_(catalog), sandbox_(sandbox),
      history_(history), reply_(std::move(reply)) {
    sandbox_.set_tool_handler([this](const std::string& name, const nlohmann::json& arguments,
                                     ResultCallback on_result, ErrorHandler on_error) {
        handle_bridge_call(name, arguments, std::move(on_result), std::move(on_error));
    });
}

Dispatcher::~Dispatcher() {
    sandbox_.set_tool_handler(nullptr);
}

void Dispatcher::reply_result(const nlohmann::json& id, const nlohmann::json& result) {
    if (reply_) reply_(make_result(id, result));
}

void Dispatcher::reply_error(const nlohmann::json& id, int code, const std::string& message) {
    if (reply_) reply_(make_error(id, code, message));
}

void Dispatcher::reply_tool_error(const nlohmann::json& id, const std::string& message) {
    reply_result(id, text_content(message, true));
}

void Dispatcher::finish_async(const nlohmann::json& id, const nlohmann::json& result) {
    if (in_flight_ > 0) in_flight_--;
    reply_result(id, result);
}

void Dispatcher::handle_line(const std::string& line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        log_warn("dispatcher", std::string("Unparsable request: ") + e.what());
        reply_error(nullptr, rpc_error::InternalError,
                    std::string("Parse error: ") + e.what());
        return;
    }
    handle_message(message);
}

void Dispatcher::handle_message(const nlohmann::json& message) {
    if (!message.is_object()) {
        reply_error(nullptr, rpc_error::InternalError, "Invalid request: expected an object");
        return;
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        if (message.contains("id")) {
            reply_error(message["id"], rpc_error::InternalError,
                        "Invalid request: missing method");
        }
        return;
    }

    std::string method = message["method"].get<std::string>();
    bool is_notification = !message.contains("id");
    nlohmann::json id = is_notification ? nlohmann::json() : message["id"];
    nlohmann::json params = message.value("params", nlohmann::json::object());

    if (is_notification) {
        log_debug("dispatcher", "Notification " + method);
        return;
    }

    try {
        if (method == "initialize") {
            reply_result(id, {
                {"protocolVersion", kProtocolVersion},
                {"capabilities", {{"tools", nlohmann::json::object()}}},
                {"serverInfo", {{"name", kServerName}, {"version", kVersion}}}
            });
        } else if (method == "tools/list") {
            reply_result(id, catalog_.to_json());
        } else if (method == "tools/call") {
            handle_tool_call(id, params);
        } else {
            reply_error(id, rpc_error::MethodNotFound, "Method not found: " + method);
        }
    } catch (const std::exception& e) {
        log_error("dispatcher", "Request " + method + " failed: " + e.what());
        reply_error(id, rpc_error::InternalError, e.what());
    }
}

void Dispatcher::handle_tool_call(const nlohmann::json& id, const nlohmann::json& params) {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        reply_tool_error(id, "Tool name is required");
        return;
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) arguments = nlohmann::json::object();

    if (name == builtin_tools::Execute) {
        call_execute(id, arguments);
        return;
    }
    if (name == builtin_tools::Status) {
        reply_result(id, text_content(status_text()));
        return;
    }
    if (name == builtin_tools::Kill) {
        call_kill(id, arguments);
        return;
    }

    std::string provider, tool;
    if (resolve_provider_tool(name, provider, tool)) {
        call_provider(id, provider, tool, arguments);
        return;
    }
    reply_tool_error(id, "Unknown tool: " + name);
}

bool Dispatcher::resolve_provider_tool(const std::string& name, std::string& provider,
                                       std::string& tool) const {
    if (const ToolDescriptor* d = catalog_.find(name)) {
        provider = d->provider_name;
        tool = d->short_name;
        return true;
    }
    auto parts = split_qualified_name(name);
    if (parts && supervisor_.find(parts->first)) {
        provider = parts->first;
        tool = parts->second;
        return true;
    }
    return false;
}

void Dispatcher::call_execute(const nlohmann::json& id, const nlohmann::json& arguments) {
    ExecutionRequest request;
    try {
        request = sandbox_.parse_request(arguments);
    } catch (const ValidationError& e) {
        reply_tool_error(id, e.what());
        return;
    }

    in_flight_++;
    try {
        sandbox_.execute(request,
            [this, id](const ExecutionResult& result) {
                nlohmann::json payload = text_content(result.output);
                payload["content"].push_back({
                    {"type", "text"},
                    {"text", result.job_id + " (" + result.runtime + ") " +
                             (result.timed_out ? "timed out after " : "completed in ") +
                             format_duration(result.elapsed_ms)}
                });
                finish_async(id, payload);
            },
            [this, id](std::exception_ptr err) {
                finish_async(id, text_content(error_message(err), true));
            });
    } catch (const std::exception& e) {
        if (in_flight_ > 0) in_flight_--;
        log_warn("dispatcher", std::string("execute rejected: ") + e.what());
        reply_tool_error(id, e.what());
    }
}

void Dispatcher::call_kill(const nlohmann::json& id, const nlohmann::json& arguments) {
    if (!arguments.is_object() || !arguments.contains("execId") ||
        !arguments["execId"].is_string()) {
        reply_tool_error(id, "execId is required");
        return;
    }
    std::string exec_id = arguments["execId"].get<std::string>();
    if (!sandbox_.kill(exec_id)) {
        reply_tool_error(id, "No running execution with id " + exec_id);
        return;
    }
    reply_result(id, text_content("Execution " + exec_id + " killed"));
}

void Dispatcher::call_provider(const nlohmann::json& id, const std::string& provider,
                               const std::string& tool, const nlohmann::json& arguments) {
    in_flight_++;
    supervisor_.call_tool(provider, tool, arguments,
        [this, id, provider, tool, arguments](const nlohmann::json& result) {
            nlohmann::json payload = normalize_tool_result(result);
            // Recorded before the response is written.
            publish_tool_call(provider, tool, arguments, payload);
            finish_async(id, payload);
        },
        [this, id, provider, tool](std::exception_ptr err) {
            std::string message = error_message(err);
            log_warn("dispatcher", provider + "_" + tool + " failed: " + message);
            finish_async(id, text_content(message, true));
        });
}

void Dispatcher::handle_bridge_call(const std::string& name, const nlohmann::json& arguments,
                                    ResultCallback on_result, ErrorHandler on_error) {
    if (name == builtin_tools::Execute || name == builtin_tools::Status ||
        name == builtin_tools::Kill) {
        if (on_error) {
            on_error(std::make_exception_ptr(
                ValidationError("Tool " + name + " is not available to executed code")));
        }
        return;
    }
    std::string provider, tool;
    if (!resolve_provider_tool(name, provider, tool)) {
        if (on_error) on_error(std::make_exception_ptr(RpcError("Unknown tool: " + name)));
        return;
    }

    log_debug("dispatcher", "Executed code calls " + provider + "_" + tool);
    supervisor_.call_tool(provider, tool, arguments,
        [this, provider, tool, arguments, on_result](const nlohmann::json& result) {
            nlohmann::json payload = normalize_tool_result(result);
            publish_tool_call(provider, tool, arguments, payload);
            if (on_result) on_result(payload);
        },
        [provider, tool, on_error](std::exception_ptr err) {
            log_warn("dispatcher", provider + "_" + tool + " failed for executed code: " +
                     error_message(err));
            if (on_error) on_error(err);
        });
}

void Dispatcher::publish_tool_call(const std::string& provider, const std::string& tool,
                                   const nlohmann::json& arguments,
                                   const nlohmann::json& payload) {
    ToolCallCompletedEvent ev;
    ev.provider = provider;
    ev.tool = tool;
    ev.arguments = arguments;
    ev.result = result_text(payload);
    bus_.publish(ev);
}

std::string Dispatcher::status_text() const {
    HistoryStatus h = history_.status();
    std::ostringstream out;
    out << "Runtime Status\n"
        << "Providers: " << supervisor_.running_count() << " running / "
        << supervisor_.provider_count() << " started\n"
        << "Tools: " << catalog_.size() << " (" << catalog_.provider_tool_count()
        << " from providers)\n"
        << "History: " << h.tool_calls << " tool calls, " << h.execution_inputs
        << " execution inputs, " << h.execution_outputs << " execution outputs\n"
        << "Estimated Tokens Used: " << h.estimated_tokens << "/" << h.token_cap << "\n";

    out << "\nActive Providers:\n";
    if (supervisor_.providers().empty()) out << "  (none)\n";
    for (const auto& p : supervisor_.providers()) {
        out << "  - " << p->name() << ": " << p->tools().size() << " tools"
            << (p->running() ? "" : " (exited)") << "\n";
    }

    auto jobs = sandbox_.jobs();
    out << "\nRunning Executions:\n";
    if (jobs.empty()) out << "  (none)\n";
    for (const auto& job : jobs) {
        out << "  - " << job.id << " (" << job.runtime << ", pid " << job.pid
            << ", " << format_duration(job.elapsed_ms) << ")\n";
    }
    return out.str();
}

} // namespace toolmux
