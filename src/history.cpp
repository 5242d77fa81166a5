#include "history.hpp"
#include "log.hpp"
#include "runtimes.hpp"
#include "util.hpp"

namespace toolmux {

uint32_t LengthTokenEstimator::estimate(const nlohmann::json& value) const {
    return estimate_tokens(
        value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

static bool contains(const std::string& text, const char* needle) {
    return text.find(needle) != std::string::npos;
}

std::string HeuristicSummarizer::summarize(const std::string& text) const {
    if (contains(text, "Error:") || contains(text, "error")) {
        return "Error message about " + prefix(text, 50) + "...";
    }
    if (contains(text, "console.log") || contains(text, "print")) {
        return "Code execution output with " + std::to_string(count_lines(text)) + " lines";
    }
    if (contains(text, "{") && contains(text, "}")) {
        auto parsed = nlohmann::json::parse(text, nullptr, false);
        if (!parsed.is_discarded()) {
            size_t fields = (parsed.is_object() || parsed.is_array()) ? parsed.size() : 0;
            return "JSON data structure with " + std::to_string(fields) + " fields";
        }
    }
    return "Text content (" + std::to_string(text.size()) + " chars): " +
           prefix(text, 100) + "...";
}

nlohmann::json ToolCallRecord::to_json() const {
    return {
        {"provider", provider},
        {"tool", tool},
        {"args", args},
        {"result", result},
        {"timestamp", timestamp}
    };
}

nlohmann::json ExecutionInputRecord::to_json() const {
    return {{"code", code}, {"runtime", runtime}, {"timestamp", timestamp}};
}

nlohmann::json ExecutionOutputRecord::to_json() const {
    return {{"success", success}, {"output", output}, {"timestamp", timestamp}};
}

HistoryLog::HistoryLog(HistoryLimits limits,
                       std::unique_ptr<TokenEstimator> estimator,
                       std::unique_ptr<Summarizer> summarizer)
    : limits_(limits),
      estimator_(estimator ? std::move(estimator)
                           : std::make_unique<LengthTokenEstimator>()),
      summarizer_(summarizer ? std::move(summarizer)
                             : std::make_unique<HeuristicSummarizer>()) {}

nlohmann::json HistoryLog::compact(const nlohmann::json& value, bool aggressive) const {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        size_t threshold = aggressive ? limits_.field_threshold : limits_.value_threshold;
        if (s.size() > threshold) return summarizer_->summarize(s);
        return value;
    }
    if (value.is_object()) {
        nlohmann::json compacted = nlohmann::json::object();
        for (auto& [key, field] : value.items()) {
            if (field.is_string() &&
                field.get_ref<const std::string&>().size() > limits_.field_threshold) {
                compacted[key] = summarizer_->summarize(field.get<std::string>());
            } else {
                compacted[key] = field;
            }
        }
        return compacted;
    }
    return value;
}

void HistoryLog::record_tool_call(const std::string& provider, const std::string& tool,
                                  const nlohmann::json& args,
                                  const nlohmann::json& result) {
    ToolCallRecord rec;
    rec.provider = provider;
    rec.tool = tool;
    rec.args = compact(args);
    rec.result = compact(result);
    rec.timestamp = epoch_millis();
    rec.tokens = estimator_->estimate(rec.to_json());
    tool_calls_.push_back(std::move(rec));

    while (tool_calls_.size() > limits_.max_tool_calls) {
        tool_calls_.pop_front();
    }
    enforce_budget();
}

void HistoryLog::record_execution(const std::string& code, const std::string& runtime,
                                  bool success, const nlohmann::json& output) {
    uint64_t now = epoch_millis();

    ExecutionInputRecord in;
    in.code = compact_code(code);
    in.runtime = runtime;
    in.timestamp = now;
    in.tokens = estimator_->estimate(in.to_json());
    exec_inputs_.push_back(std::move(in));

    ExecutionOutputRecord out;
    out.success = success;
    out.output = compact(output);
    out.timestamp = now;
    out.tokens = estimator_->estimate(out.to_json());
    exec_outputs_.push_back(std::move(out));

    while (exec_inputs_.size() > limits_.max_executions) exec_inputs_.pop_front();
    while (exec_outputs_.size() > limits_.max_executions) exec_outputs_.pop_front();
    enforce_budget();
}

void HistoryLog::recompute() {
    uint32_t total = 0;
    for (const auto& r : tool_calls_) total += r.tokens;
    for (const auto& r : exec_inputs_) total += r.tokens;
    for (const auto& r : exec_outputs_) total += r.tokens;
    estimate_ = total;
}

void HistoryLog::enforce_budget() {
    recompute();
    int passes = 0;
    while (estimate_ > limits_.token_cap && passes < limits_.max_cleanup_passes) {
        passes++;
        cleanup_passes_++;
        if (!aggressive_cleanup()) break;
    }
    if (estimate_ > limits_.token_cap) {
        log_warn("history", "Estimate " + std::to_string(estimate_) +
                 " still above cap " + std::to_string(limits_.token_cap) +
                 " after cleanup");
    }
}

template <typename Buffer>
static size_t drop_oldest_half(Buffer& buffer) {
    size_t n = buffer.size() / 2;
    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
}

// Returns true when the pass removed an entry or lowered the estimate.
bool HistoryLog::aggressive_cleanup() {
    log_warn("history", "Aggressive cleanup: estimate " + std::to_string(estimate_) +
             " exceeds cap " + std::to_string(limits_.token_cap));
    uint32_t before = estimate_;

    size_t removed = drop_oldest_half(tool_calls_);
    if (exec_inputs_.size() > 1) removed += drop_oldest_half(exec_inputs_);
    if (exec_outputs_.size() > 1) removed += drop_oldest_half(exec_outputs_);

    for (auto& r : tool_calls_) {
        r.args = compact(r.args, true);
        r.result = compact(r.result, true);
        r.tokens = estimator_->estimate(r.to_json());
    }
    for (auto& r : exec_inputs_) {
        r.code = compact(r.code, true).get<std::string>();
        r.tokens = estimator_->estimate(r.to_json());
    }
    for (auto& r : exec_outputs_) {
        r.output = compact(r.output, true);
        r.tokens = estimator_->estimate(r.to_json());
    }

    recompute();
    return removed > 0 || estimate_ < before;
}

HistoryStatus HistoryLog::status() const {
    HistoryStatus s;
    s.tool_calls = tool_calls_.size();
    s.execution_inputs = exec_inputs_.size();
    s.execution_outputs = exec_outputs_.size();
    s.estimated_tokens = estimate_;
    s.token_cap = limits_.token_cap;
    return s;
}

void HistoryLog::subscribe(EventBus& bus) {
    subscriptions_.push_back(subscribe_scoped<ToolCallCompletedEvent>(bus,
        [this](const ToolCallCompletedEvent& ev) {
            record_tool_call(ev.provider, ev.tool, ev.arguments, ev.result);
        }));
    subscriptions_.push_back(subscribe_scoped<ExecutionCompletedEvent>(bus,
        [this](const ExecutionCompletedEvent& ev) {
            record_execution(ev.code, ev.runtime, ev.success, ev.output);
        }));
}

} // namespace toolmux
