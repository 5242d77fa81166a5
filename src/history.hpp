#pragma once
#include "event_bus.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolmux {

// Approximate token cost of a stored value.
class TokenEstimator {
public:
    virtual ~TokenEstimator() = default;
    virtual uint32_t estimate(const nlohmann::json& value) const = 0;
};

// ceil(serialized length / 4)
class LengthTokenEstimator : public TokenEstimator {
public:
    uint32_t estimate(const nlohmann::json& value) const override;
};

// Replaces an oversized string with a short description.
class Summarizer {
public:
    virtual ~Summarizer() = default;
    virtual std::string summarize(const std::string& text) const = 0;
};

// Error-like, console-output-like, JSON-like, else generic.
class HeuristicSummarizer : public Summarizer {
public:
    std::string summarize(const std::string& text) const override;
};

struct HistoryLimits {
    size_t max_tool_calls = 10;
    size_t max_executions = 3;
    uint32_t token_cap = 60000;
    size_t value_threshold = 500;   // bare string argument or result
    size_t field_threshold = 200;   // string field inside an object
    int max_cleanup_passes = 8;
};

struct ToolCallRecord {
    std::string provider;
    std::string tool;
    nlohmann::json args;
    nlohmann::json result;
    uint64_t timestamp = 0;
    uint32_t tokens = 0;

    nlohmann::json to_json() const;
};

struct ExecutionInputRecord {
    std::string code;           // compacted
    std::string runtime;
    uint64_t timestamp = 0;
    uint32_t tokens = 0;

    nlohmann::json to_json() const;
};

struct ExecutionOutputRecord {
    bool success = false;
    nlohmann::json output;      // result on success, error text otherwise
    uint64_t timestamp = 0;
    uint32_t tokens = 0;

    nlohmann::json to_json() const;
};

struct HistoryStatus {
    size_t tool_calls = 0;
    size_t execution_inputs = 0;
    size_t execution_outputs = 0;
    uint32_t estimated_tokens = 0;
    uint32_t token_cap = 0;

    bool operator==(const HistoryStatus& other) const {
        return tool_calls == other.tool_calls &&
               execution_inputs == other.execution_inputs &&
               execution_outputs == other.execution_outputs &&
               estimated_tokens == other.estimated_tokens &&
               token_cap == other.token_cap;
    }
    bool operator!=(const HistoryStatus& other) const { return !(*this == other); }
};

// Bounded record of completed tool calls and executions. Every mutation
// recomputes the running estimate, evicting and compacting until it is back
// under the cap or no pass makes progress.
class HistoryLog {
public:
    explicit HistoryLog(HistoryLimits limits = {},
                        std::unique_ptr<TokenEstimator> estimator = nullptr,
                        std::unique_ptr<Summarizer> summarizer = nullptr);

    void record_tool_call(const std::string& provider, const std::string& tool,
                          const nlohmann::json& args, const nlohmann::json& result);

    void record_execution(const std::string& code, const std::string& runtime,
                          bool success, const nlohmann::json& output);

    // Replace oversized strings with summaries. Aggressive compaction uses
    // the field threshold for bare strings too.
    nlohmann::json compact(const nlohmann::json& value, bool aggressive = false) const;

    // Pure read.
    HistoryStatus status() const;

    // Record completions published on the bus. The bus must outlive this log.
    void subscribe(EventBus& bus);

    const std::deque<ToolCallRecord>& tool_calls() const { return tool_calls_; }
    const std::deque<ExecutionInputRecord>& execution_inputs() const { return exec_inputs_; }
    const std::deque<ExecutionOutputRecord>& execution_outputs() const { return exec_outputs_; }
    uint32_t estimated_tokens() const { return estimate_; }
    const HistoryLimits& limits() const { return limits_; }
    // Aggressive cleanup passes run so far.
    uint64_t cleanup_passes() const { return cleanup_passes_; }

private:
    void enforce_budget();
    bool aggressive_cleanup();
    void recompute();

    HistoryLimits limits_;
    std::unique_ptr<TokenEstimator> estimator_;
    std::unique_ptr<Summarizer> summarizer_;
    std::deque<ToolCallRecord> tool_calls_;
    std::deque<ExecutionInputRecord> exec_inputs_;
    std::deque<ExecutionOutputRecord> exec_outputs_;
    uint32_t estimate_ = 0;
    uint64_t cleanup_passes_ = 0;
    std::vector<Subscription> subscriptions_;
};

} // namespace toolmux
