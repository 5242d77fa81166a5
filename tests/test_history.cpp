#include <catch2/catch.hpp>
#include "history.hpp"
#include <string>

using namespace toolmux;

// Every stored value costs a fixed number of tokens.
class FixedEstimator : public TokenEstimator {
public:
    explicit FixedEstimator(uint32_t per_entry) : per_entry_(per_entry) {}
    uint32_t estimate(const nlohmann::json&) const override { return per_entry_; }

private:
    uint32_t per_entry_;
};

class TagSummarizer : public Summarizer {
public:
    std::string summarize(const std::string& text) const override {
        return "summary:" + std::to_string(text.size());
    }
};

// ── Summaries ────────────────────────────────────────────────────

TEST_CASE("HeuristicSummarizer: error-like text", "[history]") {
    HeuristicSummarizer s;
    std::string text = "Error: connection refused " + std::string(600, 'x');
    REQUIRE(s.summarize(text) == "Error message about " + text.substr(0, 50) + "...");
}

TEST_CASE("HeuristicSummarizer: console output", "[history]") {
    HeuristicSummarizer s;
    REQUIRE(s.summarize("console.log(1)\nconsole.log(2)\nx") ==
            "Code execution output with 3 lines");
}

TEST_CASE("HeuristicSummarizer: JSON-like text", "[history]") {
    HeuristicSummarizer s;
    REQUIRE(s.summarize(R"({"a": 1, "b": 2, "c": 3})") == "JSON data structure with 3 fields");
}

TEST_CASE("HeuristicSummarizer: braces that do not parse are generic", "[history]") {
    HeuristicSummarizer s;
    std::string text = "{ not json }";
    REQUIRE(s.summarize(text) == "Text content (12 chars): { not json }...");
}

TEST_CASE("HeuristicSummarizer: generic text", "[history]") {
    HeuristicSummarizer s;
    std::string text(300, 'y');
    REQUIRE(s.summarize(text) == "Text content (300 chars): " + std::string(100, 'y') + "...");
}

// ── Compaction ───────────────────────────────────────────────────

TEST_CASE("HistoryLog::compact: thresholds for bare strings and fields", "[history]") {
    HistoryLog log({}, nullptr, std::make_unique<TagSummarizer>());

    REQUIRE(log.compact(std::string(500, 'a')) == std::string(500, 'a'));
    REQUIRE(log.compact(std::string(501, 'a')) == "summary:501");

    nlohmann::json obj = {{"short", std::string(200, 'b')},
                          {"long", std::string(201, 'b')},
                          {"n", 5}};
    auto compacted = log.compact(obj);
    REQUIRE(compacted["short"] == std::string(200, 'b'));
    REQUIRE(compacted["long"] == "summary:201");
    REQUIRE(compacted["n"] == 5);

    REQUIRE(log.compact(nlohmann::json::array({1, 2})) == nlohmann::json::array({1, 2}));
}

TEST_CASE("HistoryLog::compact: aggressive mode uses the field threshold", "[history]") {
    HistoryLog log({}, nullptr, std::make_unique<TagSummarizer>());
    REQUIRE(log.compact(std::string(300, 'a'), true) == "summary:300");
}

// ── Caps ─────────────────────────────────────────────────────────

TEST_CASE("HistoryLog: 11th tool call evicts the oldest", "[history]") {
    HistoryLog log;
    for (int i = 0; i < 11; i++) {
        log.record_tool_call("calc", "add", {{"i", i}}, std::to_string(i));
    }
    REQUIRE(log.tool_calls().size() == 10);
    REQUIRE(log.tool_calls().front().args["i"] == 1);
    REQUIRE(log.tool_calls().back().args["i"] == 10);
}

TEST_CASE("HistoryLog: 4th execution evicts the oldest pair", "[history]") {
    HistoryLog log;
    for (int i = 0; i < 4; i++) {
        log.record_execution("echo " + std::to_string(i), "bash", true, std::to_string(i));
    }
    REQUIRE(log.execution_inputs().size() == 3);
    REQUIRE(log.execution_outputs().size() == 3);
    REQUIRE(log.execution_inputs().front().code == "echo 1");
    REQUIRE(log.execution_outputs().back().output == "3");
}

TEST_CASE("HistoryLog: execution inputs store compacted code", "[history]") {
    HistoryLog log;
    std::string code = "import sys\n" + std::string(300, 'z');
    log.record_execution(code, "python", false, "Execution failed with code 1: boom");
    REQUIRE(log.execution_inputs().front().code.rfind("Python code (2 lines):", 0) == 0);
    REQUIRE(log.execution_inputs().front().runtime == "python");
    REQUIRE_FALSE(log.execution_outputs().front().success);
}

TEST_CASE("HistoryLog: failed execution output is summarized", "[history]") {
    HistoryLog log;
    for (int i = 0; i < 10; i++) {
        log.record_tool_call("calc", "add", {{"i", i}}, std::to_string(i));
    }
    std::string message = "Execution failed with code 1: " + std::string(300000, 'x');
    log.record_execution("cat big", "bash", false, message);

    std::string stored = log.execution_outputs().front().output.get<std::string>();
    REQUIRE(stored.size() < 200);
    REQUIRE(stored.rfind("Text content (300030 chars): Execution failed with code 1", 0) == 0);
    REQUIRE_FALSE(log.execution_outputs().front().success);
    // Small enough that no cleanup pass ran.
    REQUIRE(log.tool_calls().size() == 10);
    REQUIRE(log.estimated_tokens() < log.limits().token_cap);
}

TEST_CASE("HistoryLog: short failure output is kept verbatim", "[history]") {
    HistoryLog log;
    log.record_execution("exit 1", "bash", false, "Execution failed with code 1: boom");
    REQUIRE(log.execution_outputs().front().output == "Execution failed with code 1: boom");
}

// ── Token accounting ─────────────────────────────────────────────

TEST_CASE("HistoryLog: estimate equals the sum of retained entries", "[history]") {
    HistoryLog log;
    log.record_tool_call("calc", "add", {{"a", 1}}, "3");
    log.record_execution("echo hi", "bash", true, "hi");

    uint32_t sum = 0;
    for (const auto& r : log.tool_calls()) sum += r.tokens;
    for (const auto& r : log.execution_inputs()) sum += r.tokens;
    for (const auto& r : log.execution_outputs()) sum += r.tokens;
    REQUIRE(sum > 0);
    REQUIRE(log.estimated_tokens() == sum);

    LengthTokenEstimator est;
    REQUIRE(log.tool_calls().front().tokens ==
            est.estimate(log.tool_calls().front().to_json()));
}

TEST_CASE("LengthTokenEstimator: ceil of serialized length / 4", "[history]") {
    LengthTokenEstimator est;
    REQUIRE(est.estimate("abc") == 2);          // "\"abc\"" is 5 chars
    REQUIRE(est.estimate(nlohmann::json::object()) == 1);
}

TEST_CASE("HistoryLog: status is a pure read", "[history]") {
    HistoryLog log;
    log.record_tool_call("calc", "add", {{"a", 1}}, "3");
    auto first = log.status();
    auto second = log.status();
    REQUIRE(first == second);
    REQUIRE(first.tool_calls == 1);
    REQUIRE(first.token_cap == 60000);
}

// ── Aggressive cleanup ───────────────────────────────────────────

TEST_CASE("HistoryLog: cleanup halves buffers when over the cap", "[history]") {
    HistoryLimits limits;
    limits.token_cap = 1000;
    HistoryLog log(limits, std::make_unique<FixedEstimator>(60));

    // 3 execution pairs = 360, 10 calls = 600 -> 960, under the cap
    for (int i = 0; i < 3; i++) log.record_execution("echo x", "bash", true, "x");
    for (int i = 0; i < 10; i++) log.record_tool_call("p", "t", {}, "r");
    REQUIRE(log.cleanup_passes() == 0);
    uint32_t before = log.estimated_tokens();
    REQUIRE(before == 960);

    // The 11th call evicts one, which keeps 960. One more pair pushes over.
    log.record_execution("echo y", "bash", true, "y");
    REQUIRE(log.estimated_tokens() == 960);

    HistoryLimits tight = limits;
    tight.token_cap = 900;
    HistoryLog small(tight, std::make_unique<FixedEstimator>(60));
    for (int i = 0; i < 3; i++) small.record_execution("echo x", "bash", true, "x");
    for (int i = 0; i < 10; i++) small.record_tool_call("p", "t", {}, "r");

    // 960 > 900: one pass drops 5 calls and 1 of each execution buffer.
    REQUIRE(small.cleanup_passes() == 1);
    REQUIRE(small.tool_calls().size() == 5);
    REQUIRE(small.execution_inputs().size() == 2);
    REQUIRE(small.execution_outputs().size() == 2);
    REQUIRE(small.estimated_tokens() == 540);
    REQUIRE(small.estimated_tokens() <= before);
}

TEST_CASE("HistoryLog: cleanup keeps a single execution entry", "[history]") {
    HistoryLimits limits;
    limits.token_cap = 100;
    HistoryLog log(limits, std::make_unique<FixedEstimator>(60));
    log.record_execution("echo x", "bash", true, "x");

    // 120 > 100 but nothing can be dropped or shrunk: one pass, then stop.
    REQUIRE(log.execution_inputs().size() == 1);
    REQUIRE(log.execution_outputs().size() == 1);
    REQUIRE(log.cleanup_passes() == 1);
    REQUIRE(log.estimated_tokens() == 120);
}

TEST_CASE("HistoryLog: cleanup pass count is bounded", "[history]") {
    HistoryLimits limits;
    limits.token_cap = 10;
    limits.max_cleanup_passes = 3;
    HistoryLog log(limits, std::make_unique<FixedEstimator>(50));
    for (int i = 0; i < 10; i++) {
        log.record_tool_call("p", "t", {}, "r");
    }
    // Each insertion runs at most three passes.
    REQUIRE(log.cleanup_passes() <= 30);
    REQUIRE(log.tool_calls().size() == 1);
}

TEST_CASE("HistoryLog: cleanup re-compacts what remains", "[history]") {
    HistoryLimits limits;
    limits.token_cap = 100;
    HistoryLog log(limits, nullptr, std::make_unique<TagSummarizer>());

    // 400-char results survive normal compaction (threshold 500) but not
    // the aggressive pass (threshold 200).
    log.record_tool_call("p", "t", {}, std::string(400, 'r'));
    REQUIRE(log.tool_calls().size() == 1);
    REQUIRE(log.tool_calls().front().result == "summary:400");
    REQUIRE(log.estimated_tokens() <= 100);
}

// ── Event subscription ───────────────────────────────────────────

TEST_CASE("HistoryLog: records completions from the bus", "[history]") {
    EventBus bus;
    HistoryLog log;
    log.subscribe(bus);

    ToolCallCompletedEvent call;
    call.provider = "calc";
    call.tool = "add";
    call.arguments = {{"a", 1}, {"b", 2}};
    call.result = "3";
    bus.publish(call);

    ExecutionCompletedEvent exec;
    exec.code = "print(1+1)";
    exec.runtime = "python";
    exec.output = "2";
    exec.success = true;
    bus.publish(exec);

    auto s = log.status();
    REQUIRE(s.tool_calls == 1);
    REQUIRE(s.execution_inputs == 1);
    REQUIRE(s.execution_outputs == 1);
    REQUIRE(log.tool_calls().front().result == "3");
}
