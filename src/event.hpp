#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <sys/types.h>

namespace toolmux {

// Tag-based event dispatch, no RTTI.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* ToolCallCompleted   = "ToolCallCompleted";
    constexpr const char* ExecutionStarted    = "ExecutionStarted";
    constexpr const char* ExecutionOutput     = "ExecutionOutput";
    constexpr const char* ExecutionCompleted  = "ExecutionCompleted";
    constexpr const char* ProviderExited      = "ProviderExited";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// A delegated provider call resolved. Published before the response is written.
struct ToolCallCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::ToolCallCompleted;
    std::string provider;
    std::string tool;
    nlohmann::json arguments;
    nlohmann::json result;

    ToolCallCompletedEvent() { type_tag = TAG; }
};

struct ExecutionStartedEvent : Event {
    static constexpr const char* TAG = event_tags::ExecutionStarted;
    std::string job_id;
    std::string runtime;
    pid_t pid = -1;

    ExecutionStartedEvent() { type_tag = TAG; }
};

// One chunk of live output from an execution child.
struct ExecutionOutputEvent : Event {
    static constexpr const char* TAG = event_tags::ExecutionOutput;
    std::string job_id;
    bool is_stderr = false;
    std::string chunk;

    ExecutionOutputEvent() { type_tag = TAG; }
};

// Success, failure, timeout or kill. `output` is the text returned to the
// caller (the error message on failure).
struct ExecutionCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::ExecutionCompleted;
    std::string job_id;
    std::string code;
    std::string runtime;
    std::string output;
    bool success = false;
    bool timed_out = false;
    uint64_t elapsed_ms = 0;

    ExecutionCompletedEvent() { type_tag = TAG; }
};

struct ProviderExitedEvent : Event {
    static constexpr const char* TAG = event_tags::ProviderExited;
    std::string provider;
    int wait_status = 0;
    size_t pending_requests = 0;

    ProviderExitedEvent() { type_tag = TAG; }
};

} // namespace toolmux
