#pragma once
#include "child_process.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "json_rpc.hpp"
#include "runtimes.hpp"
#include "stdin_writer.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolmux {

class EventBus;

struct ExecutionRequest {
    std::string code;
    std::string runtime = "auto";
    uint32_t timeout_ms = 240000;
};

struct ExecutionResult {
    std::string job_id;
    std::string runtime;
    std::string output;          // text returned to the caller
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
    bool timed_out = false;
    uint64_t elapsed_ms = 0;
    std::string source_path;     // already deleted when the result is delivered
};

using ExecutionCallback = std::function<void(const ExecutionResult&)>;

// Answers a tools/call that executed code wrote on its stdout.
using ToolCallHandler = std::function<void(const std::string& name,
                                           const nlohmann::json& arguments,
                                           ResultCallback on_result,
                                           ErrorHandler on_error)>;

struct JobInfo {
    std::string id;
    std::string runtime;
    pid_t pid = -1;
    uint64_t elapsed_ms = 0;
};

// Runs code in a child process from a temp source file. Each job finishes
// exactly once: on_result for exit code 0 or a timeout, on_error with an
// ExecutionError for a nonzero exit, a spawn failure or a kill. The source
// file and any compiled binary are gone before either callback runs.
//
// With a tool handler installed, the child's stdin stays open: a stdout
// line holding a JSON-RPC tools/call request is handed to the handler, kept
// out of the captured output, and answered on the child's stdin.
class ExecutionSandbox {
public:
    explicit ExecutionSandbox(EventLoop& loop, EventBus* bus = nullptr,
                              uint32_t default_timeout_ms = 240000);
    ~ExecutionSandbox();

    ExecutionSandbox(const ExecutionSandbox&) = delete;
    ExecutionSandbox& operator=(const ExecutionSandbox&) = delete;

    void set_tool_handler(ToolCallHandler handler) { tool_handler_ = std::move(handler); }
    bool has_tool_handler() const { return static_cast<bool>(tool_handler_); }

    // Tool list exported to executed code as TOOLMUX_TOOLS.
    void set_exported_tools(nlohmann::json tools) { exported_tools_ = std::move(tools); }

    // Validate execute-tool arguments. Throws ValidationError.
    ExecutionRequest parse_request(const nlohmann::json& arguments) const;

    // Start a job and return its id. Throws ValidationError before anything
    // is written or spawned.
    std::string execute(const ExecutionRequest& request, ExecutionCallback on_result,
                        ErrorHandler on_error);

    // SIGKILL a running job and drop it. False for an unknown id.
    bool kill(const std::string& job_id);

    std::vector<JobInfo> jobs() const;
    size_t running_count() const { return jobs_.size(); }
    // Children spawned over the sandbox's lifetime.
    uint64_t spawn_count() const { return spawn_count_; }
    // tools/call requests received from executed code.
    uint64_t bridge_call_count() const { return bridge_calls_; }

    // Where source files are written (system temp dir by default).
    void set_temp_dir(std::string dir) { temp_dir_ = std::move(dir); }
    const std::string& temp_dir() const { return temp_dir_; }

private:
    using Clock = std::chrono::steady_clock;

    struct Job {
        uint64_t seq = 0;
        std::string id;
        std::string code;
        const RuntimeSpec* runtime = nullptr;
        uint32_t timeout_ms = 0;
        std::string source_path;
        std::string binary_path;
        std::unique_ptr<ChildProcess> child;
        std::unique_ptr<StdinWriter> writer;   // only while tool calls are bridged
        std::string stdout_partial;            // bridged stdout after the last newline
        std::string stdout_text;
        std::string stderr_text;
        EventLoop::TimerId timer = 0;
        bool timed_out = false;
        Clock::time_point started;
        ExecutionCallback on_result;
        ErrorHandler on_error;
    };

    void on_output(uint64_t seq, int fd, bool is_stderr);
    std::string filter_stdout(Job& job, const std::string& chunk, bool dispatch);
    bool handle_bridge_line(Job& job, const std::string& line, bool dispatch);
    void reply_bridge(uint64_t seq, const nlohmann::json& message);
    std::map<std::string, std::string> child_env() const;
    void on_timeout(uint64_t seq);
    void on_exit(uint64_t seq, int status);
    std::unique_ptr<Job> detach(uint64_t seq);
    void publish_completed(const Job& job, const std::string& output, bool success,
                           uint64_t elapsed_ms);
    static void remove_files(const Job& job);

    EventLoop& loop_;
    EventBus* bus_;
    uint32_t default_timeout_ms_;
    std::string temp_dir_;
    std::string working_dir_;
    ToolCallHandler tool_handler_;
    nlohmann::json exported_tools_;
    std::map<uint64_t, std::unique_ptr<Job>> jobs_;
    uint64_t next_seq_ = 0;
    uint64_t spawn_count_ = 0;
    uint64_t bridge_calls_ = 0;
};

} // namespace toolmux
