#pragma once
#include "child_process.hpp"
#include "errors.hpp"
#include "event_loop.hpp"
#include "json_rpc.hpp"
#include "stdin_writer.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolmux {

class EventBus;

// One provider child speaking newline-delimited JSON-RPC over its stdio.
// Owns the per-provider correlation table: every request gets the next id,
// and exactly one of result, error or timeout finalizes it.
class ProviderProcess {
public:
    ProviderProcess(std::string name, EventLoop& loop, EventBus* bus = nullptr);
    ~ProviderProcess();

    ProviderProcess(const ProviderProcess&) = delete;
    ProviderProcess& operator=(const ProviderProcess&) = delete;

    // Spawn the child and register its readers. Throws ProviderStartError.
    void start(const SpawnOptions& options);

    // Queue a request and register it as pending. Returns the id used.
    // A request still unsent when it times out is dropped from the queue.
    // Write failures are reported through on_error from the loop.
    uint64_t send_request(const std::string& method, const nlohmann::json& params,
                          uint32_t timeout_ms, ResultCallback on_result,
                          ErrorHandler on_error);

    bool send_notification(const std::string& method, const nlohmann::json& params);

    // Process one line from the child's stdout.
    void handle_line(const std::string& line);

    // Terminate the child and reject whatever is still pending.
    void stop(int grace_ms = 500);

    const std::string& name() const { return name_; }
    bool running() const { return child_ && !exited_ && !stopped_; }
    bool exited() const { return exited_; }
    int exit_status() const { return exit_status_; }
    pid_t pid() const { return child_ ? child_->pid() : -1; }

    size_t pending_count() const { return pending_.size(); }
    // Bytes waiting for the child to read its stdin.
    size_t queued_bytes() const { return writer_ ? writer_->queued_bytes() : 0; }
    uint64_t next_id() const { return next_id_; }

    const std::vector<nlohmann::json>& tools() const { return tools_; }
    void set_tools(std::vector<nlohmann::json> tools) { tools_ = std::move(tools); }

    // Last few hundred bytes the child wrote to stderr.
    const std::string& stderr_tail() const { return stderr_tail_; }

private:
    struct PendingRequest {
        std::string method;
        ResultCallback on_result;
        ErrorHandler on_error;
        EventLoop::TimerId timer = 0;
    };

    void on_stdout(int fd);
    void on_stderr(int fd);
    void on_exit(int status);
    void on_timeout(uint64_t id, uint32_t timeout_ms);
    void on_write_failure(const std::vector<uint64_t>& ids);
    void detach_from_loop();
    void fail_later(ErrorHandler on_error, std::exception_ptr err);

    std::string name_;
    EventLoop& loop_;
    EventBus* bus_;
    std::unique_ptr<ChildProcess> child_;
    std::unique_ptr<StdinWriter> writer_;
    LineBuffer stdout_buffer_;
    LineBuffer stderr_buffer_;
    std::string stderr_tail_;
    std::unordered_map<uint64_t, PendingRequest> pending_;
    std::vector<nlohmann::json> tools_;
    uint64_t next_id_ = 0;
    bool exited_ = false;
    bool stopped_ = false;
    int exit_status_ = 0;
};

} // namespace toolmux
