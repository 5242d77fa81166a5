#include "sandbox.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "util.hpp"
#include <filesystem>
#include <fstream>

namespace toolmux {

namespace fs = std::filesystem;

namespace {

// Larger tool lists are exported as bare names.
constexpr size_t kMaxExportedTools = 100000;

} // namespace

ExecutionSandbox::ExecutionSandbox(EventLoop& loop, EventBus* bus,
                                   uint32_t default_timeout_ms)
    : loop_(loop), bus_(bus), default_timeout_ms_(default_timeout_ms) {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    temp_dir_ = ec ? "/tmp" : tmp.string();
    fs::path cwd = fs::current_path(ec);
    working_dir_ = ec ? "" : cwd.string();
}

ExecutionSandbox::~ExecutionSandbox() {
    while (!jobs_.empty()) {
        auto job = detach(jobs_.begin()->first);
        job->child.reset(); // SIGKILL and reap
        remove_files(*job);
    }
}

ExecutionRequest ExecutionSandbox::parse_request(const nlohmann::json& arguments) const {
    if (!arguments.is_object()) {
        throw ValidationError("execute arguments must be an object");
    }
    for (auto& [key, value] : arguments.items()) {
        if (key != "code" && key != "runtime" && key != "timeout") {
            throw ValidationError("Unknown argument: " + key);
        }
    }

    ExecutionRequest req;
    req.timeout_ms = default_timeout_ms_;

    if (!arguments.contains("code") || !arguments["code"].is_string() ||
        trim(arguments["code"].get<std::string>()).empty()) {
        throw ValidationError("Code is required for execution");
    }
    req.code = arguments["code"].get<std::string>();

    if (arguments.contains("runtime")) {
        if (!arguments["runtime"].is_string()) {
            throw ValidationError("runtime must be a string");
        }
        req.runtime = arguments["runtime"].get<std::string>();
    }

    if (arguments.contains("timeout")) {
        const auto& t = arguments["timeout"];
        if (!t.is_number_integer() || t.get<int64_t>() <= 0 ||
            t.get<int64_t>() > static_cast<int64_t>(UINT32_MAX)) {
            throw ValidationError("timeout must be a positive integer (milliseconds)");
        }
        req.timeout_ms = static_cast<uint32_t>(t.get<int64_t>());
    }
    return req;
}

std::string ExecutionSandbox::execute(const ExecutionRequest& request,
                                      ExecutionCallback on_result,
                                      ErrorHandler on_error) {
    if (trim(request.code).empty()) {
        throw ValidationError("Code is required for execution");
    }
    if (request.timeout_ms == 0) {
        throw ValidationError("timeout must be a positive integer (milliseconds)");
    }
    if (request.code.find("pkill") != std::string::npos) {
        throw ValidationError("Execution rejected: pkill command is not allowed");
    }
    const RuntimeSpec* runtime = nullptr;
    if (request.runtime.empty() || request.runtime == "auto") {
        runtime = &detect_runtime(request.code);
    } else {
        runtime = find_runtime(request.runtime);
        if (!runtime) {
            throw ValidationError("Unknown runtime: " + request.runtime +
                                  " (expected auto, " + runtime_names() + ")");
        }
    }

    auto job = std::make_unique<Job>();
    job->seq = next_seq_++;
    job->id = "exec_" + std::to_string(job->seq);
    job->code = request.code;
    job->runtime = runtime;
    job->timeout_ms = request.timeout_ms;
    job->source_path = (fs::path(temp_dir_) /
                        ("toolmux-" + generate_id() + runtime->extension)).string();
    job->started = Clock::now();

    log_info("sandbox", "Starting " + job->id + " (" + runtime->name + ")");

    try {
        std::ofstream out(job->source_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ExecutionError("Cannot write source file " + job->source_path);
        }
        out << request.code;
        out.close();
        if (out.fail()) {
            throw ExecutionError("Cannot write source file " + job->source_path);
        }

        Invocation inv = build_invocation(*runtime, job->source_path);
        job->binary_path = inv.binary_path;

        SpawnOptions options;
        options.command = inv.command;
        options.args = inv.args;
        options.env = child_env();
        job->child = ChildProcess::spawn(options);
    } catch (const std::runtime_error& e) {
        remove_files(*job);
        std::string message = "Failed to start " + job->id + ": " + e.what();
        log_error("sandbox", message);
        publish_completed(*job, message, false, 0);
        loop_.post([cb = std::move(on_error), message]() {
            if (cb) cb(std::make_exception_ptr(ExecutionError(message)));
        });
        return job->id;
    }

    spawn_count_++;
    if (tool_handler_) {
        job->writer = std::make_unique<StdinWriter>(loop_, *job->child);
    } else {
        job->child->close_stdin();
    }
    job->on_result = std::move(on_result);
    job->on_error = std::move(on_error);

    uint64_t seq = job->seq;
    loop_.add_reader(job->child->stdout_fd(), [this, seq](int fd) {
        on_output(seq, fd, false);
    });
    loop_.add_reader(job->child->stderr_fd(), [this, seq](int fd) {
        on_output(seq, fd, true);
    });
    loop_.watch_child(job->child->pid(), [this, seq](int status) {
        on_exit(seq, status);
    });
    job->timer = loop_.add_timer(job->timeout_ms, [this, seq]() { on_timeout(seq); });

    if (bus_) {
        ExecutionStartedEvent ev;
        ev.job_id = job->id;
        ev.runtime = runtime->name;
        ev.pid = job->child->pid();
        bus_->publish(ev);
    }

    std::string id = job->id;
    jobs_.emplace(seq, std::move(job));
    return id;
}

void ExecutionSandbox::on_output(uint64_t seq, int fd, bool is_stderr) {
    auto it = jobs_.find(seq);
    if (it == jobs_.end()) {
        loop_.remove_reader(fd);
        return;
    }
    Job& job = *it->second;

    std::string chunk;
    ReadStatus status = drain_fd(fd, chunk);
    if (!is_stderr && job.writer) {
        chunk = filter_stdout(job, chunk, true);
    }
    if (!chunk.empty()) {
        (is_stderr ? job.stderr_text : job.stdout_text) += chunk;
        log_debug(job.id, trim(chunk));
        if (bus_) {
            ExecutionOutputEvent ev;
            ev.job_id = job.id;
            ev.is_stderr = is_stderr;
            ev.chunk = chunk;
            bus_->publish(ev);
        }
    }
    if (status == ReadStatus::Closed) {
        loop_.remove_reader(fd);
    }
}

std::string ExecutionSandbox::filter_stdout(Job& job, const std::string& chunk,
                                            bool dispatch) {
    job.stdout_partial += chunk;
    std::string visible;
    size_t start = 0;
    size_t nl;
    while ((nl = job.stdout_partial.find('\n', start)) != std::string::npos) {
        std::string line = job.stdout_partial.substr(start, nl - start);
        start = nl + 1;
        if (!handle_bridge_line(job, line, dispatch)) {
            visible += line;
            visible += '\n';
        }
    }
    job.stdout_partial.erase(0, start);
    if (job.stdout_partial.size() > LineBuffer::kDefaultMaxLine) {
        visible += job.stdout_partial;
        job.stdout_partial.clear();
    }
    return visible;
}

bool ExecutionSandbox::handle_bridge_line(Job& job, const std::string& line, bool dispatch) {
    std::string body = trim(line);
    if (body.empty() || body[0] != '{' || body.find("tools/call") == std::string::npos) {
        return false;
    }
    auto msg = nlohmann::json::parse(body, nullptr, false);
    if (!msg.is_object() || !msg.contains("id") ||
        msg["jsonrpc"] != "2.0" || msg["method"] != "tools/call") {
        return false;
    }

    if (!dispatch) {
        log_debug(job.id, "Dropping tool call from finished job");
        return true;
    }

    bridge_calls_++;
    uint64_t seq = job.seq;
    nlohmann::json id = msg["id"];
    const nlohmann::json params = msg.value("params", nlohmann::json::object());
    if (!tool_handler_) {
        reply_bridge(seq, make_error(id, rpc_error::InternalError,
                                     "Tool calls are not available"));
        return true;
    }
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        reply_bridge(seq, make_error(id, rpc_error::InternalError, "Tool name is required"));
        return true;
    }
    std::string name = params["name"].get<std::string>();
    nlohmann::json arguments = params.value("arguments", nlohmann::json::object());
    log_debug(job.id, "Tool call " + name);

    tool_handler_(name, arguments,
        [this, seq, id](const nlohmann::json& result) {
            reply_bridge(seq, make_result(id, result));
        },
        [this, seq, id](std::exception_ptr err) {
            reply_bridge(seq, make_error(id, rpc_error::InternalError, error_message(err)));
        });
    return true;
}

void ExecutionSandbox::reply_bridge(uint64_t seq, const nlohmann::json& message) {
    auto it = jobs_.find(seq);
    if (it == jobs_.end() || !it->second->writer) {
        log_debug("sandbox", "Tool call reply for finished exec_" + std::to_string(seq) +
                  " dropped");
        return;
    }
    Job& job = *it->second;
    if (!job.writer->send(StdinWriter::kUntagged, frame(message))) {
        log_debug(job.id, "Tool call reply not delivered, stdin closed");
    }
}

std::map<std::string, std::string> ExecutionSandbox::child_env() const {
    std::map<std::string, std::string> env;
    if (!working_dir_.empty()) env["TOOLMUX_WORKING_DIRECTORY"] = working_dir_;
    if (exported_tools_.is_array()) {
        std::string dump = exported_tools_.dump(-1, ' ', false,
                                                nlohmann::json::error_handler_t::replace);
        if (dump.size() > kMaxExportedTools) {
            nlohmann::json names = nlohmann::json::array();
            for (const auto& tool : exported_tools_) {
                if (tool.contains("name")) names.push_back(tool["name"]);
            }
            log_warn("sandbox", "Tool list too large for the environment (" +
                     std::to_string(dump.size()) + " bytes), exporting names only");
            dump = names.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        }
        env["TOOLMUX_TOOLS"] = dump;
    }
    return env;
}

void ExecutionSandbox::on_timeout(uint64_t seq) {
    auto it = jobs_.find(seq);
    if (it == jobs_.end()) return;
    Job& job = *it->second;
    job.timer = 0;
    job.timed_out = true;
    log_warn("sandbox", job.id + " timed out after " +
             std::to_string(job.timeout_ms) + "ms, killing");
    // The exit watcher finishes the job.
    job.child->kill();
}

std::unique_ptr<ExecutionSandbox::Job> ExecutionSandbox::detach(uint64_t seq) {
    auto it = jobs_.find(seq);
    if (it == jobs_.end()) return nullptr;
    std::unique_ptr<Job> job = std::move(it->second);
    jobs_.erase(it);
    bool bridged = job->writer != nullptr;

    if (job->timer) loop_.cancel_timer(job->timer);
    job->timer = 0;
    job->writer.reset();

    // Collect whatever is still buffered in the pipes.
    int out_fd = job->child->stdout_fd();
    int err_fd = job->child->stderr_fd();
    if (loop_.has_reader(out_fd)) {
        std::string rest;
        drain_fd(out_fd, rest);
        loop_.remove_reader(out_fd);
        job->stdout_text += bridged ? filter_stdout(*job, rest, false) : rest;
    }
    job->stdout_text += job->stdout_partial;
    job->stdout_partial.clear();
    if (loop_.has_reader(err_fd)) {
        drain_fd(err_fd, job->stderr_text);
        loop_.remove_reader(err_fd);
    }
    loop_.unwatch_child(job->child->pid());
    return job;
}

void ExecutionSandbox::on_exit(uint64_t seq, int status) {
    std::unique_ptr<Job> job = detach(seq);
    if (!job) return;
    job->child->mark_exited(status);
    remove_files(*job);

    uint64_t elapsed_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - job->started).count());

    ExecutionResult result;
    result.job_id = job->id;
    result.runtime = job->runtime->name;
    result.stdout_text = job->stdout_text;
    result.stderr_text = job->stderr_text;
    result.exit_code = job->child->exit_code();
    result.timed_out = job->timed_out;
    result.elapsed_ms = elapsed_ms;
    result.source_path = job->source_path;

    std::string out = trim(job->stdout_text);
    std::string err = trim(job->stderr_text);

    if (job->timed_out) {
        std::string partial = out;
        if (!err.empty()) {
            partial += (partial.empty() ? "" : "\n") + std::string("STDERR:\n") + err;
        }
        result.output = (partial.empty() ? std::string() : partial + "\n") +
                        "[Execution timed out after " + std::to_string(job->timeout_ms) +
                        "ms]";
        log_info("sandbox", job->id + " timed out after " + format_duration(elapsed_ms));
        publish_completed(*job, result.output, false, elapsed_ms);
        if (job->on_result) job->on_result(result);
        return;
    }

    if (result.exit_code == 0) {
        if (!out.empty()) {
            result.output = out;
        } else if (!err.empty()) {
            result.output = "Warning: " + err;
        } else {
            result.output = "Execution completed successfully";
        }
        log_info("sandbox", job->id + " finished in " + format_duration(elapsed_ms));
        publish_completed(*job, result.output, true, elapsed_ms);
        if (job->on_result) job->on_result(result);
        return;
    }

    std::string message = "Execution failed with code " +
                          std::to_string(result.exit_code) + ": " +
                          (!err.empty() ? err : out);
    log_info("sandbox", job->id + " failed (" + describe_wait_status(status) +
             ") after " + format_duration(elapsed_ms));
    publish_completed(*job, message, false, elapsed_ms);
    if (job->on_error) {
        job->on_error(std::make_exception_ptr(ExecutionError(message, result.exit_code)));
    }
}

bool ExecutionSandbox::kill(const std::string& job_id) {
    uint64_t seq = 0;
    bool found = false;
    for (const auto& [s, job] : jobs_) {
        if (job->id == job_id) {
            seq = s;
            found = true;
            break;
        }
    }
    if (!found) return false;

    std::unique_ptr<Job> job = detach(seq);
    job->child.reset(); // SIGKILL the group and reap
    remove_files(*job);

    uint64_t elapsed_ms = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            Clock::now() - job->started).count());
    std::string message = "Execution " + job->id + " killed";
    log_info("sandbox", message);
    publish_completed(*job, message, false, elapsed_ms);

    loop_.post([cb = std::move(job->on_error), message]() {
        if (cb) cb(std::make_exception_ptr(ExecutionError(message)));
    });
    return true;
}

std::vector<JobInfo> ExecutionSandbox::jobs() const {
    std::vector<JobInfo> out;
    auto now = Clock::now();
    for (const auto& [seq, job] : jobs_) {
        JobInfo info;
        info.id = job->id;
        info.runtime = job->runtime->name;
        info.pid = job->child ? job->child->pid() : -1;
        info.elapsed_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(now - job->started).count());
        out.push_back(std::move(info));
    }
    return out;
}

void ExecutionSandbox::publish_completed(const Job& job, const std::string& output,
                                         bool success, uint64_t elapsed_ms) {
    if (!bus_) return;
    ExecutionCompletedEvent ev;
    ev.job_id = job.id;
    ev.code = job.code;
    ev.runtime = job.runtime ? job.runtime->name : "";
    ev.output = output;
    ev.success = success;
    ev.timed_out = job.timed_out;
    ev.elapsed_ms = elapsed_ms;
    bus_->publish(ev);
}

void ExecutionSandbox::remove_files(const Job& job) {
    for (const auto* path : {&job.source_path, &job.binary_path}) {
        if (path->empty()) continue;
        std::error_code ec;
        fs::remove(*path, ec);
        if (ec) log_warn("sandbox", "Could not remove " + *path + ": " + ec.message());
    }
}

} // namespace toolmux
