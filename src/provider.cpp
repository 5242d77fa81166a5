#include "provider.hpp"
#include "event_bus.hpp"
#include "log.hpp"
#include "util.hpp"

namespace toolmux {

static constexpr size_t kStderrTailBytes = 1024;

ProviderProcess::ProviderProcess(std::string name, EventLoop& loop, EventBus* bus)
    : name_(std::move(name)), loop_(loop), bus_(bus) {}

ProviderProcess::~ProviderProcess() {
    detach_from_loop();
    for (auto& [id, req] : pending_) {
        loop_.cancel_timer(req.timer);
    }
    pending_.clear();
    // child_ kills and reaps a still-running child
}

void ProviderProcess::start(const SpawnOptions& options) {
    if (child_) {
        throw ProviderStartError("Provider " + name_ + " already started");
    }
    try {
        child_ = ChildProcess::spawn(options);
    } catch (const std::runtime_error& e) {
        throw ProviderStartError("Failed to start provider " + name_ + ": " + e.what());
    }

    writer_ = std::make_unique<StdinWriter>(loop_, *child_,
        [this](const std::vector<uint64_t>& ids) { on_write_failure(ids); });
    loop_.add_reader(child_->stdout_fd(), [this](int fd) { on_stdout(fd); });
    loop_.add_reader(child_->stderr_fd(), [this](int fd) { on_stderr(fd); });
    loop_.watch_child(child_->pid(), [this](int status) { on_exit(status); });
    log_debug("supervisor", "Spawned provider " + name_ + " (pid " +
              std::to_string(child_->pid()) + ")");
}

void ProviderProcess::detach_from_loop() {
    writer_.reset();
    if (!child_) return;
    if (child_->stdout_fd() >= 0) loop_.remove_reader(child_->stdout_fd());
    if (child_->stderr_fd() >= 0) loop_.remove_reader(child_->stderr_fd());
    loop_.unwatch_child(child_->pid());
}

void ProviderProcess::fail_later(ErrorHandler on_error, std::exception_ptr err) {
    loop_.post([cb = std::move(on_error), err]() {
        if (cb) cb(err);
    });
}

uint64_t ProviderProcess::send_request(const std::string& method,
                                       const nlohmann::json& params,
                                       uint32_t timeout_ms,
                                       ResultCallback on_result,
                                       ErrorHandler on_error) {
    uint64_t id = next_id_++;

    if (!running()) {
        fail_later(std::move(on_error), std::make_exception_ptr(
            RpcError("Provider " + name_ + " is not running")));
        return id;
    }

    if (!writer_ || !writer_->send(id, frame(make_request(id, method, params)))) {
        fail_later(std::move(on_error), std::make_exception_ptr(
            RpcError("Failed to send " + method + " to provider " + name_)));
        return id;
    }

    PendingRequest req;
    req.method = method;
    req.on_result = std::move(on_result);
    req.on_error = std::move(on_error);
    req.timer = loop_.add_timer(timeout_ms, [this, id, timeout_ms]() {
        on_timeout(id, timeout_ms);
    });
    pending_.emplace(id, std::move(req));
    return id;
}

bool ProviderProcess::send_notification(const std::string& method,
                                        const nlohmann::json& params) {
    if (!running() || !writer_) return false;
    return writer_->send(StdinWriter::kUntagged, frame(make_notification(method, params)));
}

void ProviderProcess::handle_line(const std::string& line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        log_debug(name_, "Ignoring non-JSON output: " + prefix(line, 200));
        return;
    }

    // Notifications and server-initiated requests are not answered.
    if (!is_response(message)) return;

    const auto& id_value = message["id"];
    if (!id_value.is_number_unsigned()) {
        log_debug(name_, "Ignoring response with unexpected id " + id_value.dump());
        return;
    }
    uint64_t id = id_value.get<uint64_t>();

    auto it = pending_.find(id);
    if (it == pending_.end()) {
        log_debug(name_, "Dropping response for unknown or expired id " +
                  std::to_string(id));
        return;
    }

    // Remove before invoking: the callback may issue new requests.
    PendingRequest req = std::move(it->second);
    pending_.erase(it);
    loop_.cancel_timer(req.timer);

    if (message.contains("error")) {
        const auto& err = message["error"];
        std::string text = "Unknown error";
        int code = 0;
        if (err.is_object()) {
            if (err.contains("message") && err["message"].is_string())
                text = err["message"].get<std::string>();
            if (err.contains("code") && err["code"].is_number_integer())
                code = err["code"].get<int>();
        } else if (err.is_string()) {
            text = err.get<std::string>();
        }
        if (req.on_error) req.on_error(std::make_exception_ptr(RpcError(text, code)));
        return;
    }

    if (req.on_result) req.on_result(message["result"]);
}

void ProviderProcess::on_timeout(uint64_t id, uint32_t timeout_ms) {
    auto it = pending_.find(id);
    if (it == pending_.end()) return;

    PendingRequest req = std::move(it->second);
    pending_.erase(it);
    log_warn("supervisor", "Request " + std::to_string(id) + " (" + req.method +
             ") to " + name_ + " timed out");
    if (writer_ && writer_->drop(id)) {
        log_debug(name_, "Request " + std::to_string(id) + " was never read, dropped");
    }
    if (req.on_error) {
        req.on_error(std::make_exception_ptr(RpcTimeoutError(
            "Request " + req.method + " to provider " + name_ + " timed out after " +
            std::to_string(timeout_ms) + "ms")));
    }
}

void ProviderProcess::on_write_failure(const std::vector<uint64_t>& ids) {
    log_warn("supervisor", "Cannot write to provider " + name_ + ", failing " +
             std::to_string(ids.size()) + " unsent request(s)");
    for (uint64_t id : ids) {
        auto it = pending_.find(id);
        if (it == pending_.end()) continue;
        PendingRequest req = std::move(it->second);
        pending_.erase(it);
        loop_.cancel_timer(req.timer);
        if (req.on_error) {
            req.on_error(std::make_exception_ptr(
                RpcError("Failed to send " + req.method + " to provider " + name_)));
        }
    }
}

void ProviderProcess::on_stdout(int fd) {
    std::string chunk;
    if (drain_fd(fd, chunk) == ReadStatus::Closed) {
        loop_.remove_reader(fd);
    }
    for (const auto& line : stdout_buffer_.feed(chunk)) {
        handle_line(line);
    }
}

void ProviderProcess::on_stderr(int fd) {
    std::string chunk;
    if (drain_fd(fd, chunk) == ReadStatus::Closed) {
        loop_.remove_reader(fd);
    }
    for (const auto& line : stderr_buffer_.feed(chunk)) {
        log_info(name_, line);
        stderr_tail_ += line;
        stderr_tail_ += '\n';
    }
    if (stderr_tail_.size() > kStderrTailBytes) {
        stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailBytes);
    }
}

void ProviderProcess::on_exit(int status) {
    exited_ = true;
    exit_status_ = status;
    if (child_) child_->mark_exited(status);

    if (!stopped_) {
        log_warn("supervisor", "Provider " + name_ + " exited (" +
                 describe_wait_status(status) + "), " +
                 std::to_string(pending_.size()) + " request(s) pending");
    }

    if (bus_) {
        ProviderExitedEvent ev;
        ev.provider = name_;
        ev.wait_status = status;
        ev.pending_requests = pending_.size();
        bus_->publish(ev);
    }
}

void ProviderProcess::stop(int grace_ms) {
    if (stopped_) return;
    stopped_ = true;

    detach_from_loop();
    if (child_ && !exited_) {
        child_->terminate(grace_ms);
        exited_ = true;
        exit_status_ = child_->wait_status();
    }

    auto pending = std::move(pending_);
    pending_.clear();
    for (auto& [id, req] : pending) {
        loop_.cancel_timer(req.timer);
        if (req.on_error) {
            req.on_error(std::make_exception_ptr(
                RpcError("Provider " + name_ + " stopped")));
        }
    }
}

} // namespace toolmux
