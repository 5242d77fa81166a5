#include "app.hpp"
#include "errors.hpp"
#include "json_rpc.hpp"
#include "log.hpp"
#include "util.hpp"
#include <array>
#include <cerrno>
#include <cstring>

namespace toolmux {

HistoryLimits history_limits(const HistoryConfig& config) {
    HistoryLimits limits;
    limits.max_tool_calls = config.max_tool_calls;
    limits.max_executions = config.max_executions;
    limits.token_cap = config.token_cap;
    return limits;
}

App::App(Config config)
    : config_(std::move(config)),
      history_(history_limits(config_.history)),
      supervisor_(loop_, bus_, config_.runtime),
      sandbox_(loop_, &bus_, config_.runtime.execute_timeout_ms),
      dispatcher_(bus_, supervisor_, catalog_, sandbox_, history_,
                  [this](const nlohmann::json& response) { write_response(response); }) {
    history_.subscribe(bus_);
}

App::~App() {
    shutdown();
}

void App::start() {
    size_t started = supervisor_.start_all(config_.providers);
    if (started == 0) {
        throw ConfigError("None of the " + std::to_string(config_.providers.size()) +
                          " configured provider(s) could be started");
    }
    catalog_.rebuild(supervisor_);

    // Executed code may call provider tools only.
    nlohmann::json exported = nlohmann::json::array();
    for (const auto& tool : catalog_.to_json()["tools"]) {
        std::string name = tool.value("name", "");
        if (name == builtin_tools::Execute || name == builtin_tools::Status ||
            name == builtin_tools::Kill) {
            continue;
        }
        exported.push_back(tool);
    }
    sandbox_.set_exported_tools(std::move(exported));
}

void App::write_response(const nlohmann::json& response) {
    if (output_failed_) return;
    std::string data = frame(response);
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(out_fd_, data.data() + written, data.size() - written);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            log_error("toolmux", std::string("Cannot write response: ") + std::strerror(errno));
            output_failed_ = true;
            loop_.stop();
            return;
        }
        written += static_cast<size_t>(n);
    }
}

void App::on_input(int fd) {
    // One read per readiness notification; stdin stays blocking.
    std::array<char, 65536> buffer;
    ssize_t n = ::read(fd, buffer.data(), buffer.size());
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;
    if (n <= 0) {
        loop_.remove_reader(fd);
        input_closed_ = true;
        // A final line without its newline still counts.
        std::string rest = input_.pending();
        input_.clear();
        if (!trim(rest).empty()) dispatcher_.handle_line(rest);
        log_debug("toolmux", "Input closed, " + std::to_string(dispatcher_.in_flight()) +
                  " request(s) in flight");
        return;
    }
    for (const auto& line : input_.feed(buffer.data(), static_cast<size_t>(n))) {
        dispatcher_.handle_line(line);
    }
}

int App::serve(int in_fd, int out_fd) {
    out_fd_ = out_fd;
    input_closed_ = false;
    loop_.add_reader(in_fd, [this](int fd) { on_input(fd); });
    log_info("toolmux", "Serving " + std::to_string(catalog_.size()) + " tool(s)");

    while (!loop_.stopped()) {
        if (input_closed_ && dispatcher_.in_flight() == 0) break;
        loop_.run_once(1000);
    }
    loop_.remove_reader(in_fd);

    if (loop_.stopped() && !output_failed_) {
        log_info("toolmux", "Interrupted, shutting down");
    }
    shutdown();
    return output_failed_ ? 1 : 0;
}

void App::shutdown() {
    for (const auto& job : sandbox_.jobs()) {
        sandbox_.kill(job.id);
    }
    supervisor_.shutdown();
}

} // namespace toolmux
