#include "event_loop.hpp"
#include <algorithm>
#include <map>
#include <cerrno>
#include <poll.h>
#include <sys/wait.h>

namespace toolmux {

// Child exits are detected by polling waitpid, so the loop never sleeps
// longer than this while children are watched.
static constexpr int kChildPollIntervalMs = 20;

void EventLoop::add_reader(int fd, ReadCallback callback) {
    readers_[fd] = std::move(callback);
}

void EventLoop::remove_reader(int fd) {
    readers_.erase(fd);
}

bool EventLoop::has_reader(int fd) const {
    return readers_.count(fd) > 0;
}

void EventLoop::add_writer(int fd, WriteCallback callback) {
    writers_[fd] = std::move(callback);
}

void EventLoop::remove_writer(int fd) {
    writers_.erase(fd);
}

bool EventLoop::has_writer(int fd) const {
    return writers_.count(fd) > 0;
}

EventLoop::TimerId EventLoop::add_timer(uint32_t delay_ms, Callback callback) {
    TimerId id = next_timer_id_++;
    timers_[id] = Timer{Clock::now() + std::chrono::milliseconds(delay_ms),
                        std::move(callback)};
    return id;
}

bool EventLoop::cancel_timer(TimerId id) {
    return timers_.erase(id) > 0;
}

void EventLoop::watch_child(pid_t pid, ExitCallback callback) {
    children_[pid] = std::move(callback);
}

void EventLoop::unwatch_child(pid_t pid) {
    children_.erase(pid);
}

void EventLoop::post(Callback callback) {
    posted_.push_back(std::move(callback));
}

bool EventLoop::stopped() const {
    return stopped_ || (abort_flag_ && abort_flag_->load());
}

int EventLoop::compute_wait(int max_wait_ms) const {
    int wait = max_wait_ms;
    if (!posted_.empty()) return 0;
    if (!children_.empty()) wait = std::min(wait, kChildPollIntervalMs);

    auto now = Clock::now();
    for (const auto& [id, timer] : timers_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            timer.deadline - now).count();
        if (remaining <= 0) return 0;
        // Round up so the timer has expired when poll returns.
        wait = std::min(wait, static_cast<int>(remaining) + 1);
    }
    return std::max(wait, 0);
}

void EventLoop::run_once(int max_wait_ms) {
    // Posted callbacks may post more; those run next iteration.
    std::vector<Callback> posted;
    posted.swap(posted_);
    for (auto& cb : posted) {
        cb();
    }

    std::map<int, short> interest;
    for (const auto& [fd, _] : readers_) interest[fd] |= POLLIN;
    for (const auto& [fd, _] : writers_) interest[fd] |= POLLOUT;

    std::vector<struct pollfd> fds;
    fds.reserve(interest.size());
    for (const auto& [fd, events] : interest) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = events;
        pfd.revents = 0;
        fds.push_back(pfd);
    }

    int wait = compute_wait(max_wait_ms);
    int ret = ::poll(fds.data(), fds.size(), wait);
    if (ret < 0 && errno != EINTR) {
        ret = 0;
    }

    if (ret > 0) {
        constexpr short kFailure = POLLHUP | POLLERR | POLLNVAL;
        for (const auto& pfd : fds) {
            if (pfd.revents & (POLLIN | kFailure)) {
                auto it = readers_.find(pfd.fd);
                // Copy: the callback may remove itself.
                if (it != readers_.end()) {
                    ReadCallback cb = it->second;
                    cb(pfd.fd);
                }
            }
            if (pfd.revents & (POLLOUT | kFailure)) {
                auto it = writers_.find(pfd.fd);
                if (it != writers_.end()) {
                    WriteCallback cb = it->second;
                    cb(pfd.fd);
                }
            }
        }
    }

    dispatch_timers();
    reap_children();
}

void EventLoop::dispatch_timers() {
    auto now = Clock::now();
    std::vector<std::pair<Clock::time_point, TimerId>> expired;
    for (const auto& [id, timer] : timers_) {
        if (timer.deadline <= now) expired.emplace_back(timer.deadline, id);
    }
    std::sort(expired.begin(), expired.end());

    for (const auto& [deadline, id] : expired) {
        auto it = timers_.find(id);
        if (it == timers_.end()) continue; // cancelled by an earlier timer
        Callback cb = std::move(it->second.callback);
        timers_.erase(it);
        cb();
    }
}

void EventLoop::reap_children() {
    if (children_.empty()) return;

    std::vector<pid_t> pids;
    pids.reserve(children_.size());
    for (const auto& [pid, _] : children_) {
        pids.push_back(pid);
    }

    for (pid_t pid : pids) {
        auto it = children_.find(pid);
        if (it == children_.end()) continue;
        int status = 0;
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == 0) continue;
        if (r < 0) status = -1; // already reaped elsewhere
        ExitCallback cb = std::move(it->second);
        children_.erase(it);
        cb(status);
    }
}

bool EventLoop::run_until(const std::function<bool()>& done, uint32_t timeout_ms) {
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!done()) {
        if (stopped()) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - Clock::now()).count();
        if (remaining <= 0) break;
        run_once(static_cast<int>(std::min<long long>(remaining, 100)));
    }
    return done();
}

void EventLoop::run() {
    stopped_ = false;
    while (!stopped()) {
        run_once(1000);
    }
}

} // namespace toolmux
