#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <vector>
#include <sys/types.h>

namespace toolmux {

// Single-threaded poll(2) reactor. Every provider pipe, execution pipe,
// timeout and child-exit notification is delivered as a callback on the
// thread that runs the loop, so the state those callbacks touch needs no
// locking.
class EventLoop {
public:
    using Callback = std::function<void()>;
    using ReadCallback = std::function<void(int fd)>;
    using WriteCallback = std::function<void(int fd)>;
    using ExitCallback = std::function<void(int status)>;
    using TimerId = uint64_t;
    using Clock = std::chrono::steady_clock;

    // Invoked when fd is readable, hung up or in error. The callback must
    // remove the reader once the fd reaches EOF.
    void add_reader(int fd, ReadCallback callback);
    void remove_reader(int fd);
    bool has_reader(int fd) const;

    // Invoked when fd accepts more data (or the reading side is gone).
    // The callback removes the writer once it has nothing left to send.
    void add_writer(int fd, WriteCallback callback);
    void remove_writer(int fd);
    bool has_writer(int fd) const;

    // One-shot timer. Returns an id usable with cancel_timer.
    TimerId add_timer(uint32_t delay_ms, Callback callback);
    // Returns false when the timer already fired or was cancelled.
    bool cancel_timer(TimerId id);

    // Reap pid with waitpid(WNOHANG) once per iteration; the callback gets
    // the raw wait status.
    void watch_child(pid_t pid, ExitCallback callback);
    void unwatch_child(pid_t pid);

    // Run callback on the next iteration.
    void post(Callback callback);

    // One iteration: run posted callbacks, poll up to max_wait_ms, dispatch
    // readers, expired timers and exited children.
    void run_once(int max_wait_ms);

    // Drive the loop until done() holds or timeout_ms elapses.
    // Returns done() at exit.
    bool run_until(const std::function<bool()>& done, uint32_t timeout_ms);

    // Drive the loop until stop() is called or the abort flag is raised.
    void run();
    void stop() { stopped_ = true; }
    bool stopped() const;

    // Checked between iterations (set from a signal handler).
    void set_abort_flag(std::atomic<bool>* flag) { abort_flag_ = flag; }

    size_t reader_count() const { return readers_.size(); }
    size_t writer_count() const { return writers_.size(); }
    size_t timer_count() const { return timers_.size(); }
    size_t child_count() const { return children_.size(); }

private:
    struct Timer {
        Clock::time_point deadline;
        Callback callback;
    };

    int compute_wait(int max_wait_ms) const;
    void dispatch_timers();
    void reap_children();

    std::map<int, ReadCallback> readers_;
    std::map<int, WriteCallback> writers_;
    std::map<TimerId, Timer> timers_;
    std::unordered_map<pid_t, ExitCallback> children_;
    std::vector<Callback> posted_;
    TimerId next_timer_id_ = 1;
    bool stopped_ = false;
    std::atomic<bool>* abort_flag_ = nullptr;
};

} // namespace toolmux
