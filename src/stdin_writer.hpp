#pragma once
#include "child_process.hpp"
#include "event_loop.hpp"
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <vector>

namespace toolmux {

// Outbound queue for a child's non-blocking stdin. Messages that do not fit
// in the pipe wait here and are flushed when the loop reports the fd
// writable, so a child that stops reading never stalls the loop.
class StdinWriter {
public:
    // Tag for messages nobody needs to hear about (notifications).
    static constexpr uint64_t kUntagged = UINT64_MAX;

    // Called from the loop when the pipe fails with messages still queued;
    // receives their tags.
    using FailureCallback = std::function<void(const std::vector<uint64_t>& dropped)>;

    StdinWriter(EventLoop& loop, ChildProcess& child, FailureCallback on_failure = nullptr);
    ~StdinWriter();

    StdinWriter(const StdinWriter&) = delete;
    StdinWriter& operator=(const StdinWriter&) = delete;

    // Queue one framed message. False when the pipe has already failed or
    // fails on this write; the message is not queued then.
    bool send(uint64_t tag, std::string data);

    // Remove a queued message that has not started going out. A message
    // already partly written stays, so the framing on the pipe is intact.
    bool drop(uint64_t tag);

    size_t queued_messages() const { return queue_.size(); }
    size_t queued_bytes() const;
    bool failed() const { return failed_; }

private:
    struct Message {
        uint64_t tag;
        std::string data;
        size_t offset = 0;
    };

    // Write what the pipe takes. Returns false on a pipe failure.
    bool flush();
    void on_writable();
    void watch();
    void unwatch();

    EventLoop& loop_;
    ChildProcess& child_;
    FailureCallback on_failure_;
    std::deque<Message> queue_;
    int fd_ = -1;
    bool failed_ = false;
};

} // namespace toolmux
