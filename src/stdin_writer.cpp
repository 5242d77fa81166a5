#include "stdin_writer.hpp"

namespace toolmux {

StdinWriter::StdinWriter(EventLoop& loop, ChildProcess& child, FailureCallback on_failure)
    : loop_(loop), child_(child), on_failure_(std::move(on_failure)),
      fd_(child.stdin_fd()) {}

StdinWriter::~StdinWriter() {
    unwatch();
}

void StdinWriter::watch() {
    if (fd_ >= 0 && !loop_.has_writer(fd_)) {
        loop_.add_writer(fd_, [this](int) { on_writable(); });
    }
}

void StdinWriter::unwatch() {
    if (fd_ >= 0) loop_.remove_writer(fd_);
}

size_t StdinWriter::queued_bytes() const {
    size_t n = 0;
    for (const auto& m : queue_) n += m.data.size() - m.offset;
    return n;
}

bool StdinWriter::flush() {
    while (!queue_.empty()) {
        Message& front = queue_.front();
        WriteStatus status = child_.write_some(front.data, front.offset);
        if (status == WriteStatus::Blocked) return true;
        if (status == WriteStatus::Failed) return false;
        queue_.pop_front();
    }
    return true;
}

bool StdinWriter::send(uint64_t tag, std::string data) {
    if (failed_) return false;

    // Something is already waiting: keep the order and let the writer flush.
    if (!queue_.empty()) {
        queue_.push_back(Message{tag, std::move(data), 0});
        return true;
    }

    queue_.push_back(Message{tag, std::move(data), 0});
    if (!flush()) {
        failed_ = true;
        queue_.clear();
        unwatch();
        return false;
    }
    if (!queue_.empty()) watch();
    return true;
}

bool StdinWriter::drop(uint64_t tag) {
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
        if (it->tag != tag) continue;
        if (it->offset > 0) return false;
        queue_.erase(it);
        if (queue_.empty()) unwatch();
        return true;
    }
    return false;
}

void StdinWriter::on_writable() {
    if (flush()) {
        if (queue_.empty()) unwatch();
        return;
    }

    failed_ = true;
    unwatch();
    std::vector<uint64_t> dropped;
    for (const auto& m : queue_) {
        if (m.tag != kUntagged) dropped.push_back(m.tag);
    }
    queue_.clear();
    if (on_failure_ && !dropped.empty()) on_failure_(dropped);
}

} // namespace toolmux
