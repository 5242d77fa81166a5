#include "child_process.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace toolmux {

ReadStatus drain_fd(int fd, std::string& out) {
    std::array<char, 4096> buffer;
    while (true) {
        ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            out.append(buffer.data(), static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return ReadStatus::Closed;
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return ReadStatus::Open;
        return ReadStatus::Closed;
    }
}

static void set_cloexec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
}

static void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

static void close_pair(int p[2]) {
    if (p[0] >= 0) ::close(p[0]);
    if (p[1] >= 0) ::close(p[1]);
    p[0] = p[1] = -1;
}

std::unique_ptr<ChildProcess> ChildProcess::spawn(const SpawnOptions& options) {
    if (options.command.empty()) {
        throw std::runtime_error("Cannot spawn: empty command");
    }

    // Writes to an exited child must fail with EPIPE instead of killing us.
    static const bool sigpipe_ignored = (std::signal(SIGPIPE, SIG_IGN), true);
    (void)sigpipe_ignored;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};

    if (::pipe(in_pipe) != 0 || ::pipe(out_pipe) != 0 ||
        ::pipe(err_pipe) != 0 || ::pipe(exec_pipe) != 0) {
        int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw std::runtime_error(std::string("Failed to create pipes: ") + std::strerror(saved));
    }
    // exec_pipe closes on a successful exec; anything read from it is errno.
    set_cloexec(exec_pipe[0]);
    set_cloexec(exec_pipe[1]);

    // Build argv before fork.
    std::vector<std::string> argv_storage;
    argv_storage.reserve(options.args.size() + 1);
    argv_storage.push_back(options.command);
    for (const auto& a : options.args) argv_storage.push_back(a);
    std::vector<char*> argv;
    argv.reserve(argv_storage.size() + 1);
    for (auto& s : argv_storage) argv.push_back(s.data());
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        throw std::runtime_error(std::string("Failed to fork process: ") + std::strerror(saved));
    }

    if (pid == 0) {
        // Child process: own process group, default SIGPIPE, piped stdio
        ::setsid();
        std::signal(SIGPIPE, SIG_DFL);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::close(in_pipe[0]);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        ::close(exec_pipe[0]);

        for (const auto& [key, value] : options.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }
        if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) != 0) {
            int e = errno;
            auto ignored = ::write(exec_pipe[1], &e, sizeof(e));
            (void)ignored;
            _exit(127);
        }

        ::execvp(argv[0], argv.data());
        int e = errno;
        auto ignored = ::write(exec_pipe[1], &e, sizeof(e));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n > 0) {
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        int status = 0;
        ::waitpid(pid, &status, 0);
        throw std::runtime_error("Failed to execute " + options.command + ": " +
                                 std::strerror(child_errno));
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;
    child->stdin_fd_ = in_pipe[1];
    child->stdout_fd_ = out_pipe[0];
    child->stderr_fd_ = err_pipe[0];

    // Later children must not inherit our ends, or EOF never arrives.
    set_cloexec(child->stdin_fd_);
    set_cloexec(child->stdout_fd_);
    set_cloexec(child->stderr_fd_);
    set_nonblocking(child->stdin_fd_);
    set_nonblocking(child->stdout_fd_);
    set_nonblocking(child->stderr_fd_);
    return child;
}

ChildProcess::~ChildProcess() {
    close_fds();
    if (pid_ > 0 && !exited_) {
        ::kill(-pid_, SIGKILL);
        int status = 0;
        ::waitpid(pid_, &status, 0);
    }
}

WriteStatus ChildProcess::write_some(const std::string& data, size_t& offset) {
    if (stdin_fd_ < 0 || exited_) return WriteStatus::Failed;
    while (offset < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return WriteStatus::Blocked;
        return WriteStatus::Failed;
    }
    return WriteStatus::Done;
}

void ChildProcess::close_stdin() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void ChildProcess::terminate(int grace_ms) {
    close_stdin();
    if (pid_ <= 0 || exited_) return;

    ::kill(-pid_, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(grace_ms);
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_ || r < 0) {
            mark_exited(r < 0 ? -1 : status);
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ::kill(-pid_, SIGKILL);
    if (::waitpid(pid_, &status, 0) < 0) status = -1;
    mark_exited(status);
}

void ChildProcess::kill() {
    if (pid_ > 0 && !exited_) {
        ::kill(-pid_, SIGKILL);
    }
}

void ChildProcess::mark_exited(int status) {
    exited_ = true;
    wait_status_ = status;
}

int ChildProcess::exit_code() const {
    if (!exited_ || wait_status_ < 0) return -1;
    if (WIFEXITED(wait_status_)) return WEXITSTATUS(wait_status_);
    if (WIFSIGNALED(wait_status_)) return 128 + WTERMSIG(wait_status_);
    return -1;
}

void ChildProcess::close_fds() {
    close_stdin();
    if (stdout_fd_ >= 0) { ::close(stdout_fd_); stdout_fd_ = -1; }
    if (stderr_fd_ >= 0) { ::close(stderr_fd_); stderr_fd_ = -1; }
}

std::string describe_wait_status(int status) {
    if (status < 0) return "unknown status";
    if (WIFEXITED(status)) return "exit code " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "signal " + std::to_string(WTERMSIG(status));
    return "status " + std::to_string(status);
}

} // namespace toolmux
