#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

namespace toolmux {

struct SpawnOptions {
    std::string command;                       // resolved through PATH
    std::vector<std::string> args;
    std::map<std::string, std::string> env;    // merged over the inherited environment
    std::string cwd;                           // empty = inherit
};

enum class ReadStatus { Open, Closed };
enum class WriteStatus { Done, Blocked, Failed };

// Read everything currently available from a non-blocking fd into out.
// Returns Closed at EOF or on a hard error.
ReadStatus drain_fd(int fd, std::string& out);

// A child process with piped stdin/stdout/stderr. The child leads its own
// process group so kill() also takes down anything it spawned.
class ChildProcess {
public:
    // Throws std::runtime_error when pipes, fork or exec fail.
    static std::unique_ptr<ChildProcess> spawn(const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }
    int stderr_fd() const { return stderr_fd_; }

    // Write data from offset onward without blocking; offset advances past
    // what was written. Blocked means the pipe is full, Failed that stdin is
    // closed or the child has gone away.
    WriteStatus write_some(const std::string& data, size_t& offset);
    void close_stdin();

    // SIGTERM, wait up to grace_ms, then SIGKILL. Reaps the child.
    void terminate(int grace_ms = 500);
    // SIGKILL to the whole process group. The caller still reaps.
    void kill();

    // Record a wait status obtained elsewhere (the event loop reaps).
    void mark_exited(int status);
    bool exited() const { return exited_; }
    int wait_status() const { return wait_status_; }
    // Exit code, or 128 + signal number for a signalled child.
    int exit_code() const;

private:
    ChildProcess() = default;
    void close_fds();

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool exited_ = false;
    int wait_status_ = 0;
};

// Human-readable description of a wait status.
std::string describe_wait_status(int status);

} // namespace toolmux
