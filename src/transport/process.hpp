#pragma once

#include <sys/types.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/crucible_errors.hpp"

namespace crucible::transport {

// Owns a spawned OS process. A process that is still running when its
// handle is destroyed gets killed and reaped.
class ChildProcess {
public:
    ChildProcess() = default;
    ChildProcess(pid_t pid, int output_fd, int lifeline_fd = -1);
    ~ChildProcess();

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const { return pid_; }
    bool running() const { return pid_ > 0 && !exit_status_.has_value(); }
    const std::optional<int>& exit_status() const { return exit_status_; }

    // Read end of the child's stdout, or -1 when not captured / exhausted.
    int output_fd() const { return output_fd_; }

    // Reads pending output without blocking. Returns false once the pipe
    // reached end of file.
    bool drain_output(std::string& out);

    // Non-blocking reap. Returns the raw wait status once the process exited.
    std::optional<int> try_wait();

    // Waits up to `grace` for a voluntary exit, then kills and reaps.
    int wait_or_kill(std::chrono::milliseconds grace);

    void kill(int signal_number);

private:
    void reset();

    pid_t pid_ = -1;
    int output_fd_ = -1;
    int lifeline_fd_ = -1;
    std::optional<int> exit_status_;
};

struct SpawnRequest {
    std::filesystem::path executable;
    std::vector<std::string> args;
    bool capture_stdout = true;
    // When set, the child gets the read end of a pipe whose only write end
    // lives in the returned ChildProcess, announced as `<flag> <fd>` ahead
    // of `args`. The child sees end of file once that handle is gone or this
    // process dies, whichever thread spawned it.
    std::string lifeline_flag;
};

// Fork/exec with a close-on-exec error pipe: exec failures come back as a
// Spawn error instead of a silently exiting child.
core::errors::Result<ChildProcess> spawn_executable(const SpawnRequest& request);

// Forks a child that runs `body` and exits with its return value. The child
// dies with its creator and keeps only stdio plus `keep_fds` open.
core::errors::Result<pid_t> fork_child(const std::function<int()>& body,
                                       const std::vector<int>& keep_fds);

// Kills the process (SIGKILL) and reaps it. Returns the wait status when the
// process was ours to reap.
std::optional<int> kill_and_reap(pid_t pid);

bool is_process_alive(pid_t pid);

std::string describe_exit_status(int status);

void set_nonblocking(int fd);

}  // namespace crucible::transport
