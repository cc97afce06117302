#include "transport/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include "core/logging/logger.hpp"

namespace crucible::transport {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;

namespace {

constexpr int kExecFailedStatus = 127;

void close_inherited_fds(const std::vector<int>& keep_fds) {
    long max_fd = ::sysconf(_SC_OPEN_MAX);
    if (max_fd < 256 || max_fd > 65536) {
        max_fd = 65536;
    }
    for (int fd = 3; fd < static_cast<int>(max_fd); ++fd) {
        bool keep = false;
        for (const int kept : keep_fds) {
            if (kept == fd) {
                keep = true;
                break;
            }
        }
        if (!keep) {
            static_cast<void>(::close(fd));
        }
    }
}

// Kill us if our creator dies, and make sure it did not die before the
// request took effect.
void bind_to_parent_lifetime(const pid_t expected_parent) {
    static_cast<void>(::prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0));
    if (::getppid() != expected_parent) {
        _exit(1);
    }
}

}  // namespace

ChildProcess::ChildProcess(const pid_t pid, const int output_fd, const int lifeline_fd)
    : pid_(pid), output_fd_(output_fd), lifeline_fd_(lifeline_fd) {}

ChildProcess::~ChildProcess() {
    reset();
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(other.pid_),
      output_fd_(other.output_fd_),
      lifeline_fd_(other.lifeline_fd_),
      exit_status_(other.exit_status_) {
    other.pid_ = -1;
    other.output_fd_ = -1;
    other.lifeline_fd_ = -1;
    other.exit_status_.reset();
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        reset();
        pid_ = other.pid_;
        output_fd_ = other.output_fd_;
        lifeline_fd_ = other.lifeline_fd_;
        exit_status_ = other.exit_status_;
        other.pid_ = -1;
        other.output_fd_ = -1;
        other.lifeline_fd_ = -1;
        other.exit_status_.reset();
    }
    return *this;
}

void ChildProcess::reset() {
    if (running()) {
        exit_status_ = kill_and_reap(pid_);
    }
    if (output_fd_ >= 0) {
        static_cast<void>(::close(output_fd_));
        output_fd_ = -1;
    }
    if (lifeline_fd_ >= 0) {
        static_cast<void>(::close(lifeline_fd_));
        lifeline_fd_ = -1;
    }
    pid_ = -1;
}

bool ChildProcess::drain_output(std::string& out) {
    if (output_fd_ < 0) {
        return false;
    }

    char buffer[4096];
    while (true) {
        const ssize_t n = ::read(output_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            out.append(buffer, static_cast<std::size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return true;
        }
        static_cast<void>(::close(output_fd_));
        output_fd_ = -1;
        return false;
    }
}

std::optional<int> ChildProcess::try_wait() {
    if (exit_status_.has_value() || pid_ <= 0) {
        return exit_status_;
    }
    int status = 0;
    const pid_t waited = ::waitpid(pid_, &status, WNOHANG);
    if (waited == pid_) {
        exit_status_ = status;
    } else if (waited < 0 && errno == ECHILD) {
        // Reaped elsewhere; treat as gone.
        exit_status_ = 0;
    }
    return exit_status_;
}

int ChildProcess::wait_or_kill(const std::chrono::milliseconds grace) {
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (auto status = try_wait()) {
            return status.value();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (auto status = try_wait()) {
        return status.value();
    }
    LOG_WARN("Process " + std::to_string(pid_) + " did not exit in time, killing it");
    exit_status_ = kill_and_reap(pid_);
    return exit_status_.value_or(0);
}

void ChildProcess::kill(const int signal_number) {
    if (running()) {
        static_cast<void>(::kill(pid_, signal_number));
    }
}

core::errors::Result<ChildProcess> spawn_executable(const SpawnRequest& request) {
    if (::access(request.executable.c_str(), X_OK) != 0) {
        return CrucibleError{ErrorCategory::Spawn,
                             "No runtime executable found at " +
                                 request.executable.string(),
                             "executable_not_found",
                             "Check the node_executable setting."};
    }

    const bool with_lifeline = !request.lifeline_flag.empty();
    int output_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    int lifeline_pipe[2] = {-1, -1};
    const auto close_pipes = [&]() {
        for (int* pipe_fds : {output_pipe, error_pipe, lifeline_pipe}) {
            for (int i = 0; i < 2; ++i) {
                if (pipe_fds[i] >= 0) {
                    static_cast<void>(::close(pipe_fds[i]));
                    pipe_fds[i] = -1;
                }
            }
        }
    };
    if ((request.capture_stdout && ::pipe2(output_pipe, O_CLOEXEC) != 0) ||
        ::pipe2(error_pipe, O_CLOEXEC) != 0 ||
        (with_lifeline && ::pipe2(lifeline_pipe, O_CLOEXEC) != 0)) {
        close_pipes();
        return CrucibleError{ErrorCategory::Internal,
                             "Failed to create process pipes.",
                             "pipe_creation_failed"};
    }

    std::vector<std::string> all = {request.executable.string()};
    if (with_lifeline) {
        all.push_back(request.lifeline_flag);
        all.push_back(std::to_string(lifeline_pipe[0]));
    }
    all.insert(all.end(), request.args.begin(), request.args.end());
    std::vector<char*> argv;
    argv.reserve(all.size() + 1);
    for (auto& arg : all) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        close_pipes();
        return CrucibleError{ErrorCategory::Spawn, "Failed to fork process.",
                             "spawn_failed"};
    }

    if (pid == 0) {
        if (with_lifeline) {
            static_cast<void>(::fcntl(lifeline_pipe[0], F_SETFD, 0));
        }
        if (request.capture_stdout) {
            static_cast<void>(::dup2(output_pipe[1], STDOUT_FILENO));
        }
        // Never read from the controlling terminal.
        const int null_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (null_fd >= 0) {
            static_cast<void>(::dup2(null_fd, STDIN_FILENO));
        }
        ::execv(argv[0], argv.data());
        const int exec_errno = errno;
        static_cast<void>(::write(error_pipe[1], &exec_errno, sizeof(exec_errno)));
        _exit(kExecFailedStatus);
    }

    static_cast<void>(::close(error_pipe[1]));
    if (request.capture_stdout) {
        static_cast<void>(::close(output_pipe[1]));
        set_nonblocking(output_pipe[0]);
    }
    if (with_lifeline) {
        static_cast<void>(::close(lifeline_pipe[0]));
    }

    ChildProcess child(pid, request.capture_stdout ? output_pipe[0] : -1, lifeline_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(error_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    static_cast<void>(::close(error_pipe[0]));
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        return CrucibleError{ErrorCategory::Spawn,
                             "Failed to execute " + request.executable.string() + ": " +
                                 std::strerror(exec_errno),
                             "spawn_failed"};
    }
    return child;
}

core::errors::Result<pid_t> fork_child(const std::function<int()>& body,
                                       const std::vector<int>& keep_fds) {
    const pid_t parent = ::getpid();
    const pid_t pid = ::fork();
    if (pid < 0) {
        return CrucibleError{ErrorCategory::Internal,
                             std::string("Failed to fork process: ") + std::strerror(errno),
                             "fork_failed"};
    }
    if (pid > 0) {
        return pid;
    }

    bind_to_parent_lifetime(parent);
    close_inherited_fds(keep_fds);
    int exit_code = 70;
    try {
        exit_code = body();
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Forked process failed: ") + e.what());
    } catch (...) {
        LOG_ERROR("Forked process failed with a non-standard exception");
    }
    std::cout.flush();
    _exit(exit_code);
}

std::optional<int> kill_and_reap(const pid_t pid) {
    if (pid <= 0) {
        return std::nullopt;
    }
    static_cast<void>(::kill(pid, SIGKILL));
    int status = 0;
    while (true) {
        const pid_t waited = ::waitpid(pid, &status, 0);
        if (waited == pid) {
            return status;
        }
        if (waited < 0 && errno == EINTR) {
            continue;
        }
        return std::nullopt;
    }
}

bool is_process_alive(const pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

std::string describe_exit_status(const int status) {
    if (WIFEXITED(status)) {
        return "exited with status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        const int sig = WTERMSIG(status);
        const char* name = ::strsignal(sig);
        return "killed by signal " + std::to_string(sig) +
               (name != nullptr ? " (" + std::string(name) + ")" : "");
    }
    return "terminated with status " + std::to_string(status);
}

void set_nonblocking(const int fd) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags == -1) {
        return;
    }
    static_cast<void>(::fcntl(fd, F_SETFL, flags | O_NONBLOCK));
}

}  // namespace crucible::transport
