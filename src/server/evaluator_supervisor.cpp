#include "server/evaluator_supervisor.hpp"

#include <cerrno>
#include <chrono>
#include <sys/wait.h>
#include <thread>
#include "core/logging/logger.hpp"
#include "evaluator/worker.hpp"
#include "transport/process.hpp"

namespace crucible::server {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;

namespace {

constexpr auto kExitReapTimeout = std::chrono::milliseconds(2000);

}  // namespace

core::errors::Result<WorkerHandle> EvaluatorSupervisor::start_worker(
    const WorkerOptions& options) {
    auto pair = transport::make_channel_pair();
    if (core::errors::is_error(pair)) {
        const auto& error = core::errors::get_error(pair);
        return CrucibleError{ErrorCategory::Worker,
                             "Cannot create evaluator channel: " + error.message,
                             "worker_start_failed"};
    }
    auto channels = core::errors::take_value(pair);
    std::shared_ptr<transport::MessageChannel> parent_end = std::move(channels.first);
    std::shared_ptr<transport::MessageChannel> child_end = std::move(channels.second);

    const int child_fd = child_end->fd();
    const std::string container = options.container;
    auto forked = transport::fork_child(
        [child_fd, container]() {
            core::logging::Logger::get().set_process_label("evaluator " + container);
            auto channel = std::make_unique<transport::MessageChannel>(child_fd);
            evaluator::EvaluatorWorker worker(container, std::move(channel));
            return worker.run();
        },
        {child_fd});
    if (core::errors::is_error(forked)) {
        return CrucibleError{ErrorCategory::Worker,
                             "Cannot start evaluator for container " + container + ": " +
                                 core::errors::get_error(forked).message,
                             "worker_start_failed"};
    }
    child_end->close();

    ++started_;
    const pid_t pid = core::errors::get_value(forked);
    LOG_DEBUG("Started evaluator " + std::to_string(pid) + " for container " + container);
    return WorkerHandle{pid, container, parent_end};
}

core::errors::Status EvaluatorSupervisor::terminate_worker(WorkerHandle& handle) {
    if (handle.pid > 0) {
        transport::kill_and_reap(handle.pid);
        LOG_DEBUG("Terminated evaluator " + std::to_string(handle.pid) + " for container " +
                  handle.container);
        handle.pid = -1;
    }
    if (handle.channel) {
        handle.channel->close();
    }
    return core::errors::ok();
}

std::string EvaluatorSupervisor::collect_exit(WorkerHandle& handle) {
    if (handle.pid <= 0) {
        return "terminated";
    }

    // End of stream can arrive a moment before the process is reapable.
    int status = 0;
    const auto deadline = std::chrono::steady_clock::now() + kExitReapTimeout;
    while (true) {
        const pid_t waited = ::waitpid(handle.pid, &status, WNOHANG);
        if (waited == handle.pid) {
            break;
        }
        if (waited < 0 && errno != EINTR) {
            handle.pid = -1;
            return "terminated";
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            // Closed its channel but kept running.
            auto killed = transport::kill_and_reap(handle.pid);
            status = killed.value_or(0);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    handle.pid = -1;
    if (handle.channel) {
        handle.channel->close();
    }
    return transport::describe_exit_status(status);
}

}  // namespace crucible::server
