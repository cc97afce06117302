#pragma once

#include <sys/types.h>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/crucible_errors.hpp"
#include "transport/message_channel.hpp"

namespace crucible::server {

struct WorkerOptions {
    std::string container;
};

struct WorkerHandle {
    pid_t pid = -1;
    std::string container;
    std::shared_ptr<transport::MessageChannel> channel;
};

// Starts and stops evaluator processes. Workers are temporary: a worker that
// dies stays dead and nothing else is affected by it.
class EvaluatorSupervisor {
public:
    core::errors::Result<WorkerHandle> start_worker(const WorkerOptions& options);

    // Kills and reaps the worker. Safe to call on a worker that already exited.
    core::errors::Status terminate_worker(WorkerHandle& handle);

    // Reaps a worker whose channel reached end of stream and describes how it
    // ended, e.g. "killed by signal 9 (Killed)".
    std::string collect_exit(WorkerHandle& handle);

    std::size_t started_count() const { return started_; }

private:
    std::size_t started_ = 0;
};

}  // namespace crucible::server
