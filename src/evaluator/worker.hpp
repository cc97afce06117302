#pragma once

#include <map>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "protocol/worker_contract.hpp"
#include "transport/message_channel.hpp"

namespace crucible::evaluator {

// Body of an evaluator process: runs jobs from its channel one at a time and
// keeps the bindings each evaluation produced.
class EvaluatorWorker {
public:
    EvaluatorWorker(std::string container, std::unique_ptr<transport::MessageChannel> channel);

    // Serves until the channel closes. Returns the process exit code.
    int run();

private:
    core::errors::Status handle_job(const protocol::WorkerJob& job);
    nlohmann::json fold_parents(const std::vector<protocol::ParentContext>& parents) const;

    std::string container_;
    std::unique_ptr<transport::MessageChannel> channel_;
    std::map<std::string, nlohmann::json> contexts_;
};

}  // namespace crucible::evaluator
