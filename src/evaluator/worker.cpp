#include "evaluator/worker.hpp"

#include <chrono>
#include <iostream>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "evaluator/interpreter.hpp"
#include "protocol/codec.hpp"

namespace crucible::evaluator {

using nlohmann::json;

EvaluatorWorker::EvaluatorWorker(std::string container,
                                 std::unique_ptr<transport::MessageChannel> channel)
    : container_(std::move(container)), channel_(std::move(channel)) {}

int EvaluatorWorker::run() {
    while (true) {
        auto message = channel_->receive();
        if (core::errors::is_error(message)) {
            const auto& error = core::errors::get_error(message);
            if (error.code == "channel_closed") {
                return 0;
            }
            LOG_ERROR("Evaluator for " + container_ + " lost its channel: " + error.message);
            return 1;
        }

        const json& body = core::errors::get_value(message);
        const std::string type = transport::message_type(body);
        if (type == protocol::kWorkerRun) {
            auto job = protocol::decode<protocol::WorkerJob>(body);
            if (core::errors::is_error(job)) {
                LOG_ERROR(core::errors::get_error(job).message);
                return 1;
            }
            auto handled = handle_job(core::errors::get_value(job));
            if (core::errors::is_error(handled)) {
                // Nobody left to report to.
                return 0;
            }
        } else if (type == protocol::kWorkerForget) {
            auto forget = protocol::decode<protocol::WorkerForget>(body);
            if (!core::errors::is_error(forget)) {
                contexts_.erase(core::errors::get_value(forget).evaluation);
            }
        } else {
            LOG_WARN("Evaluator ignoring unexpected message: " + type);
        }
    }
}

json EvaluatorWorker::fold_parents(const std::vector<protocol::ParentContext>& parents) const {
    json context = json::object();
    for (const auto& parent : parents) {
        if (!parent.local) {
            merge_missing(context, parent.bindings);
            continue;
        }
        const auto it = contexts_.find(parent.evaluation);
        if (it == contexts_.end()) {
            LOG_DEBUG("Evaluator has no bindings for " + parent.evaluation);
            continue;
        }
        merge_missing(context, it->second);
    }
    return context;
}

core::errors::Status EvaluatorWorker::handle_job(const protocol::WorkerJob& job) {
    EvaluationHooks hooks;
    hooks.on_output = [this, &job](const std::string& text) {
        auto sent = channel_->send(protocol::encode(
            protocol::kWorkerOutput, protocol::WorkerOutput{job.evaluation, text}));
        if (core::errors::is_error(sent)) {
            LOG_WARN("Dropping evaluation output: " + core::errors::get_error(sent).message);
        }
    };
    hooks.on_exit = [](const int status) {
        std::cout.flush();
        ::_exit(status);
    };

    const auto started = std::chrono::steady_clock::now();
    EvaluationOutcome outcome =
        evaluate_code(job.code, job.file, fold_parents(job.parents), hooks);
    const std::chrono::duration<double, std::milli> elapsed =
        std::chrono::steady_clock::now() - started;

    contexts_[job.evaluation] = outcome.bindings;

    protocol::WorkerResult result;
    result.evaluation = job.evaluation;
    result.result = outcome.result;
    result.bindings = std::move(outcome.bindings);
    result.evaluation_time_ms = elapsed.count();
    return channel_->send(protocol::encode(protocol::kWorkerResult, result));
}

}  // namespace crucible::evaluator
