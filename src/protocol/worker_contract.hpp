#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/evaluation_contract.hpp"

namespace crucible::protocol {

    // Runtime server <-> evaluator worker
    inline constexpr const char* kWorkerRun = "run";
    inline constexpr const char* kWorkerForget = "forget";
    inline constexpr const char* kWorkerOutput = "output";
    inline constexpr const char* kWorkerResult = "result";

    // One parent of a job. Parents in the worker's own container are
    // referenced by evaluation; parents from other containers arrive as a
    // copy of their bindings.
    struct ParentContext {
        bool local = true;
        std::string evaluation;
        nlohmann::json bindings = nlohmann::json::object();
    };

    struct WorkerJob {
        std::string evaluation;
        std::string code;
        std::string file;
        std::vector<ParentContext> parents;
    };

    struct WorkerForget {
        std::string evaluation;
    };

    struct WorkerOutput {
        std::string evaluation;
        std::string text;
    };

    struct WorkerResult {
        std::string evaluation;
        EvaluationResult result;
        nlohmann::json bindings = nlohmann::json::object();
        double evaluation_time_ms = 0.0;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ParentContext, local, evaluation, bindings)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(WorkerJob, evaluation, code, file, parents)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(WorkerForget, evaluation)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(WorkerOutput, evaluation, text)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(WorkerResult, evaluation, result, bindings, evaluation_time_ms)

} // namespace crucible::protocol
