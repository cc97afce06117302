#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace crucible::protocol {

    // Owner -> runtime server
    inline constexpr const char* kAttach = "attach";
    inline constexpr const char* kEvaluate = "evaluate";
    inline constexpr const char* kForgetEvaluation = "forget_evaluation";
    inline constexpr const char* kDropContainer = "drop_container";
    inline constexpr const char* kIntellisense = "intellisense";
    inline constexpr const char* kStop = "stop";

    // Runtime server -> owner
    inline constexpr const char* kAttached = "attached";
    inline constexpr const char* kEvaluationOutput = "evaluation_output";
    inline constexpr const char* kEvaluationResponse = "evaluation_response";
    inline constexpr const char* kContainerDown = "container_down";
    inline constexpr const char* kIntellisenseResponse = "intellisense_response";

    // Points at the bindings produced by one evaluation in one container.
    struct Locator {
        std::string container;
        std::string evaluation;
    };

    struct EvaluationOptions {
        std::string file = "cell";  // label used in error messages
    };

    struct EvaluationRequest {
        std::string container;
        std::string evaluation;
        std::string code;
        std::vector<Locator> parents;  // nearest parent first
        EvaluationOptions options;
    };

    enum class ResultKind {
        Text,
        Error
    };

    struct EvaluationResult {
        ResultKind kind = ResultKind::Text;
        std::string text;
    };

    struct EvaluationResponse {
        std::string container;
        std::string evaluation;
        EvaluationResult result;
        double evaluation_time_ms = 0.0;
    };

    struct EvaluationOutput {
        std::string container;
        std::string evaluation;
        std::string text;
    };

    struct ContainerDown {
        std::string container;
        std::string reason;
    };

    struct LocatorRequest {
        Locator locator;
    };

    struct ContainerRequest {
        std::string container;
    };

    enum class IntellisenseKind {
        Completion,  // hint: identifier prefix
        Details,     // hint: identifier
        Signature,   // hint: code up to the cursor, e.g. "print("
        Format       // hint: code to format
    };

    struct IntellisenseRequest {
        IntellisenseKind kind = IntellisenseKind::Completion;
        std::string hint;
    };

    struct IntellisenseQuery {
        std::string ref;
        IntellisenseRequest request;
        std::vector<Locator> parents;
    };

    struct IntellisenseResponse {
        std::string ref;
        nlohmann::json payload;
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(ResultKind, {
        {ResultKind::Text, "text"},
        {ResultKind::Error, "error"},
    })

    NLOHMANN_JSON_SERIALIZE_ENUM(IntellisenseKind, {
        {IntellisenseKind::Completion, "completion"},
        {IntellisenseKind::Details, "details"},
        {IntellisenseKind::Signature, "signature"},
        {IntellisenseKind::Format, "format"},
    })

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(Locator, container, evaluation)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(EvaluationOptions, file)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(EvaluationRequest, container, evaluation, code, parents, options)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(EvaluationResult, kind, text)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(EvaluationResponse, container, evaluation, result, evaluation_time_ms)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(EvaluationOutput, container, evaluation, text)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ContainerDown, container, reason)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LocatorRequest, locator)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ContainerRequest, container)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(IntellisenseRequest, kind, hint)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(IntellisenseQuery, ref, request, parents)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(IntellisenseResponse, ref, payload)

    inline bool operator<(const Locator& lhs, const Locator& rhs) {
        if (lhs.container != rhs.container) {
            return lhs.container < rhs.container;
        }
        return lhs.evaluation < rhs.evaluation;
    }

    inline bool operator==(const Locator& lhs, const Locator& rhs) {
        return lhs.container == rhs.container && lhs.evaluation == rhs.evaluation;
    }

} // namespace crucible::protocol
