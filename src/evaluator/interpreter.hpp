#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/evaluation_contract.hpp"

namespace crucible::evaluator {

// Side effects evaluated code may trigger.
struct EvaluationHooks {
    std::function<void(const std::string&)> on_output;
    // Terminates the hosting process. If it returns, exit() fails as an error.
    std::function<void(int)> on_exit;
};

struct EvaluationOutcome {
    protocol::EvaluationResult result;
    // Bindings visible to evaluations that use this one as a parent. On
    // error these are the incoming bindings, untouched.
    nlohmann::json bindings = nlohmann::json::object();
};

struct BuiltinInfo {
    std::string name;
    std::string signature;
    std::string doc;
    std::size_t arity;
};

const std::vector<BuiltinInfo>& builtin_functions();

// Runs `code` against `context` (a JSON object of name -> value). `file`
// prefixes error locations, e.g. "cell:3: undefined name 'x'".
EvaluationOutcome evaluate_code(const std::string& code, const std::string& file,
                                const nlohmann::json& context,
                                const EvaluationHooks& hooks);

// Adds the bindings of `from` that `into` does not define yet. Folding
// parents nearest-first with this keeps the nearest definition of a name.
void merge_missing(nlohmann::json& into, const nlohmann::json& from);

// Text form used by print() and str().
std::string render_value(const nlohmann::json& value);

}  // namespace crucible::evaluator
