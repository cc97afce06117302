#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "protocol/evaluation_contract.hpp"

namespace crucible::evaluator {

// Answers an editor side request from a bindings snapshot. Never evaluates
// code and never modifies `context`.
//
//   completion -> {"items": [{"label", "kind", "detail"}]}
//   details    -> {"name", "kind", "contents"} or null
//   signature  -> {"name", "signature", "active_argument"} or null
//   format     -> {"code"} or {"error"}
nlohmann::json handle_intellisense(const protocol::IntellisenseRequest& request,
                                   const nlohmann::json& context);

// Canonical layout: one statement per line, single spaces around '=' and
// '+', a space after each comma.
core::errors::Result<std::string> format_code(const std::string& code);

}  // namespace crucible::evaluator
