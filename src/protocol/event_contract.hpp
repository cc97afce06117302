#pragma once
#include <string>
#include <variant>
#include "protocol/evaluation_contract.hpp"

namespace crucible::protocol {

    // The owner lost its runtime: the server, manager or node went away.
    struct RuntimeDown {
        std::string reason;
    };

    // Everything a connection owner can receive, delivered in order.
    // A RuntimeEvent is exactly ONE of the types listed below.
    using RuntimeEvent = std::variant<
        EvaluationOutput,
        EvaluationResponse,
        ContainerDown,
        IntellisenseResponse,
        RuntimeDown
    >;

} // namespace crucible::protocol
