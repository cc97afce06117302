#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <vector>
#include "core/errors/crucible_errors.hpp"

namespace crucible::protocol {

// The script a node runs right after it starts, passed on its command line.
// It is a ';'-separated list of directives and must stay on one line: some
// shells mangle arguments that contain newlines.
enum class DirectiveKind {
    Ready,         // connect to the parent address and announce readiness
    AwaitAck,      // wait (bounded) for the parent's acknowledgement
    AwaitManager,  // block until the management process terminates
    Sleep          // keep serving control requests for a while
};

struct Directive {
    DirectiveKind kind;
    std::chrono::milliseconds duration{0};
};

constexpr bool contains_newline(std::string_view text) {
    for (const char c : text) {
        if (c == '\n' || c == '\r') {
            return true;
        }
    }
    return false;
}

inline constexpr std::string_view kChildInitScript =
    "ready;await_ack 10000;await_manager";

static_assert(!contains_newline(kChildInitScript),
              "the child init script must not contain newlines");

// Child init script with a custom acknowledgement timeout.
std::string child_init_script(std::chrono::milliseconds ack_timeout);

core::errors::Result<std::vector<Directive>> parse_init_script(const std::string& script);

}  // namespace crucible::protocol
