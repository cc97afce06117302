#include "protocol/init_script.hpp"

#include <charconv>
#include <cstdint>
#include <sstream>

namespace crucible::protocol {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;

namespace {

std::string trim(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

core::errors::Result<std::chrono::milliseconds> parse_millis(const std::string& text,
                                                            const std::string& directive) {
    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return CrucibleError{ErrorCategory::Input,
                             "Directive '" + directive + "' needs a duration in milliseconds.",
                             "invalid_init_script"};
    }
    return std::chrono::milliseconds(value);
}

}  // namespace

std::string child_init_script(const std::chrono::milliseconds ack_timeout) {
    return "ready;await_ack " + std::to_string(ack_timeout.count()) + ";await_manager";
}

core::errors::Result<std::vector<Directive>> parse_init_script(const std::string& script) {
    if (contains_newline(script)) {
        return CrucibleError{ErrorCategory::Input,
                             "Init script must not contain newlines.",
                             "invalid_init_script"};
    }

    std::vector<Directive> directives;
    std::istringstream in(script);
    std::string statement;
    while (std::getline(in, statement, ';')) {
        statement = trim(statement);
        if (statement.empty()) {
            continue;
        }

        const auto space = statement.find(' ');
        const std::string name = statement.substr(0, space);
        const std::string argument =
            space == std::string::npos ? "" : trim(statement.substr(space + 1));

        if (name == "ready" || name == "await_manager") {
            if (!argument.empty()) {
                return CrucibleError{ErrorCategory::Input,
                                     "Directive '" + name + "' takes no argument.",
                                     "invalid_init_script"};
            }
            directives.push_back(Directive{
                name == "ready" ? DirectiveKind::Ready : DirectiveKind::AwaitManager});
        } else if (name == "await_ack" || name == "sleep") {
            auto duration = parse_millis(argument, name);
            if (core::errors::is_error(duration)) {
                return core::errors::get_error(duration);
            }
            directives.push_back(Directive{
                name == "await_ack" ? DirectiveKind::AwaitAck : DirectiveKind::Sleep,
                core::errors::get_value(duration)});
        } else {
            return CrucibleError{ErrorCategory::Input,
                                 "Unknown init directive: " + name,
                                 "invalid_init_script"};
        }
    }

    if (directives.empty()) {
        return CrucibleError{ErrorCategory::Input, "Init script is empty.",
                             "invalid_init_script"};
    }
    return directives;
}

}  // namespace crucible::protocol
