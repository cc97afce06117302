#include "node/node_options.hpp"
#include <optional>
#include <vector>
#include "core/logging/logger.hpp"

namespace crucible::node {

    using namespace crucible::core::errors;

    struct RawNodeOptions {
        std::optional<std::string> sname;
        std::optional<std::string> socket_dir;
        std::optional<std::string> eval;
        std::optional<std::string> log_level;
        std::optional<std::string> parent_address;
        std::optional<std::string> lifeline_fd;
    };

    Result<NodeOptions> parse_node_options(int argc, char* argv[]) {
        RawNodeOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Parser Phase
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--sname") {
                if (i + 1 < args.size()) raw.sname = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --sname", "missing_value"};
            } else if (args[i] == "--socket-dir") {
                if (i + 1 < args.size()) raw.socket_dir = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --socket-dir", "missing_value"};
            } else if (args[i] == "--eval") {
                if (i + 1 < args.size()) raw.eval = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --eval", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--lifeline-fd") {
                if (i + 1 < args.size()) raw.lifeline_fd = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --lifeline-fd", "missing_value"};
            } else if (args[i] == "--") {
                if (i + 2 == args.size()) raw.parent_address = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Expected exactly one parent address after --", "missing_value"};
            } else {
                return CrucibleError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 2. Validator Phase
        if (!raw.sname || raw.sname->empty()) {
            return CrucibleError{ErrorCategory::Input, "A node needs --sname", "missing_required_flag"};
        }
        if (!raw.socket_dir || raw.socket_dir->empty()) {
            return CrucibleError{ErrorCategory::Input, "A node needs --socket-dir", "missing_required_flag"};
        }
        if (!raw.eval) {
            return CrucibleError{ErrorCategory::Input, "A node needs an --eval init script", "missing_required_flag"};
        }
        if (!raw.parent_address || raw.parent_address->empty()) {
            return CrucibleError{ErrorCategory::Input, "A node needs the parent address after --", "missing_required_flag"};
        }

        NodeOptions options;
        options.identity = raw.sname.value();
        options.socket_dir = raw.socket_dir.value();
        options.init_script = raw.eval.value();
        options.parent_address = raw.parent_address.value();
        if (raw.lifeline_fd) {
            const std::string& text = raw.lifeline_fd.value();
            if (text.empty() || text.size() > 9 ||
                text.find_first_not_of("0123456789") != std::string::npos) {
                return CrucibleError{ErrorCategory::Input, "Invalid --lifeline-fd: " + text, "invalid_value"};
            }
            options.lifeline_fd = std::stoi(text);
        }
        if (raw.log_level) {
            core::logging::LogLevel level;
            if (!core::logging::parse_log_level(raw.log_level.value(), level)) {
                return CrucibleError{ErrorCategory::Input, "Invalid --log-level: " + raw.log_level.value(), "invalid_value",
                                     "Use one of debug, info, warn, error."};
            }
            options.log_level = raw.log_level.value();
        }
        return options;
    }

} // namespace crucible::node
