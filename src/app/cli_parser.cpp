#include "cli_parser.hpp"
#include <system_error>

namespace crucible::app::cli {

    using namespace crucible::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::vector<std::string> cells;
        std::optional<std::string> container;
        std::optional<std::string> config;
        std::optional<std::string> socket_dir;
        bool verbose = false;
    };

    Result<RunCommand> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return CrucibleError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: crucible run --cell \"...\""};
        }

        std::string command = argv[1];
        if (command != "run") {
            return CrucibleError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and 'run' command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--cell") {
                if (i + 1 < args.size()) raw.cells.push_back(args[++i]);
                else return CrucibleError{ErrorCategory::Input, "Missing value for --cell", "missing_value"};
            } else if (args[i] == "--container") {
                if (i + 1 < args.size()) raw.container = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --container", "missing_value"};
            } else if (args[i] == "--config") {
                if (i + 1 < args.size()) raw.config = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --config", "missing_value"};
            } else if (args[i] == "--socket-dir") {
                if (i + 1 < args.size()) raw.socket_dir = args[++i];
                else return CrucibleError{ErrorCategory::Input, "Missing value for --socket-dir", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return CrucibleError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        RunCommand cmd;
        cmd.verbose = raw.verbose;

        if (raw.cells.empty()) {
            return CrucibleError{ErrorCategory::Input, "Must provide at least one --cell", "missing_required_flag"};
        }
        cmd.cells = std::move(raw.cells);

        if (raw.container) {
            if (raw.container->empty()) {
                return CrucibleError{ErrorCategory::Input, "--container must not be empty", "invalid_value"};
            }
            cmd.container = raw.container.value();
        }

        // Path validation
        if (raw.config) {
            std::filesystem::path p(raw.config.value());
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return CrucibleError{ErrorCategory::Input, "Config file does not exist or is not a regular file", "invalid_path"};
            }
            cmd.config_file = std::move(p);
        }

        if (raw.socket_dir) {
            if (raw.socket_dir->empty()) {
                return CrucibleError{ErrorCategory::Input, "--socket-dir must not be empty", "invalid_path"};
            }
            std::error_code path_ec;
            std::filesystem::path absolute = std::filesystem::absolute(raw.socket_dir.value(), path_ec);
            if (path_ec) {
                return CrucibleError{ErrorCategory::Input, "Failed to resolve the socket directory", "invalid_path"};
            }
            cmd.socket_dir = std::move(absolute);
        }

        return cmd;
    }

} // namespace crucible::app::cli
