#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/crucible_errors.hpp"

namespace crucible::app::cli {

    // Normalized `crucible run` invocation.
    struct RunCommand {
        std::vector<std::string> cells;
        std::string container = "main";
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> socket_dir;
        bool verbose = false;
    };

    crucible::core::errors::Result<RunCommand> parse_and_validate(int argc, char* argv[]);

} // namespace crucible::app::cli
