#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/crucible_errors.hpp"
#include "core/logging/logger.hpp"

namespace crucible::core::config {

// A code unit the coordinator transfers onto every runtime it bootstraps.
struct CodeUnitSpec {
    std::string name;
    std::filesystem::path path;
};

struct RuntimeSettings {
    std::filesystem::path node_executable;
    std::vector<CodeUnitSpec> code_units;
    std::filesystem::path socket_dir;
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds ack_timeout{10000};
    std::chrono::milliseconds name_buffer_time{60000};
    std::chrono::milliseconds await_owner_timeout{5000};
    std::chrono::milliseconds request_timeout{30000};
    logging::LogLevel log_level = logging::LogLevel::INFO;
};

// Compiled-in defaults pointing at the node executable and runtime code
// unit produced by the same build.
RuntimeSettings default_settings();

// Overlays the keys present in a JSON settings file on top of `base`.
errors::Result<RuntimeSettings> load_settings_file(
    const std::filesystem::path& path, RuntimeSettings base = default_settings());

}  // namespace crucible::core::config
