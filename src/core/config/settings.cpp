#include "core/config/settings.hpp"

#include <fstream>
#include <system_error>
#include <nlohmann/json.hpp>

#ifndef CRUCIBLE_NODE_EXECUTABLE
#define CRUCIBLE_NODE_EXECUTABLE "crucible_node"
#endif
#ifndef CRUCIBLE_RUNTIME_MODULE
#define CRUCIBLE_RUNTIME_MODULE "libcrucible_runtime_module.so"
#endif

namespace crucible::core::config {

using errors::CrucibleError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kRuntimeUnitName = "crucible_runtime_module";

std::filesystem::path default_socket_dir() {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    return base / "crucible";
}

errors::Status read_millis(const json& doc, const char* key,
                           std::chrono::milliseconds& out) {
    if (!doc.contains(key)) {
        return errors::ok();
    }
    const auto& value = doc.at(key);
    if (!value.is_number_unsigned()) {
        return CrucibleError{ErrorCategory::Input,
                             std::string("Setting '") + key +
                                 "' must be a non-negative integer (milliseconds).",
                             "invalid_setting"};
    }
    out = std::chrono::milliseconds(value.get<std::uint64_t>());
    return errors::ok();
}

}  // namespace

RuntimeSettings default_settings() {
    RuntimeSettings settings;
    settings.node_executable = CRUCIBLE_NODE_EXECUTABLE;
    settings.code_units.push_back(
        CodeUnitSpec{kRuntimeUnitName, CRUCIBLE_RUNTIME_MODULE});
    settings.socket_dir = default_socket_dir();
    return settings;
}

errors::Result<RuntimeSettings> load_settings_file(
    const std::filesystem::path& path, RuntimeSettings base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return CrucibleError{ErrorCategory::Input,
                             "Unable to open settings file: " + path.string(),
                             "settings_open_failed"};
    }

    const json doc = json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return CrucibleError{ErrorCategory::Input,
                             "Settings file is not a JSON object: " + path.string(),
                             "settings_parse_failed"};
    }

    if (doc.contains("node_executable")) {
        if (!doc["node_executable"].is_string()) {
            return CrucibleError{ErrorCategory::Input,
                                 "Setting 'node_executable' must be a string.",
                                 "invalid_setting"};
        }
        base.node_executable = doc["node_executable"].get<std::string>();
    }
    if (doc.contains("socket_dir")) {
        if (!doc["socket_dir"].is_string()) {
            return CrucibleError{ErrorCategory::Input,
                                 "Setting 'socket_dir' must be a string.",
                                 "invalid_setting"};
        }
        base.socket_dir = doc["socket_dir"].get<std::string>();
    }
    if (doc.contains("code_units")) {
        const auto& units = doc["code_units"];
        if (!units.is_array()) {
            return CrucibleError{ErrorCategory::Input,
                                 "Setting 'code_units' must be an array.",
                                 "invalid_setting"};
        }
        std::vector<CodeUnitSpec> parsed;
        for (const auto& unit : units) {
            if (!unit.is_object() || !unit.contains("name") || !unit.contains("path") ||
                !unit["name"].is_string() || !unit["path"].is_string()) {
                return CrucibleError{ErrorCategory::Input,
                                     "Each code unit needs string 'name' and 'path'.",
                                     "invalid_setting"};
            }
            parsed.push_back(CodeUnitSpec{unit["name"].get<std::string>(),
                                          unit["path"].get<std::string>()});
        }
        if (parsed.empty()) {
            return CrucibleError{ErrorCategory::Input,
                                 "At least one code unit is required.",
                                 "invalid_setting"};
        }
        base.code_units = std::move(parsed);
    }
    if (doc.contains("log_level")) {
        logging::LogLevel level;
        if (!doc["log_level"].is_string() ||
            !logging::parse_log_level(doc["log_level"].get<std::string>(), level)) {
            return CrucibleError{ErrorCategory::Input,
                                 "Setting 'log_level' must be one of debug, info, warn, error.",
                                 "invalid_setting"};
        }
        base.log_level = level;
    }

    for (auto [key, target] :
         {std::pair{"connect_timeout_ms", &base.connect_timeout},
          std::pair{"ack_timeout_ms", &base.ack_timeout},
          std::pair{"name_buffer_time_ms", &base.name_buffer_time},
          std::pair{"await_owner_timeout_ms", &base.await_owner_timeout},
          std::pair{"request_timeout_ms", &base.request_timeout}}) {
        auto status = read_millis(doc, key, *target);
        if (errors::is_error(status)) {
            return errors::get_error(status);
        }
    }

    return base;
}

}  // namespace crucible::core::config
