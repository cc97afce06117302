#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include "app/cli_parser.hpp"
#include "core/config/settings.hpp"
#include "core/config/short_id.hpp"
#include "core/errors/crucible_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/evaluation_contract.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/identifier_pool.hpp"
#include "session/standalone_runtime.hpp"

namespace {

constexpr auto kEventPollInterval = std::chrono::milliseconds(500);

enum class CellOutcome {
    Success,
    Failed,
    ContainerLost,
    RuntimeLost
};

// Blocks until the response for `evaluation` arrives, logging output on the way.
CellOutcome await_cell(crucible::session::RuntimeConnection& connection,
                       const std::string& container, const std::string& evaluation) {
    while (true) {
        auto event = connection.next_event(kEventPollInterval);
        if (!event) {
            continue;
        }

        CellOutcome outcome = CellOutcome::Success;
        bool finished = false;
        std::visit([&](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, crucible::protocol::EvaluationOutput>) {
                LOG_INFO("  output: " + e.text);
            } else if constexpr (std::is_same_v<T, crucible::protocol::EvaluationResponse>) {
                if (e.evaluation != evaluation) {
                    return;
                }
                finished = true;
                if (e.result.kind == crucible::protocol::ResultKind::Error) {
                    LOG_ERROR("Cell " + evaluation + " failed: " + e.result.text);
                    outcome = CellOutcome::Failed;
                } else {
                    LOG_INFO("Cell " + evaluation + " => " + e.result.text);
                }
                LOG_DEBUG("Cell " + evaluation + " took " +
                          std::to_string(e.evaluation_time_ms) + " ms");
            } else if constexpr (std::is_same_v<T, crucible::protocol::ContainerDown>) {
                if (e.container != container) {
                    return;
                }
                finished = true;
                LOG_ERROR("Container " + e.container + " went down: " + e.reason);
                outcome = CellOutcome::ContainerLost;
            } else if constexpr (std::is_same_v<T, crucible::protocol::RuntimeDown>) {
                finished = true;
                LOG_ERROR("Runtime went down: " + e.reason);
                outcome = CellOutcome::RuntimeLost;
            }
        }, *event);

        if (finished) {
            return outcome;
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Label this process for the shared logger
    crucible::core::logging::Logger::get().set_process_label(
        "coordinator " + crucible::core::config::generate_short_id());

    // 2. Parse CLI input and return normalized input errors
    LOG_DEBUG("Crucible coordinator: Bootstrapping...");
    auto parsed = crucible::app::cli::parse_and_validate(argc, argv);
    if (crucible::core::errors::is_error(parsed)) {
        const auto& err = crucible::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& cmd = crucible::core::errors::get_value(parsed);

    // 3. Settings: compiled-in defaults, then the config file, then flags
    crucible::core::config::RuntimeSettings settings = crucible::core::config::default_settings();
    if (cmd.config_file) {
        auto loaded = crucible::core::config::load_settings_file(*cmd.config_file, settings);
        if (crucible::core::errors::is_error(loaded)) {
            const auto& err = crucible::core::errors::get_error(loaded);
            LOG_ERROR("Input error [" + err.code + "]: " + err.message);
            return 2;
        }
        settings = crucible::core::errors::take_value(loaded);
    }
    if (cmd.socket_dir) {
        settings.socket_dir = *cmd.socket_dir;
    }
    if (cmd.verbose) {
        settings.log_level = crucible::core::logging::LogLevel::DEBUG;
    }
    crucible::core::logging::Logger::get().set_min_level(settings.log_level);

    // 4. Start the runtime
    auto pool = std::make_shared<crucible::runtime::IdentifierPool>(settings.name_buffer_time);
    crucible::session::StandaloneRuntime runtime(settings, pool);
    for (const auto& [key, value] : runtime.describe()) {
        LOG_DEBUG(key + ": " + value);
    }

    auto connected = runtime.connect();
    if (crucible::core::errors::is_error(connected)) {
        const auto& err = crucible::core::errors::get_error(connected);
        LOG_ERROR("Failed to start runtime [" + err.code + "] (" +
                  crucible::core::errors::to_string(err.category) + "): " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 3;
    }
    auto connection = crucible::core::errors::take_value(connected);
    LOG_INFO("Runtime started: " + connection->identity().name);

    // 5. Evaluate the cells in order, each seeing the bindings of the ones before
    int exit_code = 0;
    std::vector<crucible::protocol::Locator> parents;
    for (size_t i = 0; i < cmd.cells.size(); ++i) {
        const std::string evaluation = "cell-" + std::to_string(i + 1);

        crucible::protocol::EvaluationRequest request;
        request.container = cmd.container;
        request.evaluation = evaluation;
        request.code = cmd.cells[i];
        request.parents = parents;
        request.options.file = evaluation;

        auto sent = connection->evaluate(request);
        if (crucible::core::errors::is_error(sent)) {
            const auto& err = crucible::core::errors::get_error(sent);
            LOG_ERROR("Failed to submit " + evaluation + " [" + err.code + "]: " + err.message);
            exit_code = 4;
            break;
        }

        const CellOutcome outcome = await_cell(*connection, cmd.container, evaluation);
        if (outcome == CellOutcome::RuntimeLost) {
            exit_code = 4;
            break;
        }
        if (outcome == CellOutcome::ContainerLost) {
            // The container restarts empty; earlier bindings are gone.
            parents.clear();
            exit_code = 1;
            continue;
        }
        if (outcome == CellOutcome::Failed) {
            exit_code = 1;
        }
        parents.insert(parents.begin(), crucible::protocol::Locator{cmd.container, evaluation});
    }

    connection->disconnect();
    return exit_code;
}
