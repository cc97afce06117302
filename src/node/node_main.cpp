#include <string>
#include "core/errors/crucible_errors.hpp"
#include "core/logging/logger.hpp"
#include "node/node_controller.hpp"
#include "node/node_options.hpp"

int main(int argc, char* argv[]) {
    // 1. Parse the command line the coordinator built for us
    auto parsed = crucible::node::parse_node_options(argc, argv);
    if (crucible::core::errors::is_error(parsed)) {
        const auto& err = crucible::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    auto options = crucible::core::errors::take_value(parsed);

    // 2. Label every log line with our identity
    crucible::core::logging::Logger::get().set_process_label("node " + options.identity);
    crucible::core::logging::LogLevel level;
    if (crucible::core::logging::parse_log_level(options.log_level, level)) {
        crucible::core::logging::Logger::get().set_min_level(level);
    }

    // 3. Run the init script while serving control requests
    crucible::node::NodeController controller(std::move(options));
    return controller.run();
}
