#include <memory>
#include <string>
#include <type_traits>
#include <nlohmann/json.hpp>
#include "core/logging/logger.hpp"
#include "manager/node_manager.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "protocol/codec.hpp"
#include "transport/message_channel.hpp"

// Entry point the node resolves in this code unit after loading it. Runs the
// management process on an already listening socket and returns its exit
// code.
extern "C" int crucible_manager_main(int listen_fd, const char* options_json) {
    using crucible::core::logging::Logger;
    using nlohmann::json;

    const json document = json::parse(options_json != nullptr ? options_json : "",
                                      nullptr, false);
    auto decoded = crucible::protocol::decode<crucible::manager::ManagerOptions>(document);
    if (crucible::core::errors::is_error(decoded)) {
        LOG_ERROR("Invalid management options: " +
                  crucible::core::errors::get_error(decoded).message);
        return 2;
    }
    auto options = crucible::core::errors::take_value(decoded);

    Logger::get().set_process_label("manager " + options.identity);
    crucible::core::logging::LogLevel level;
    if (crucible::core::logging::parse_log_level(options.log_level, level)) {
        Logger::get().set_min_level(level);
    }

    auto listener = std::make_unique<crucible::transport::UnixListener>(
        listen_fd, crucible::protocol::manager_address(options.socket_dir, options.identity),
        true);
    crucible::manager::NodeManager manager(std::move(listener), std::move(options));
    return manager.run();
}

// The node calls the resolved symbol through ManagerEntry.
static_assert(std::is_same_v<decltype(&crucible_manager_main), crucible::protocol::ManagerEntry>,
              "manager entry signature drifted");
