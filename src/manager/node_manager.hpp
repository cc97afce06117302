#pragma once

#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "transport/message_channel.hpp"

namespace crucible::manager {

struct ManagerOptions {
    std::string identity;
    std::string socket_dir;
    std::string log_level = "info";
};

NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ManagerOptions, identity, socket_dir, log_level)

// The management process of a runtime node. Starts one runtime server per
// connection and exits once it started at least one and all of them are
// gone.
class NodeManager {
public:
    NodeManager(std::unique_ptr<transport::UnixListener> listener, ManagerOptions options);

    int run();

    std::size_t live_servers() const { return servers_.size(); }

private:
    void handle_request(transport::MessageChannel& client, const nlohmann::json& request);
    core::errors::Result<protocol::ServerHandle> start_runtime_server(
        const nlohmann::json& server_options);
    void reap_servers();

    std::unique_ptr<transport::UnixListener> listener_;
    ManagerOptions options_;
    std::vector<std::unique_ptr<transport::MessageChannel>> clients_;
    std::set<pid_t> servers_;
    int next_index_ = 0;
};

}  // namespace crucible::manager
