#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/errors/crucible_errors.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "runtime/code_registry.hpp"
#include "transport/message_channel.hpp"

namespace crucible::runtime {

struct ManagerStatus {
    bool running = false;
    int pid = -1;
};

// Request/reply client for a node's control socket.
class NodeClient {
public:
    static core::errors::Result<std::unique_ptr<NodeClient>> connect(
        const std::string& address, std::chrono::milliseconds timeout);

    NodeClient(std::unique_ptr<transport::MessageChannel> channel,
               std::chrono::milliseconds timeout);

    core::errors::Result<bool> is_code_present(const std::string& unit);
    core::errors::Status load_code(const std::string& unit,
                                   const std::vector<std::uint8_t>& binary);
    core::errors::Result<std::string> platform_version();
    core::errors::Result<ManagerStatus> is_management_process_running();
    core::errors::Result<int> start_management_process(const nlohmann::json& options);
    core::errors::Result<protocol::ServerHandle> start_connection_server(
        const nlohmann::json& options);

    // Requests sent so far.
    std::size_t request_count() const { return requests_; }

private:
    core::errors::Result<nlohmann::json> call(const std::string& type, nlohmann::json body,
                                              core::errors::ErrorCategory category);

    std::unique_ptr<transport::MessageChannel> channel_;
    std::chrono::milliseconds timeout_;
    std::size_t requests_ = 0;
};

struct BootstrapOptions {
    // The first unit doubles as the marker probed to decide whether code
    // must be transferred at all.
    std::vector<core::config::CodeUnitSpec> code_units;
    nlohmann::json manager_options = nlohmann::json::object();
    nlohmann::json server_options = nlohmann::json::object();
};

struct BootstrapResult {
    protocol::ServerHandle server;
    int manager_pid = -1;
};

// Brings a node into a usable state: code loaded, management process
// running, and a fresh connection server for the caller. Steps already
// known to be satisfied are not probed again by the same instance.
class RuntimeBootstrap {
public:
    RuntimeBootstrap(NodeClient& client, BootstrapOptions options);

    core::errors::Result<BootstrapResult> initialize();

    bool code_known_present() const { return code_present_; }
    bool manager_known_running() const { return manager_pid_ > 0; }

private:
    core::errors::Status ensure_code();
    core::errors::Status ensure_manager();

    NodeClient& client_;
    BootstrapOptions options_;
    bool code_present_ = false;
    int manager_pid_ = -1;
};

// Error for a unit the node refused to load. A platform difference between
// coordinator and node is reported as "version_mismatch", anything else as
// "code_load_failed".
core::errors::CrucibleError describe_load_failure(const std::string& unit,
                                                  const std::string& reason,
                                                  const std::string& local_version,
                                                  const std::string& remote_version);

}  // namespace crucible::runtime
