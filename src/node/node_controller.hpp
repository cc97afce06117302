#pragma once

#include <sys/types.h>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "node/node_options.hpp"
#include "protocol/init_script.hpp"
#include "runtime/code_registry.hpp"
#include "transport/message_channel.hpp"

namespace crucible::node {

// A runtime node. Serves the control socket the coordinator bootstraps it
// through, while running its init script one directive at a time.
class NodeController {
public:
    explicit NodeController(NodeOptions options);
    ~NodeController();

    NodeController(const NodeController&) = delete;
    NodeController& operator=(const NodeController&) = delete;

    // Returns the process exit code.
    int run();

private:
    enum class WaitOutcome {
        Done,
        TimedOut,
        Failed
    };

    core::errors::Status announce_ready();
    WaitOutcome await_ack(std::chrono::milliseconds timeout);
    WaitOutcome await_manager();

    // Serves control requests until `done` returns true or the deadline
    // passes.
    WaitOutcome serve_until(const std::function<bool()>& done,
                            std::chrono::steady_clock::time_point deadline);
    void serve_clients(const std::vector<int>& ready_fds);
    nlohmann::json handle_request(const nlohmann::json& request);
    void check_manager();

    core::errors::Result<pid_t> start_manager(const nlohmann::json& options);
    core::errors::Result<nlohmann::json> start_connection_server(const nlohmann::json& options);

    NodeOptions options_;
    std::string address_;
    std::unique_ptr<transport::UnixListener> control_;
    std::vector<std::unique_ptr<transport::MessageChannel>> clients_;
    std::unique_ptr<transport::MessageChannel> parent_;
    std::string ready_ref_;
    bool acknowledged_ = false;

    runtime::CodeRegistry registry_;
    pid_t manager_pid_ = -1;
    bool manager_exited_ = false;
    std::unique_ptr<transport::MessageChannel> manager_channel_;
};

}  // namespace crucible::node
