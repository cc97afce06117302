#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "core/errors/crucible_errors.hpp"
#include "protocol/evaluation_contract.hpp"
#include "protocol/event_contract.hpp"
#include "runtime/handshake.hpp"
#include "runtime/identifier_pool.hpp"
#include "session/server_client.hpp"

namespace crucible::session {

using Description = std::vector<std::pair<std::string, std::string>>;

// A connected runtime as seen by its owner. The owner and the runtime are
// tied together: destroying the connection shuts the runtime down, and a
// runtime that goes away surfaces as exactly one RuntimeDown event.
class RuntimeConnection {
public:
    RuntimeConnection(runtime::ConnectedRuntime runtime, std::unique_ptr<ServerClient> client,
                      std::shared_ptr<runtime::IdentifierPool> pool);
    ~RuntimeConnection();

    RuntimeConnection(const RuntimeConnection&) = delete;
    RuntimeConnection& operator=(const RuntimeConnection&) = delete;

    core::errors::Status take_ownership();

    core::errors::Status evaluate(const protocol::EvaluationRequest& request);
    core::errors::Status forget_evaluation(const protocol::Locator& locator);
    core::errors::Status drop_container(const std::string& container);
    core::errors::Result<std::string> request_intellisense(
        const protocol::IntellisenseRequest& request,
        const std::vector<protocol::Locator>& parents);

    std::optional<protocol::RuntimeEvent> next_event(std::chrono::milliseconds timeout);

    // Stops the server and waits for the node to exit, killing it if it
    // takes longer than `grace`.
    void disconnect(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    bool connected() const;
    Description describe() const;

    const runtime::RuntimeIdentity& identity() const { return identity_; }
    pid_t node_pid() const { return node_pid_; }
    const protocol::ServerHandle& server() const { return server_; }

private:
    void watch_node();
    void release_node(std::chrono::milliseconds grace);

    runtime::RuntimeIdentity identity_;
    transport::ChildProcess process_;
    pid_t node_pid_;
    std::string node_address_;
    protocol::ServerHandle server_;
    int manager_pid_;
    std::unique_ptr<ServerClient> client_;
    std::shared_ptr<runtime::IdentifierPool> pool_;

    std::atomic<bool> stop_watching_{false};
    std::atomic<bool> released_{false};
    bool disconnected_ = false;
    std::thread watcher_;
};

}  // namespace crucible::session
