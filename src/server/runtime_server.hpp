#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "protocol/evaluation_contract.hpp"
#include "protocol/worker_contract.hpp"
#include "server/evaluator_supervisor.hpp"
#include "transport/message_channel.hpp"

namespace crucible::server {

struct ServerOptions {
    std::string address;
    std::chrono::milliseconds await_owner_timeout{5000};
};

inline void to_json(nlohmann::json& j, const ServerOptions& options) {
    j = nlohmann::json{{"address", options.address},
                       {"await_owner_timeout_ms", options.await_owner_timeout.count()}};
}

inline void from_json(const nlohmann::json& j, ServerOptions& options) {
    options.address = j.value("address", std::string());
    options.await_owner_timeout =
        std::chrono::milliseconds(j.value("await_owner_timeout_ms", std::int64_t{5000}));
}

// Per-connection server. The first client to connect owns it; the server
// runs the owner's evaluations in one evaluator process per container and
// exits when the owner goes away.
class RuntimeServer {
public:
    RuntimeServer(std::unique_ptr<transport::UnixListener> listener, ServerOptions options);
    ~RuntimeServer();

    RuntimeServer(const RuntimeServer&) = delete;
    RuntimeServer& operator=(const RuntimeServer&) = delete;

    // Serves until the owner disconnects or asks to stop. Returns the
    // process exit code.
    int run();

private:
    struct QueuedJob {
        bool forget = false;
        protocol::EvaluationRequest request;  // run job
        std::string evaluation;               // forget job
    };

    struct ContainerSlot {
        std::optional<WorkerHandle> worker;
        std::deque<QueuedJob> queue;
        std::optional<std::string> in_flight;
    };

    bool accept_connection();
    bool handle_owner_messages();
    bool handle_owner_message(const nlohmann::json& message);
    bool handle_worker_messages(const std::string& container);

    void enqueue(const std::string& container, QueuedJob job);
    void pump(const std::string& container);
    bool ensure_worker(const std::string& container, ContainerSlot& slot);
    protocol::WorkerJob build_job(const protocol::EvaluationRequest& request) const;

    void worker_down(const std::string& container);
    void drop_container(const std::string& container);
    void forget_snapshots(const std::string& container);
    nlohmann::json fold_snapshots(const std::vector<protocol::Locator>& parents) const;

    bool emit(const nlohmann::json& event);
    void shutdown();

    std::unique_ptr<transport::UnixListener> listener_;
    ServerOptions options_;
    std::unique_ptr<transport::MessageChannel> owner_;
    bool running_ = true;

    EvaluatorSupervisor supervisor_;
    std::map<std::string, ContainerSlot> slots_;
    std::map<protocol::Locator, nlohmann::json> snapshots_;
};

// Binds the server address, then forks the server process. The listener
// exists before this returns, so the owner can connect right away. The
// caller is responsible for reaping the returned pid.
core::errors::Result<protocol::ServerHandle> spawn_runtime_server(const ServerOptions& options);

}  // namespace crucible::server
