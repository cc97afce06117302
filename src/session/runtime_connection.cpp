#include "session/runtime_connection.hpp"

#include <poll.h>
#include "core/logging/logger.hpp"

namespace crucible::session {

namespace {

constexpr int kWatchIntervalMs = 50;
constexpr auto kOwnershipTimeout = std::chrono::milliseconds(5000);
constexpr auto kRemoteExitGrace = std::chrono::milliseconds(2000);

}  // namespace

RuntimeConnection::RuntimeConnection(runtime::ConnectedRuntime runtime,
                                     std::unique_ptr<ServerClient> client,
                                     std::shared_ptr<runtime::IdentifierPool> pool)
    : identity_(std::move(runtime.identity)),
      process_(std::move(runtime.process)),
      node_pid_(process_.pid()),
      node_address_(std::move(runtime.node_address)),
      server_(std::move(runtime.server)),
      manager_pid_(runtime.manager_pid),
      client_(std::move(client)),
      pool_(std::move(pool)),
      watcher_([this] { watch_node(); }) {}

RuntimeConnection::~RuntimeConnection() {
    disconnect();
}

core::errors::Status RuntimeConnection::take_ownership() {
    return client_->take_ownership(kOwnershipTimeout);
}

core::errors::Status RuntimeConnection::evaluate(const protocol::EvaluationRequest& request) {
    return client_->evaluate(request);
}

core::errors::Status RuntimeConnection::forget_evaluation(const protocol::Locator& locator) {
    return client_->forget_evaluation(locator);
}

core::errors::Status RuntimeConnection::drop_container(const std::string& container) {
    return client_->drop_container(container);
}

core::errors::Result<std::string> RuntimeConnection::request_intellisense(
    const protocol::IntellisenseRequest& request,
    const std::vector<protocol::Locator>& parents) {
    return client_->request_intellisense(request, parents);
}

std::optional<protocol::RuntimeEvent> RuntimeConnection::next_event(
    const std::chrono::milliseconds timeout) {
    return client_->next_event(timeout);
}

void RuntimeConnection::disconnect(const std::chrono::milliseconds grace) {
    if (disconnected_) {
        return;
    }
    disconnected_ = true;

    client_->stop();
    stop_watching_ = true;
    if (watcher_.joinable()) {
        watcher_.join();
    }
    release_node(grace);
    client_->close();
    LOG_INFO("Disconnected runtime " + identity_.name);
}

bool RuntimeConnection::connected() const {
    return !disconnected_ && !client_->is_down();
}

Description RuntimeConnection::describe() const {
    return Description{
        {"Type", "Standalone"},
        {"Name", identity_.name},
        {"Node pid", std::to_string(node_pid_)},
        {"Manager pid", std::to_string(manager_pid_)},
        {"Control address", node_address_},
        {"Server address", server_.address},
    };
}

void RuntimeConnection::watch_node() {
    std::string partial;
    while (!stop_watching_) {
        if (process_.output_fd() >= 0) {
            pollfd pfd{process_.output_fd(), POLLIN, 0};
            static_cast<void>(::poll(&pfd, 1, kWatchIntervalMs));
            runtime::relay_runtime_output(process_, partial);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(kWatchIntervalMs));
        }

        // The server connection is the liveness signal: it closes when the
        // server, the manager or the node goes away.
        if (client_->is_down()) {
            release_node(kRemoteExitGrace);
            return;
        }
    }
}

void RuntimeConnection::release_node(const std::chrono::milliseconds grace) {
    if (released_.exchange(true)) {
        return;
    }
    const int status = process_.wait_or_kill(grace);
    std::string rest;
    runtime::relay_runtime_output(process_, rest);
    LOG_DEBUG("Runtime node " + identity_.name + " " + transport::describe_exit_status(status));
    pool_->notify_disconnected(identity_.name);
}

}  // namespace crucible::session
