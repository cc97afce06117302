#include "manager/node_manager.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>
#include "core/logging/logger.hpp"
#include "protocol/codec.hpp"
#include "server/runtime_server.hpp"
#include "transport/process.hpp"

namespace crucible::manager {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr int kReapIntervalMs = 100;

}  // namespace

NodeManager::NodeManager(std::unique_ptr<transport::UnixListener> listener,
                         ManagerOptions options)
    : listener_(std::move(listener)), options_(std::move(options)) {}

int NodeManager::run() {
    LOG_INFO("Management process started for " + options_.identity);

    while (true) {
        reap_servers();
        if (next_index_ > 0 && servers_.empty()) {
            LOG_INFO("No runtime servers left, management process exiting");
            return 0;
        }

        std::vector<pollfd> fds;
        fds.push_back(pollfd{listener_->fd(), POLLIN, 0});
        for (const auto& client : clients_) {
            fds.push_back(pollfd{client->fd(), POLLIN, 0});
        }

        const int ready = ::poll(fds.data(), fds.size(), kReapIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("Management process poll failed: ") + std::strerror(errno));
            return 1;
        }
        if (ready == 0) {
            continue;
        }

        if (fds[0].revents != 0) {
            auto accepted = listener_->accept();
            if (core::errors::is_error(accepted)) {
                LOG_WARN(core::errors::get_error(accepted).message);
            } else {
                clients_.push_back(core::errors::take_value(accepted));
            }
        }

        // Clients accepted above are polled on the next round.
        const std::size_t polled = fds.size() - 1;
        std::vector<bool> closed(clients_.size(), false);
        for (std::size_t i = 0; i < polled; ++i) {
            if (fds[i + 1].revents == 0) {
                continue;
            }
            auto drained = clients_[i]->drain();
            if (core::errors::is_error(drained)) {
                closed[i] = true;
                continue;
            }
            for (const json& request : core::errors::get_value(drained)) {
                handle_request(*clients_[i], request);
            }
        }

        std::vector<std::unique_ptr<transport::MessageChannel>> open;
        for (std::size_t i = 0; i < clients_.size(); ++i) {
            if (!closed[i]) {
                open.push_back(std::move(clients_[i]));
            }
        }
        clients_ = std::move(open);
    }
}

void NodeManager::handle_request(transport::MessageChannel& client, const json& request) {
    const std::string type = transport::message_type(request);
    json reply;
    if (type == protocol::kStartRuntimeServer) {
        auto started = start_runtime_server(request.value("options", json::object()));
        if (core::errors::is_error(started)) {
            reply = protocol::error_reply(core::errors::get_error(started));
        } else {
            reply = protocol::ok_reply(json{{"server", core::errors::get_value(started)}});
        }
    } else {
        reply = protocol::error_reply(CrucibleError{
            ErrorCategory::Input, "Unknown management request: " + type, "unknown_request"});
    }

    auto sent = client.send(reply);
    if (core::errors::is_error(sent)) {
        LOG_WARN("Failed to reply to " + type + ": " + core::errors::get_error(sent).message);
    }
}

core::errors::Result<protocol::ServerHandle> NodeManager::start_runtime_server(
    const json& server_options) {
    auto decoded = protocol::decode<server::ServerOptions>(server_options);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    server::ServerOptions options = core::errors::take_value(decoded);
    options.address =
        protocol::server_address(options_.socket_dir, options_.identity, next_index_ + 1);

    auto spawned = server::spawn_runtime_server(options);
    if (core::errors::is_error(spawned)) {
        return core::errors::get_error(spawned);
    }
    ++next_index_;
    const auto& handle = core::errors::get_value(spawned);
    servers_.insert(handle.pid);
    LOG_INFO("Started runtime server " + std::to_string(handle.pid) + " at " + handle.address);
    return handle;
}

void NodeManager::reap_servers() {
    while (true) {
        int status = 0;
        const pid_t pid = ::waitpid(-1, &status, WNOHANG);
        if (pid <= 0) {
            return;
        }
        if (servers_.erase(pid) != 0) {
            LOG_DEBUG("Runtime server " + std::to_string(pid) + " " +
                      transport::describe_exit_status(status));
        }
    }
}

}  // namespace crucible::manager
