#include "runtime/handshake.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"
#include "protocol/codec.hpp"

namespace crucible::runtime {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);

}  // namespace

bool relay_runtime_output(transport::ChildProcess& process, std::string& partial_line) {
    const bool open = process.drain_output(partial_line);
    std::size_t newline;
    while ((newline = partial_line.find('\n')) != std::string::npos) {
        LOG_DEBUG("[runtime " + std::to_string(process.pid()) + "] " +
                  partial_line.substr(0, newline));
        partial_line.erase(0, newline + 1);
    }
    if (!open && !partial_line.empty()) {
        LOG_DEBUG("[runtime " + std::to_string(process.pid()) + "] " + partial_line);
        partial_line.clear();
    }
    return open;
}

HandshakeProtocol::HandshakeProtocol(IdentifierPool& pool) : pool_(pool) {}

core::errors::Result<ConnectedRuntime> HandshakeProtocol::connect(
    const HandshakeOptions& options) {
    // 1. Nothing is acquired for an executable that cannot run.
    if (::access(options.node_executable.c_str(), X_OK) != 0) {
        return CrucibleError{ErrorCategory::Spawn,
                             "No runtime executable found at " +
                                 options.node_executable.string(),
                             "executable_not_found",
                             "Check the node_executable setting."};
    }
    if (protocol::contains_newline(options.init_script)) {
        return CrucibleError{ErrorCategory::Input, "Init script must not contain newlines.",
                             "invalid_init_script"};
    }

    // 2. Identity
    const RuntimeIdentity identity =
        options.external_identity ? IdentifierPool::external(*options.external_identity)
                                  : pool_.acquire(options.base_label);
    const auto release_identity = [this, &identity]() {
        pool_.notify_disconnected(identity.name);
    };

    // 3. Parent address and spawn
    const std::string parent_address =
        protocol::parent_address(options.socket_dir, identity.name);
    auto bound = transport::UnixListener::bind(parent_address);
    if (core::errors::is_error(bound)) {
        release_identity();
        return core::errors::get_error(bound);
    }
    auto listener = core::errors::take_value(bound);

    transport::SpawnRequest request;
    request.executable = options.node_executable;
    request.args = {"--sname", identity.name,
                    "--socket-dir", options.socket_dir.string(),
                    "--eval", options.init_script,
                    "--log-level", options.log_level,
                    "--", parent_address};
    // The node outlives neither this process nor the handle we return,
    // whichever thread we are called from.
    request.lifeline_flag = "--lifeline-fd";
    auto spawned = transport::spawn_executable(request);
    if (core::errors::is_error(spawned)) {
        release_identity();
        return core::errors::get_error(spawned);
    }
    transport::ChildProcess child = core::errors::take_value(spawned);
    LOG_DEBUG("Spawned runtime " + identity.name + " as pid " + std::to_string(child.pid()));

    const auto fail = [&](const CrucibleError& error) -> core::errors::Result<ConnectedRuntime> {
        child.wait_or_kill(std::chrono::milliseconds(0));
        release_identity();
        LOG_WARN("Runtime " + identity.name + " failed to connect: " + error.message);
        return error;
    };

    // 4. Wait for readiness, termination or the deadline
    auto ready = await_readiness(*listener, child, identity.name, options.connect_timeout);
    if (core::errors::is_error(ready)) {
        return fail(core::errors::get_error(ready));
    }
    Readiness readiness = core::errors::take_value(ready);

    // 5. Bootstrap through the announced control address
    auto client = NodeClient::connect(readiness.signal.address, options.request_timeout);
    if (core::errors::is_error(client)) {
        return fail(core::errors::get_error(client));
    }
    auto node = core::errors::take_value(client);
    RuntimeBootstrap bootstrap(*node, options.bootstrap);
    auto initialized = bootstrap.initialize();
    if (core::errors::is_error(initialized)) {
        return fail(core::errors::get_error(initialized));
    }

    // 6. Acknowledge so the node commits to its management process
    auto acked = readiness.channel->send(
        protocol::encode(protocol::kAckMessage, protocol::AckSignal{readiness.signal.ref}));
    if (core::errors::is_error(acked)) {
        return fail(core::errors::get_error(acked));
    }

    ConnectedRuntime connected;
    connected.identity = identity;
    connected.process = std::move(child);
    connected.node_address = readiness.signal.address;
    connected.server = core::errors::get_value(initialized).server;
    connected.manager_pid = core::errors::get_value(initialized).manager_pid;
    LOG_INFO("Runtime " + identity.name + " connected, server at " + connected.server.address);
    return connected;
}

core::errors::Result<HandshakeProtocol::Readiness> HandshakeProtocol::await_readiness(
    transport::UnixListener& listener, transport::ChildProcess& child,
    const std::string& identity, const std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<std::unique_ptr<transport::MessageChannel>> pending;
    std::string output;

    while (true) {
        std::vector<pollfd> fds;
        fds.push_back(pollfd{listener.fd(), POLLIN, 0});
        if (child.output_fd() >= 0) {
            fds.push_back(pollfd{child.output_fd(), POLLIN, 0});
        }
        for (const auto& connection : pending) {
            fds.push_back(pollfd{connection->fd(), POLLIN, 0});
        }

        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        const auto wait = std::max(std::chrono::milliseconds(0),
                                   std::min(kPollInterval, remaining));
        const int polled = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
        if (polled < 0 && errno != EINTR) {
            return CrucibleError{ErrorCategory::Internal,
                                 std::string("Handshake poll failed: ") + std::strerror(errno),
                                 "poll_failed"};
        }

        relay_runtime_output(child, output);

        if (polled > 0 && (fds[0].revents & POLLIN) != 0) {
            auto accepted = listener.accept();
            if (core::errors::is_error(accepted)) {
                LOG_WARN(core::errors::get_error(accepted).message);
            } else {
                pending.push_back(core::errors::take_value(accepted));
            }
        }

        // Readiness wins over termination observed in the same round.
        for (auto it = pending.begin(); it != pending.end();) {
            auto drained = (*it)->drain();
            if (core::errors::is_error(drained)) {
                it = pending.erase(it);
                continue;
            }
            std::optional<protocol::ReadySignal> match;
            for (const json& message : core::errors::get_value(drained)) {
                if (transport::message_type(message) != protocol::kReadyMessage) {
                    continue;
                }
                auto signal = protocol::decode<protocol::ReadySignal>(message);
                if (core::errors::is_error(signal)) {
                    LOG_WARN(core::errors::get_error(signal).message);
                    continue;
                }
                if (core::errors::get_value(signal).identity != identity) {
                    LOG_DEBUG("Discarding readiness from " +
                              core::errors::get_value(signal).identity);
                    continue;
                }
                match = core::errors::take_value(signal);
                break;
            }
            if (match) {
                return Readiness{std::move(match.value()), std::move(*it)};
            }
            ++it;
        }

        if (auto status = child.try_wait()) {
            relay_runtime_output(child, output);
            return CrucibleError{ErrorCategory::Handshake,
                                 "Runtime process terminated unexpectedly (" +
                                     transport::describe_exit_status(status.value()) + ")",
                                 "process_terminated"};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return CrucibleError{ErrorCategory::Handshake, "Runtime connection timed out",
                                 "handshake_timeout",
                                 "Increase connect_timeout_ms if the runtime starts slowly."};
        }
    }
}

}  // namespace crucible::runtime
