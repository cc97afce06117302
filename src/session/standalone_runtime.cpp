#include "session/standalone_runtime.hpp"

#include "core/logging/logger.hpp"
#include "protocol/init_script.hpp"

namespace crucible::session {

using nlohmann::json;

StandaloneRuntime::StandaloneRuntime(core::config::RuntimeSettings settings,
                                     std::shared_ptr<runtime::IdentifierPool> pool)
    : settings_(std::move(settings)), pool_(std::move(pool)) {}

Description StandaloneRuntime::describe() const {
    return Description{
        {"Type", "Standalone"},
        {"Executable", settings_.node_executable.string()},
        {"Socket directory", settings_.socket_dir.string()},
    };
}

runtime::HandshakeOptions StandaloneRuntime::handshake_options(
    const ConnectOptions& options) const {
    const std::string log_level = core::logging::to_string(settings_.log_level);

    runtime::HandshakeOptions handshake;
    handshake.node_executable = settings_.node_executable;
    handshake.socket_dir = settings_.socket_dir;
    handshake.base_label = options.base_label;
    handshake.external_identity = options.external_identity;
    handshake.init_script = protocol::child_init_script(settings_.ack_timeout);
    handshake.connect_timeout = settings_.connect_timeout;
    handshake.request_timeout = settings_.request_timeout;
    handshake.log_level = log_level;
    handshake.bootstrap.code_units = settings_.code_units;
    handshake.bootstrap.manager_options = json{{"log_level", log_level}};
    handshake.bootstrap.server_options =
        json{{"await_owner_timeout_ms", settings_.await_owner_timeout.count()}};
    return handshake;
}

core::errors::Result<std::unique_ptr<RuntimeConnection>> StandaloneRuntime::connect(
    const ConnectOptions& options) {
    runtime::HandshakeProtocol handshake(*pool_);
    auto connected = handshake.connect(handshake_options(options));
    if (core::errors::is_error(connected)) {
        return core::errors::get_error(connected);
    }
    runtime::ConnectedRuntime runtime = core::errors::take_value(connected);

    auto client = ServerClient::connect(runtime.server.address, settings_.request_timeout);
    if (core::errors::is_error(client)) {
        const std::string name = runtime.identity.name;
        runtime.process.wait_or_kill(std::chrono::milliseconds(0));
        pool_->notify_disconnected(name);
        return core::errors::get_error(client);
    }

    return std::make_unique<RuntimeConnection>(std::move(runtime),
                                               core::errors::take_value(client), pool_);
}

StandaloneRuntime StandaloneRuntime::duplicate() const {
    return StandaloneRuntime(settings_, pool_);
}

}  // namespace crucible::session
