#include "runtime/bootstrap.hpp"

#include "core/config/platform.hpp"
#include "core/logging/logger.hpp"
#include "protocol/codec.hpp"

namespace crucible::runtime {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using nlohmann::json;

core::errors::Result<std::unique_ptr<NodeClient>> NodeClient::connect(
    const std::string& address, const std::chrono::milliseconds timeout) {
    auto connected = transport::connect_unix(address);
    if (core::errors::is_error(connected)) {
        const auto& error = core::errors::get_error(connected);
        return CrucibleError{ErrorCategory::Bootstrap,
                             "Cannot reach runtime control socket: " + error.message,
                             error.code};
    }
    return std::make_unique<NodeClient>(core::errors::take_value(connected), timeout);
}

NodeClient::NodeClient(std::unique_ptr<transport::MessageChannel> channel,
                       const std::chrono::milliseconds timeout)
    : channel_(std::move(channel)), timeout_(timeout) {}

core::errors::Result<json> NodeClient::call(const std::string& type, json body,
                                            const ErrorCategory category) {
    ++requests_;
    auto reply = transport::request_reply(*channel_, transport::make_message(type, std::move(body)),
                                          timeout_);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return protocol::unwrap_reply(core::errors::get_value(reply), category);
}

core::errors::Result<bool> NodeClient::is_code_present(const std::string& unit) {
    auto reply = call(protocol::kIsCodePresent, json{{"unit", unit}}, ErrorCategory::Bootstrap);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return core::errors::get_value(reply).value("present", false);
}

core::errors::Status NodeClient::load_code(const std::string& unit,
                                           const std::vector<std::uint8_t>& binary) {
    auto reply = call(protocol::kLoadCode, json{{"unit", unit}, {"binary", json::binary(binary)}},
                      ErrorCategory::Bootstrap);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return core::errors::ok();
}

core::errors::Result<std::string> NodeClient::platform_version() {
    auto reply = call(protocol::kPlatformVersion, json::object(), ErrorCategory::Bootstrap);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return core::errors::get_value(reply).value("version", std::string("unknown"));
}

core::errors::Result<ManagerStatus> NodeClient::is_management_process_running() {
    auto reply = call(protocol::kIsManagerRunning, json::object(), ErrorCategory::Bootstrap);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& body = core::errors::get_value(reply);
    return ManagerStatus{body.value("running", false), body.value("pid", -1)};
}

core::errors::Result<int> NodeClient::start_management_process(const json& options) {
    auto reply = call(protocol::kStartManager, json{{"options", options}}, ErrorCategory::Bootstrap);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    return core::errors::get_value(reply).value("pid", -1);
}

core::errors::Result<protocol::ServerHandle> NodeClient::start_connection_server(
    const json& options) {
    auto reply = call(protocol::kStartConnectionServer, json{{"options", options}},
                      ErrorCategory::Bootstrap);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& body = core::errors::get_value(reply);
    if (!body.contains("server")) {
        return CrucibleError{ErrorCategory::Transport, "Reply is missing the server handle.",
                             "malformed_message"};
    }
    return protocol::decode<protocol::ServerHandle>(body.at("server"));
}

RuntimeBootstrap::RuntimeBootstrap(NodeClient& client, BootstrapOptions options)
    : client_(client), options_(std::move(options)) {}

core::errors::Result<BootstrapResult> RuntimeBootstrap::initialize() {
    auto code = ensure_code();
    if (core::errors::is_error(code)) {
        return core::errors::get_error(code);
    }
    auto manager = ensure_manager();
    if (core::errors::is_error(manager)) {
        return core::errors::get_error(manager);
    }

    auto server = client_.start_connection_server(options_.server_options);
    if (core::errors::is_error(server)) {
        return core::errors::get_error(server);
    }
    return BootstrapResult{core::errors::get_value(server), manager_pid_};
}

core::errors::Status RuntimeBootstrap::ensure_code() {
    if (code_present_ || options_.code_units.empty()) {
        return core::errors::ok();
    }

    auto present = client_.is_code_present(options_.code_units.front().name);
    if (core::errors::is_error(present)) {
        return core::errors::get_error(present);
    }
    if (core::errors::get_value(present)) {
        code_present_ = true;
        return core::errors::ok();
    }

    for (const auto& unit : options_.code_units) {
        auto binary = read_binary_file(unit.path);
        if (core::errors::is_error(binary)) {
            return core::errors::get_error(binary);
        }
        auto loaded = client_.load_code(unit.name, core::errors::get_value(binary));
        if (!core::errors::is_error(loaded)) {
            LOG_DEBUG("Loaded code unit " + unit.name + " onto the runtime");
            continue;
        }

        const auto& error = core::errors::get_error(loaded);
        if (error.category == ErrorCategory::Transport) {
            return error;
        }
        auto remote = client_.platform_version();
        return describe_load_failure(
            unit.name, error.message, core::config::platform_version(),
            core::errors::is_error(remote) ? std::string("unknown")
                                           : core::errors::get_value(remote));
    }

    code_present_ = true;
    return core::errors::ok();
}

core::errors::Status RuntimeBootstrap::ensure_manager() {
    if (manager_pid_ > 0) {
        return core::errors::ok();
    }

    auto status = client_.is_management_process_running();
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    if (core::errors::get_value(status).running) {
        manager_pid_ = core::errors::get_value(status).pid;
        return core::errors::ok();
    }

    auto started = client_.start_management_process(options_.manager_options);
    if (core::errors::is_error(started)) {
        return core::errors::get_error(started);
    }
    manager_pid_ = core::errors::get_value(started);
    return core::errors::ok();
}

CrucibleError describe_load_failure(const std::string& unit, const std::string& reason,
                                    const std::string& local_version,
                                    const std::string& remote_version) {
    if (local_version != remote_version) {
        return CrucibleError{ErrorCategory::Bootstrap,
                             "Failed to load code unit " + unit +
                                 " into the runtime, probably due to a version mismatch. "
                                 "Local version: " + local_version +
                                 ", runtime version: " + remote_version,
                             "version_mismatch",
                             "Make sure the runtime uses the same build as the coordinator."};
    }
    return CrucibleError{ErrorCategory::Bootstrap,
                         "Failed to load code unit " + unit + " into the runtime: " + reason,
                         "code_load_failed"};
}

}  // namespace crucible::runtime
