#include "node/node_controller.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include "core/config/platform.hpp"
#include "core/config/short_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "protocol/codec.hpp"
#include "protocol/handshake_contract.hpp"
#include "transport/process.hpp"

namespace crucible::node {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(50);
constexpr auto kManagerRequestTimeout = std::chrono::milliseconds(10000);

}  // namespace

NodeController::NodeController(NodeOptions options)
    : options_(std::move(options)),
      address_(protocol::node_address(options_.socket_dir, options_.identity)),
      registry_(protocol::code_dir(options_.socket_dir, options_.identity)) {}

NodeController::~NodeController() {
    if (manager_pid_ > 0 && !manager_exited_) {
        transport::kill_and_reap(manager_pid_);
    }
    runtime::unload(registry_);
    std::error_code ec;
    std::filesystem::remove_all(registry_.code_dir(), ec);
}

int NodeController::run() {
    auto directives = protocol::parse_init_script(options_.init_script);
    if (core::errors::is_error(directives)) {
        LOG_ERROR(core::errors::get_error(directives).message);
        return 2;
    }

    auto bound = transport::UnixListener::bind(address_);
    if (core::errors::is_error(bound)) {
        LOG_ERROR("Cannot serve control requests: " + core::errors::get_error(bound).message);
        return 1;
    }
    control_ = core::errors::take_value(bound);

    for (const auto& directive : core::errors::get_value(directives)) {
        switch (directive.kind) {
            case protocol::DirectiveKind::Ready: {
                auto announced = announce_ready();
                if (core::errors::is_error(announced)) {
                    LOG_ERROR("Cannot reach the coordinator: " +
                              core::errors::get_error(announced).message);
                    return 1;
                }
                break;
            }
            case protocol::DirectiveKind::AwaitAck: {
                const WaitOutcome outcome = await_ack(directive.duration);
                if (outcome == WaitOutcome::TimedOut) {
                    LOG_ERROR("No acknowledgement from the coordinator within " +
                              std::to_string(directive.duration.count()) + "ms");
                    return 1;
                }
                if (outcome == WaitOutcome::Failed) {
                    return 1;
                }
                break;
            }
            case protocol::DirectiveKind::AwaitManager:
                if (await_manager() == WaitOutcome::Failed) {
                    return 1;
                }
                break;
            case protocol::DirectiveKind::Sleep:
                if (serve_until([] { return false; },
                                std::chrono::steady_clock::now() + directive.duration) ==
                    WaitOutcome::Failed) {
                    return 1;
                }
                break;
        }
    }
    return 0;
}

core::errors::Status NodeController::announce_ready() {
    auto connected = transport::connect_unix(options_.parent_address);
    if (core::errors::is_error(connected)) {
        return core::errors::get_error(connected);
    }
    parent_ = core::errors::take_value(connected);
    ready_ref_ = core::config::generate_ref();

    protocol::ReadySignal ready;
    ready.ref = ready_ref_;
    ready.identity = options_.identity;
    ready.address = address_;
    ready.pid = static_cast<int>(::getpid());
    LOG_DEBUG("Announcing readiness with " + ready_ref_);
    return parent_->send(protocol::encode(protocol::kReadyMessage, ready));
}

NodeController::WaitOutcome NodeController::await_ack(const std::chrono::milliseconds timeout) {
    return serve_until([this] { return acknowledged_; },
                       std::chrono::steady_clock::now() + timeout);
}

NodeController::WaitOutcome NodeController::await_manager() {
    const WaitOutcome outcome = serve_until([this] { return manager_exited_; },
                                            std::chrono::steady_clock::time_point::max());
    if (outcome == WaitOutcome::Done) {
        LOG_INFO("Management process is gone, node exiting");
    }
    return outcome;
}

NodeController::WaitOutcome NodeController::serve_until(
    const std::function<bool()>& done, const std::chrono::steady_clock::time_point deadline) {
    while (true) {
        check_manager();
        if (done()) {
            return WaitOutcome::Done;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return WaitOutcome::TimedOut;
        }

        auto wait = kPollInterval;
        if (deadline != std::chrono::steady_clock::time_point::max()) {
            wait = std::min(wait, std::chrono::duration_cast<std::chrono::milliseconds>(
                                      deadline - now) + std::chrono::milliseconds(1));
        }

        std::vector<pollfd> fds;
        fds.push_back(pollfd{control_->fd(), POLLIN, 0});
        const bool parent_polled = parent_ != nullptr;
        if (parent_polled) {
            fds.push_back(pollfd{parent_->fd(), POLLIN, 0});
        }
        const bool lifeline_polled = options_.lifeline_fd >= 0;
        const std::size_t lifeline_index = fds.size();
        if (lifeline_polled) {
            fds.push_back(pollfd{options_.lifeline_fd, POLLIN, 0});
        }
        const std::size_t first_client = fds.size();
        for (const auto& client : clients_) {
            fds.push_back(pollfd{client->fd(), POLLIN, 0});
        }

        const int ready = ::poll(fds.data(), fds.size(), static_cast<int>(wait.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("Node poll failed: ") + std::strerror(errno));
            return WaitOutcome::Failed;
        }
        if (ready == 0) {
            continue;
        }

        // Nothing is ever written to the lifeline; any event means the
        // coordinator let go of it.
        if (lifeline_polled && fds[lifeline_index].revents != 0) {
            LOG_WARN("Coordinator is gone, node exiting");
            return WaitOutcome::Failed;
        }

        std::vector<int> ready_clients;
        for (std::size_t i = first_client; i < fds.size(); ++i) {
            if (fds[i].revents != 0) {
                ready_clients.push_back(fds[i].fd);
            }
        }
        serve_clients(ready_clients);

        if (parent_polled && fds[1].revents != 0) {
            auto drained = parent_->drain();
            if (core::errors::is_error(drained)) {
                parent_.reset();
                if (!acknowledged_) {
                    LOG_ERROR("Coordinator closed the handshake connection");
                    return WaitOutcome::Failed;
                }
            } else {
                for (const json& message : core::errors::get_value(drained)) {
                    auto ack = protocol::decode<protocol::AckSignal>(message);
                    if (transport::message_type(message) == protocol::kAckMessage &&
                        !core::errors::is_error(ack) &&
                        core::errors::get_value(ack).ref == ready_ref_) {
                        LOG_DEBUG("Coordinator acknowledged " + ready_ref_);
                        acknowledged_ = true;
                    }
                }
                if (acknowledged_) {
                    parent_.reset();
                }
            }
        }

        if (fds[0].revents != 0) {
            auto accepted = control_->accept();
            if (core::errors::is_error(accepted)) {
                LOG_WARN(core::errors::get_error(accepted).message);
            } else {
                clients_.push_back(core::errors::take_value(accepted));
            }
        }
    }
}

void NodeController::serve_clients(const std::vector<int>& ready_fds) {
    for (auto it = clients_.begin(); it != clients_.end();) {
        auto& client = *it;
        if (std::find(ready_fds.begin(), ready_fds.end(), client->fd()) == ready_fds.end()) {
            ++it;
            continue;
        }

        auto drained = client->drain();
        if (core::errors::is_error(drained)) {
            it = clients_.erase(it);
            continue;
        }
        for (const json& request : core::errors::get_value(drained)) {
            auto sent = client->send(handle_request(request));
            if (core::errors::is_error(sent)) {
                LOG_WARN("Control reply not delivered: " + core::errors::get_error(sent).message);
            }
        }
        ++it;
    }
}

json NodeController::handle_request(const json& request) {
    const std::string type = transport::message_type(request);
    LOG_DEBUG("Control request: " + type);

    if (type == protocol::kIsCodePresent) {
        const std::string unit = request.value("unit", std::string());
        return protocol::ok_reply(json{{"present", registry_.is_loaded(unit)}});
    }
    if (type == protocol::kLoadCode) {
        const std::string unit = request.value("unit", std::string());
        if (unit.empty() || !request.contains("binary") || !request.at("binary").is_binary()) {
            return protocol::error_reply(CrucibleError{ErrorCategory::Input,
                                                       "load_code needs a unit name and binary",
                                                       "malformed_message"});
        }
        auto loaded = registry_.load(unit, request.at("binary").get_binary());
        if (core::errors::is_error(loaded)) {
            return protocol::error_reply(core::errors::get_error(loaded));
        }
        return protocol::ok_reply();
    }
    if (type == protocol::kPlatformVersion) {
        return protocol::ok_reply(json{{"version", core::config::platform_version()}});
    }
    if (type == protocol::kIsManagerRunning) {
        check_manager();
        const bool running = manager_pid_ > 0 && !manager_exited_;
        return protocol::ok_reply(json{{"running", running},
                                       {"pid", running ? static_cast<int>(manager_pid_) : -1}});
    }
    if (type == protocol::kStartManager) {
        auto started = start_manager(request.value("options", json::object()));
        if (core::errors::is_error(started)) {
            return protocol::error_reply(core::errors::get_error(started));
        }
        return protocol::ok_reply(json{{"pid", static_cast<int>(core::errors::get_value(started))}});
    }
    if (type == protocol::kStartConnectionServer) {
        auto started = start_connection_server(request.value("options", json::object()));
        if (core::errors::is_error(started)) {
            return protocol::error_reply(core::errors::get_error(started));
        }
        return protocol::ok_reply(json{{"server", core::errors::get_value(started)}});
    }

    return protocol::error_reply(CrucibleError{ErrorCategory::Input,
                                               "Unknown control request: " + type,
                                               "unknown_request"});
}

void NodeController::check_manager() {
    if (manager_pid_ <= 0 || manager_exited_) {
        return;
    }
    int status = 0;
    const pid_t waited = ::waitpid(manager_pid_, &status, WNOHANG);
    if (waited == manager_pid_ || (waited < 0 && errno == ECHILD)) {
        manager_exited_ = true;
        manager_channel_.reset();
        LOG_INFO("Management process " + std::to_string(manager_pid_) + " " +
                 (waited == manager_pid_ ? transport::describe_exit_status(status)
                                         : std::string("is gone")));
    }
}

core::errors::Result<pid_t> NodeController::start_manager(const json& options) {
    check_manager();
    if (manager_pid_ > 0 && !manager_exited_) {
        return manager_pid_;
    }

    void* symbol = registry_.find_symbol(protocol::kManagerEntrySymbol);
    if (symbol == nullptr) {
        return CrucibleError{ErrorCategory::Bootstrap,
                             std::string("No loaded code unit exports ") +
                                 protocol::kManagerEntrySymbol,
                             "manager_entry_missing"};
    }
    const auto entry = reinterpret_cast<protocol::ManagerEntry>(symbol);

    const std::string address = protocol::manager_address(options_.socket_dir, options_.identity);
    auto bound = transport::UnixListener::bind(address);
    if (core::errors::is_error(bound)) {
        return core::errors::get_error(bound);
    }
    auto listener = core::errors::take_value(bound);
    const int listen_fd = listener->fd();

    const std::string manager_options =
        json{{"identity", options_.identity},
             {"socket_dir", options_.socket_dir.string()},
             {"log_level", options.value("log_level", options_.log_level)}}
            .dump();

    auto forked = transport::fork_child(
        [entry, listen_fd, manager_options]() {
            return entry(listen_fd, manager_options.c_str());
        },
        {listen_fd});
    if (core::errors::is_error(forked)) {
        return core::errors::get_error(forked);
    }
    const pid_t pid = core::errors::get_value(forked);
    // The manager owns the socket file now.
    static_cast<void>(::close(listener->release()));

    auto connected = transport::connect_unix(address);
    if (core::errors::is_error(connected)) {
        transport::kill_and_reap(pid);
        return core::errors::get_error(connected);
    }
    manager_channel_ = core::errors::take_value(connected);
    manager_pid_ = pid;
    manager_exited_ = false;
    LOG_INFO("Started management process " + std::to_string(pid));
    return pid;
}

core::errors::Result<json> NodeController::start_connection_server(const json& options) {
    check_manager();
    if (!manager_channel_ || manager_exited_) {
        return CrucibleError{ErrorCategory::Bootstrap,
                             "The management process is not running",
                             "manager_not_running"};
    }

    auto reply = transport::request_reply(
        *manager_channel_,
        transport::make_message(protocol::kStartRuntimeServer, json{{"options", options}}),
        kManagerRequestTimeout);
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    auto unwrapped = protocol::unwrap_reply(core::errors::get_value(reply),
                                            ErrorCategory::Bootstrap);
    if (core::errors::is_error(unwrapped)) {
        return core::errors::get_error(unwrapped);
    }
    return core::errors::get_value(unwrapped).value("server", json::object());
}

}  // namespace crucible::node
