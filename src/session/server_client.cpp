#include "session/server_client.hpp"

#include <functional>
#include <poll.h>
#include "core/config/short_id.hpp"
#include "core/logging/logger.hpp"
#include "protocol/codec.hpp"

namespace crucible::session {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr int kMonitorIntervalMs = 50;

template <typename T>
void push_decoded(const json& message, const std::function<void(protocol::RuntimeEvent)>& push) {
    auto decoded = protocol::decode<T>(message);
    if (core::errors::is_error(decoded)) {
        LOG_WARN(core::errors::get_error(decoded).message);
        return;
    }
    push(core::errors::take_value(decoded));
}

}  // namespace

core::errors::Result<std::unique_ptr<ServerClient>> ServerClient::connect(
    const std::string& address, const std::chrono::milliseconds timeout) {
    auto connected = transport::connect_unix(address);
    if (core::errors::is_error(connected)) {
        return core::errors::get_error(connected);
    }
    auto client = std::make_unique<ServerClient>(core::errors::take_value(connected));
    auto attached = client->take_ownership(timeout);
    if (core::errors::is_error(attached)) {
        return core::errors::get_error(attached);
    }
    return client;
}

ServerClient::ServerClient(std::unique_ptr<transport::MessageChannel> channel)
    : channel_(std::move(channel)), monitor_([this] { monitor(); }) {}

ServerClient::~ServerClient() {
    close();
}

core::errors::Status ServerClient::take_ownership(const std::chrono::milliseconds timeout) {
    auto sent = send(transport::make_message(protocol::kAttach));
    if (core::errors::is_error(sent)) {
        return sent;
    }

    std::unique_lock<std::mutex> lock(events_mutex_);
    const bool settled = events_cv_.wait_for(lock, timeout, [this] {
        return attached_ || down_.load();
    });
    if (attached_) {
        return core::errors::ok();
    }
    if (!settled) {
        return CrucibleError{ErrorCategory::Transport,
                             "Runtime server did not confirm ownership in time.",
                             "attach_timeout"};
    }
    return CrucibleError{ErrorCategory::Transport,
                         "Runtime server closed the connection before attaching.",
                         "channel_closed"};
}

core::errors::Status ServerClient::evaluate(const protocol::EvaluationRequest& request) {
    return send(protocol::encode(protocol::kEvaluate, request));
}

core::errors::Status ServerClient::forget_evaluation(const protocol::Locator& locator) {
    return send(protocol::encode(protocol::kForgetEvaluation, protocol::LocatorRequest{locator}));
}

core::errors::Status ServerClient::drop_container(const std::string& container) {
    return send(protocol::encode(protocol::kDropContainer, protocol::ContainerRequest{container}));
}

core::errors::Result<std::string> ServerClient::request_intellisense(
    const protocol::IntellisenseRequest& request,
    const std::vector<protocol::Locator>& parents) {
    protocol::IntellisenseQuery query;
    query.ref = core::config::generate_ref();
    query.request = request;
    query.parents = parents;
    auto sent = send(protocol::encode(protocol::kIntellisense, query));
    if (core::errors::is_error(sent)) {
        return core::errors::get_error(sent);
    }
    return query.ref;
}

std::optional<protocol::RuntimeEvent> ServerClient::next_event(
    const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(events_mutex_);
    if (!events_cv_.wait_for(lock, timeout, [this] { return !events_.empty(); })) {
        return std::nullopt;
    }
    protocol::RuntimeEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void ServerClient::stop() {
    stopping_ = true;
    auto sent = send(transport::make_message(protocol::kStop));
    if (core::errors::is_error(sent)) {
        LOG_DEBUG("Stop not delivered: " + core::errors::get_error(sent).message);
    }
}

void ServerClient::close() {
    closing_ = true;
    if (monitor_.joinable()) {
        monitor_.join();
    }
    std::lock_guard<std::mutex> lock(send_mutex_);
    channel_->close();
}

int ServerClient::server_pid() const {
    std::lock_guard<std::mutex> lock(events_mutex_);
    return server_pid_;
}

core::errors::Status ServerClient::send(const json& message) {
    std::lock_guard<std::mutex> lock(send_mutex_);
    return channel_->send(message);
}

void ServerClient::monitor() {
    while (!closing_) {
        pollfd pfd{channel_->fd(), POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kMonitorIntervalMs);
        if (ready <= 0) {
            continue;
        }

        auto drained = channel_->drain();
        if (core::errors::is_error(drained)) {
            const auto& error = core::errors::get_error(drained);
            if (!stopping_) {
                LOG_WARN("Runtime server connection lost: " + error.message);
                push(protocol::RuntimeDown{"runtime server closed the connection"});
            }
            {
                std::lock_guard<std::mutex> lock(events_mutex_);
                down_ = true;
            }
            events_cv_.notify_all();
            return;
        }
        for (const json& message : core::errors::get_value(drained)) {
            dispatch(message);
        }
    }
}

void ServerClient::dispatch(const json& message) {
    const std::string type = transport::message_type(message);
    const auto push_event = [this](protocol::RuntimeEvent event) { push(std::move(event)); };

    if (type == protocol::kAttached) {
        {
            std::lock_guard<std::mutex> lock(events_mutex_);
            attached_ = true;
            server_pid_ = message.value("pid", -1);
        }
        events_cv_.notify_all();
    } else if (type == protocol::kEvaluationOutput) {
        push_decoded<protocol::EvaluationOutput>(message, push_event);
    } else if (type == protocol::kEvaluationResponse) {
        push_decoded<protocol::EvaluationResponse>(message, push_event);
    } else if (type == protocol::kContainerDown) {
        push_decoded<protocol::ContainerDown>(message, push_event);
    } else if (type == protocol::kIntellisenseResponse) {
        push_decoded<protocol::IntellisenseResponse>(message, push_event);
    } else {
        LOG_WARN("Ignoring unexpected server message: " + type);
    }
}

void ServerClient::push(protocol::RuntimeEvent event) {
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        events_.push_back(std::move(event));
    }
    events_cv_.notify_all();
}

}  // namespace crucible::session
