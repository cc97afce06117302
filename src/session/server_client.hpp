#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"
#include "protocol/evaluation_contract.hpp"
#include "protocol/event_contract.hpp"
#include "transport/message_channel.hpp"

namespace crucible::session {

// Owner end of a runtime server connection. Requests are fire-and-forget;
// everything the server reports arrives through next_event() in order.
class ServerClient {
public:
    // Connects to `address` and takes ownership of the server.
    static core::errors::Result<std::unique_ptr<ServerClient>> connect(
        const std::string& address, std::chrono::milliseconds timeout);

    explicit ServerClient(std::unique_ptr<transport::MessageChannel> channel);
    ~ServerClient();

    ServerClient(const ServerClient&) = delete;
    ServerClient& operator=(const ServerClient&) = delete;

    core::errors::Status take_ownership(std::chrono::milliseconds timeout);

    core::errors::Status evaluate(const protocol::EvaluationRequest& request);
    core::errors::Status forget_evaluation(const protocol::Locator& locator);
    core::errors::Status drop_container(const std::string& container);

    // Returns the reference the matching IntellisenseResponse will carry.
    core::errors::Result<std::string> request_intellisense(
        const protocol::IntellisenseRequest& request,
        const std::vector<protocol::Locator>& parents);

    std::optional<protocol::RuntimeEvent> next_event(std::chrono::milliseconds timeout);

    // Asks the server to shut down. The resulting end of stream is not
    // reported as RuntimeDown.
    void stop();
    void close();

    bool is_down() const { return down_.load(); }
    int server_pid() const;

private:
    core::errors::Status send(const nlohmann::json& message);
    void monitor();
    void dispatch(const nlohmann::json& message);
    void push(protocol::RuntimeEvent event);

    std::unique_ptr<transport::MessageChannel> channel_;
    std::mutex send_mutex_;

    mutable std::mutex events_mutex_;
    std::condition_variable events_cv_;
    std::deque<protocol::RuntimeEvent> events_;
    bool attached_ = false;
    int server_pid_ = -1;

    std::atomic<bool> down_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<bool> closing_{false};
    std::thread monitor_;
};

}  // namespace crucible::session
