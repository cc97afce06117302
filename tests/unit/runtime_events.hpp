#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>
#include "protocol/event_contract.hpp"

namespace crucible::testing {

// Pulls events from anything with next_event(timeout) and keeps every one
// it has seen, so tests can wait for one event and then inspect the rest.
template <typename Source>
class EventLog {
public:
    explicit EventLog(Source& source) : source_(source) {}

    // First event of type T matching `match`, seen earlier or arriving
    // within `timeout`.
    template <typename T>
    std::optional<T> wait_for(const std::function<bool(const T&)>& match,
                              std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
        for (const auto& seen : events_) {
            if (const auto* event = std::get_if<T>(&seen); event && match(*event)) {
                return *event;
            }
        }
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            auto event = source_.next_event(std::chrono::milliseconds(50));
            if (!event) {
                continue;
            }
            events_.push_back(*event);
            if (const auto* typed = std::get_if<T>(&events_.back()); typed && match(*typed)) {
                return *typed;
            }
        }
        return std::nullopt;
    }

    std::optional<protocol::EvaluationResponse> response(const std::string& evaluation) {
        return wait_for<protocol::EvaluationResponse>(
            [&evaluation](const protocol::EvaluationResponse& r) { return r.evaluation == evaluation; });
    }

    bool has_response(const std::string& evaluation) const {
        for (const auto& event : events_) {
            const auto* response = std::get_if<protocol::EvaluationResponse>(&event);
            if (response != nullptr && response->evaluation == evaluation) {
                return true;
            }
        }
        return false;
    }

    // Drains whatever arrives within `window`.
    void settle(std::chrono::milliseconds window) {
        const auto deadline = std::chrono::steady_clock::now() + window;
        while (std::chrono::steady_clock::now() < deadline) {
            auto event = source_.next_event(std::chrono::milliseconds(20));
            if (event) {
                events_.push_back(*event);
            }
        }
    }

    template <typename T>
    std::size_t count() const {
        std::size_t n = 0;
        for (const auto& event : events_) {
            if (std::holds_alternative<T>(event)) {
                ++n;
            }
        }
        return n;
    }

    const std::vector<protocol::RuntimeEvent>& events() const { return events_; }

private:
    Source& source_;
    std::vector<protocol::RuntimeEvent> events_;
};

// Reaps `pid`, waiting at most `timeout`. Returns the wait status.
inline std::optional<int> wait_for_exit(pid_t pid, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        const pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            return status;
        }
        if (waited < 0) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return std::nullopt;
}

}  // namespace crucible::testing
