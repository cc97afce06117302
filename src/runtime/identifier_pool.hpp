#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace crucible::runtime {

enum class IdentityOrigin {
    Synthesized,  // handed out by an IdentifierPool
    External      // supplied by the caller, never recycled
};

struct RuntimeIdentity {
    std::string name;
    std::string base_label;
    IdentityOrigin origin = IdentityOrigin::Synthesized;
};

// Hands out unique runtime names and recycles them once a runtime using one
// has been gone for the buffer time. All state belongs to a single actor
// thread; the public methods only post to its mailbox.
class IdentifierPool {
public:
    explicit IdentifierPool(std::chrono::milliseconds buffer_time);
    ~IdentifierPool();

    IdentifierPool(const IdentifierPool&) = delete;
    IdentifierPool& operator=(const IdentifierPool&) = delete;

    // Reuses a free name if there is one, otherwise synthesizes
    // "<short-id>-<base_label>".
    RuntimeIdentity acquire(const std::string& base_label);

    // The runtime known by `name` disconnected. Synthesized names become
    // free again after the buffer time; anything else is ignored.
    void notify_disconnected(const std::string& name);

    std::size_t free_count();
    std::size_t synthesized_count();

    static RuntimeIdentity external(const std::string& name);

private:
    struct AcquireRequest {
        std::string base_label;
        std::promise<RuntimeIdentity> reply;
    };
    struct Disconnected {
        std::string name;
    };
    enum class Counter {
        Free,
        Synthesized
    };
    struct CountRequest {
        Counter counter;
        std::promise<std::size_t> reply;
    };
    struct Shutdown {};

    using Message = std::variant<AcquireRequest, Disconnected, CountRequest, Shutdown>;
    using Clock = std::chrono::steady_clock;

    void post(Message message);
    void run();
    bool handle(Message& message);
    void reclaim_due();

    RuntimeIdentity next_identity(const std::string& base_label);
    void reclaim(const std::string& name);
    bool is_released(const std::string& name) const;

    const std::chrono::milliseconds buffer_time_;

    std::mutex mailbox_mutex_;
    std::condition_variable mailbox_cv_;
    std::deque<Message> mailbox_;

    // Owned by the actor thread.
    std::set<std::string> synthesized_;
    std::vector<std::string> free_names_;
    std::multimap<Clock::time_point, std::string> pending_reclaims_;

    std::thread actor_;
};

}  // namespace crucible::runtime
