#include "runtime/identifier_pool.hpp"

#include <algorithm>
#include "core/config/short_id.hpp"
#include "core/logging/logger.hpp"

namespace crucible::runtime {

IdentifierPool::IdentifierPool(const std::chrono::milliseconds buffer_time)
    : buffer_time_(buffer_time), actor_([this] { run(); }) {}

IdentifierPool::~IdentifierPool() {
    post(Shutdown{});
    if (actor_.joinable()) {
        actor_.join();
    }
}

RuntimeIdentity IdentifierPool::acquire(const std::string& base_label) {
    std::promise<RuntimeIdentity> reply;
    auto identity = reply.get_future();
    post(AcquireRequest{base_label, std::move(reply)});
    return identity.get();
}

void IdentifierPool::notify_disconnected(const std::string& name) {
    post(Disconnected{name});
}

std::size_t IdentifierPool::free_count() {
    std::promise<std::size_t> reply;
    auto count = reply.get_future();
    post(CountRequest{Counter::Free, std::move(reply)});
    return count.get();
}

std::size_t IdentifierPool::synthesized_count() {
    std::promise<std::size_t> reply;
    auto count = reply.get_future();
    post(CountRequest{Counter::Synthesized, std::move(reply)});
    return count.get();
}

RuntimeIdentity IdentifierPool::external(const std::string& name) {
    return RuntimeIdentity{name, "", IdentityOrigin::External};
}

void IdentifierPool::post(Message message) {
    {
        std::lock_guard<std::mutex> lock(mailbox_mutex_);
        mailbox_.push_back(std::move(message));
    }
    mailbox_cv_.notify_one();
}

void IdentifierPool::run() {
    while (true) {
        Message message;
        {
            std::unique_lock<std::mutex> lock(mailbox_mutex_);
            if (pending_reclaims_.empty()) {
                mailbox_cv_.wait(lock, [this] { return !mailbox_.empty(); });
            } else {
                mailbox_cv_.wait_until(lock, pending_reclaims_.begin()->first,
                                       [this] { return !mailbox_.empty(); });
            }
            if (mailbox_.empty()) {
                lock.unlock();
                reclaim_due();
                continue;
            }
            message = std::move(mailbox_.front());
            mailbox_.pop_front();
        }

        reclaim_due();
        if (!handle(message)) {
            return;
        }
    }
}

bool IdentifierPool::handle(Message& message) {
    if (auto* request = std::get_if<AcquireRequest>(&message)) {
        request->reply.set_value(next_identity(request->base_label));
        return true;
    }
    if (auto* disconnected = std::get_if<Disconnected>(&message)) {
        if (synthesized_.count(disconnected->name) == 0 || is_released(disconnected->name)) {
            return true;
        }
        if (buffer_time_.count() == 0) {
            reclaim(disconnected->name);
        } else {
            pending_reclaims_.emplace(Clock::now() + buffer_time_, disconnected->name);
        }
        return true;
    }
    if (auto* request = std::get_if<CountRequest>(&message)) {
        request->reply.set_value(request->counter == Counter::Free ? free_names_.size()
                                                                   : synthesized_.size());
        return true;
    }
    return false;
}

void IdentifierPool::reclaim_due() {
    const auto now = Clock::now();
    while (!pending_reclaims_.empty() && pending_reclaims_.begin()->first <= now) {
        const std::string name = pending_reclaims_.begin()->second;
        pending_reclaims_.erase(pending_reclaims_.begin());
        reclaim(name);
    }
}

RuntimeIdentity IdentifierPool::next_identity(const std::string& base_label) {
    if (!free_names_.empty()) {
        std::string name = free_names_.back();
        free_names_.pop_back();
        LOG_DEBUG("Reusing runtime name " + name);
        return RuntimeIdentity{name, base_label, IdentityOrigin::Synthesized};
    }

    std::string name;
    do {
        name = core::config::generate_short_id() + "-" + base_label;
    } while (synthesized_.count(name) != 0);
    synthesized_.insert(name);
    return RuntimeIdentity{name, base_label, IdentityOrigin::Synthesized};
}

// Free or waiting out its buffer time. A repeated disconnect notice for such
// a name must not schedule a second reclaim.
bool IdentifierPool::is_released(const std::string& name) const {
    if (std::find(free_names_.begin(), free_names_.end(), name) != free_names_.end()) {
        return true;
    }
    return std::any_of(pending_reclaims_.begin(), pending_reclaims_.end(),
                       [&name](const auto& entry) { return entry.second == name; });
}

void IdentifierPool::reclaim(const std::string& name) {
    if (std::find(free_names_.begin(), free_names_.end(), name) != free_names_.end()) {
        return;
    }
    free_names_.push_back(name);
}

}  // namespace crucible::runtime
