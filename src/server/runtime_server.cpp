#include "server/runtime_server.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <poll.h>
#include <unistd.h>
#include <vector>
#include "core/logging/logger.hpp"
#include "evaluator/intellisense.hpp"
#include "evaluator/interpreter.hpp"
#include "protocol/codec.hpp"
#include "transport/process.hpp"

namespace crucible::server {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;
using nlohmann::json;

RuntimeServer::RuntimeServer(std::unique_ptr<transport::UnixListener> listener,
                             ServerOptions options)
    : listener_(std::move(listener)), options_(std::move(options)) {}

RuntimeServer::~RuntimeServer() {
    shutdown();
}

int RuntimeServer::run() {
    LOG_INFO("Runtime server listening on " + listener_->address());
    const auto owner_deadline = std::chrono::steady_clock::now() + options_.await_owner_timeout;

    while (running_) {
        std::vector<pollfd> fds;
        fds.push_back(pollfd{listener_->fd(), POLLIN, 0});

        const bool owner_polled = owner_ != nullptr;
        if (owner_polled) {
            fds.push_back(pollfd{owner_->fd(), POLLIN, 0});
        }

        std::vector<std::pair<std::string, int>> workers;
        for (const auto& [container, slot] : slots_) {
            if (slot.worker && slot.worker->channel && slot.worker->channel->is_open()) {
                workers.emplace_back(container, slot.worker->channel->fd());
                fds.push_back(pollfd{slot.worker->channel->fd(), POLLIN, 0});
            }
        }

        int timeout_ms = -1;
        if (!owner_) {
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                owner_deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                LOG_WARN("No owner connected within " +
                         std::to_string(options_.await_owner_timeout.count()) +
                         "ms, shutting down");
                break;
            }
            timeout_ms = static_cast<int>(remaining.count()) + 1;
        }

        const int ready = ::poll(fds.data(), fds.size(), timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR(std::string("Runtime server poll failed: ") + std::strerror(errno));
            shutdown();
            return 1;
        }
        if (ready == 0) {
            continue;
        }

        std::size_t index = 0;
        if (fds[index++].revents != 0) {
            accept_connection();
        }
        if (owner_polled) {
            if (fds[index++].revents != 0 && !handle_owner_messages()) {
                break;
            }
        }
        for (const auto& [container, fd] : workers) {
            if (!running_) {
                break;
            }
            if (fds[index++].revents == 0) {
                continue;
            }
            // The owner may have dropped or replaced the worker meanwhile.
            const auto it = slots_.find(container);
            if (it == slots_.end() || !it->second.worker ||
                it->second.worker->channel->fd() != fd) {
                continue;
            }
            handle_worker_messages(container);
        }
    }

    shutdown();
    LOG_INFO("Runtime server stopped");
    return 0;
}

bool RuntimeServer::accept_connection() {
    auto accepted = listener_->accept();
    if (core::errors::is_error(accepted)) {
        LOG_WARN(core::errors::get_error(accepted).message);
        return false;
    }
    if (owner_) {
        LOG_WARN("Runtime server already has an owner, rejecting connection");
        return false;
    }
    owner_ = core::errors::take_value(accepted);
    LOG_DEBUG("Owner connected");
    return true;
}

bool RuntimeServer::handle_owner_messages() {
    auto drained = owner_->drain();
    if (core::errors::is_error(drained)) {
        const auto& error = core::errors::get_error(drained);
        if (error.code == "channel_closed") {
            LOG_INFO("Owner disconnected");
        } else {
            LOG_ERROR("Owner channel failed: " + error.message);
        }
        return false;
    }
    for (const json& message : core::errors::get_value(drained)) {
        if (!handle_owner_message(message)) {
            return false;
        }
    }
    return running_;
}

bool RuntimeServer::handle_owner_message(const json& message) {
    const std::string type = transport::message_type(message);

    if (type == protocol::kAttach) {
        return emit(transport::make_message(protocol::kAttached,
                                            json{{"pid", static_cast<int>(::getpid())}}));
    }
    if (type == protocol::kStop) {
        LOG_DEBUG("Owner requested stop");
        running_ = false;
        return false;
    }
    if (type == protocol::kEvaluate) {
        auto request = protocol::decode<protocol::EvaluationRequest>(message);
        if (core::errors::is_error(request)) {
            LOG_WARN(core::errors::get_error(request).message);
            return true;
        }
        QueuedJob job;
        job.request = core::errors::take_value(request);
        const std::string container = job.request.container;
        enqueue(container, std::move(job));
        return running_;
    }
    if (type == protocol::kForgetEvaluation) {
        auto request = protocol::decode<protocol::LocatorRequest>(message);
        if (core::errors::is_error(request)) {
            LOG_WARN(core::errors::get_error(request).message);
            return true;
        }
        const protocol::Locator& locator = core::errors::get_value(request).locator;
        snapshots_.erase(locator);
        if (slots_.count(locator.container) != 0) {
            QueuedJob job;
            job.forget = true;
            job.evaluation = locator.evaluation;
            enqueue(locator.container, std::move(job));
        }
        return running_;
    }
    if (type == protocol::kDropContainer) {
        auto request = protocol::decode<protocol::ContainerRequest>(message);
        if (core::errors::is_error(request)) {
            LOG_WARN(core::errors::get_error(request).message);
            return true;
        }
        drop_container(core::errors::get_value(request).container);
        return true;
    }
    if (type == protocol::kIntellisense) {
        auto query = protocol::decode<protocol::IntellisenseQuery>(message);
        if (core::errors::is_error(query)) {
            LOG_WARN(core::errors::get_error(query).message);
            return true;
        }
        const auto& request = core::errors::get_value(query);
        protocol::IntellisenseResponse response;
        response.ref = request.ref;
        response.payload =
            evaluator::handle_intellisense(request.request, fold_snapshots(request.parents));
        return emit(protocol::encode(protocol::kIntellisenseResponse, response));
    }

    LOG_WARN("Runtime server ignoring unknown message type: " + type);
    return true;
}

bool RuntimeServer::handle_worker_messages(const std::string& container) {
    ContainerSlot& slot = slots_[container];
    auto drained = slot.worker->channel->drain();
    if (core::errors::is_error(drained)) {
        const auto& error = core::errors::get_error(drained);
        if (error.code != "channel_closed") {
            LOG_WARN("Evaluator channel for " + container + " failed: " + error.message);
        }
        worker_down(container);
        return false;
    }

    for (const json& message : core::errors::get_value(drained)) {
        const std::string type = transport::message_type(message);
        if (type == protocol::kWorkerOutput) {
            auto output = protocol::decode<protocol::WorkerOutput>(message);
            if (core::errors::is_error(output)) {
                LOG_WARN(core::errors::get_error(output).message);
                continue;
            }
            const auto& body = core::errors::get_value(output);
            emit(protocol::encode(protocol::kEvaluationOutput,
                                  protocol::EvaluationOutput{container, body.evaluation,
                                                             body.text}));
        } else if (type == protocol::kWorkerResult) {
            auto result = protocol::decode<protocol::WorkerResult>(message);
            if (core::errors::is_error(result)) {
                LOG_WARN(core::errors::get_error(result).message);
                continue;
            }
            auto body = core::errors::take_value(result);
            snapshots_[protocol::Locator{container, body.evaluation}] = body.bindings;
            slot.in_flight.reset();

            protocol::EvaluationResponse response;
            response.container = container;
            response.evaluation = body.evaluation;
            response.result = body.result;
            response.evaluation_time_ms = body.evaluation_time_ms;
            emit(protocol::encode(protocol::kEvaluationResponse, response));
        } else {
            LOG_WARN("Runtime server ignoring evaluator message: " + type);
        }
    }

    pump(container);
    return true;
}

void RuntimeServer::enqueue(const std::string& container, QueuedJob job) {
    slots_[container].queue.push_back(std::move(job));
    pump(container);
}

void RuntimeServer::pump(const std::string& container) {
    const auto it = slots_.find(container);
    if (it == slots_.end()) {
        return;
    }
    ContainerSlot& slot = it->second;

    while (running_ && !slot.in_flight && !slot.queue.empty()) {
        QueuedJob job = std::move(slot.queue.front());
        slot.queue.pop_front();

        if (job.forget) {
            // Also covers a result that arrived after the forget request.
            snapshots_.erase(protocol::Locator{container, job.evaluation});
            if (slot.worker) {
                auto sent = slot.worker->channel->send(protocol::encode(
                    protocol::kWorkerForget, protocol::WorkerForget{job.evaluation}));
                if (core::errors::is_error(sent)) {
                    LOG_DEBUG("Forget not delivered: " + core::errors::get_error(sent).message);
                }
            }
            continue;
        }

        if (!ensure_worker(container, slot)) {
            return;
        }
        auto sent = slot.worker->channel->send(
            protocol::encode(protocol::kWorkerRun, build_job(job.request)));
        if (core::errors::is_error(sent)) {
            // The evaluator is gone; its end of stream reports the crash.
            LOG_WARN("Evaluation not delivered to " + container + ": " +
                     core::errors::get_error(sent).message);
        }
        slot.in_flight = job.request.evaluation;
    }
}

bool RuntimeServer::ensure_worker(const std::string& container, ContainerSlot& slot) {
    if (slot.worker) {
        return true;
    }
    auto started = supervisor_.start_worker(WorkerOptions{container});
    if (core::errors::is_error(started)) {
        const auto& error = core::errors::get_error(started);
        LOG_ERROR(error.message);
        slot.queue.clear();
        emit(protocol::encode(protocol::kContainerDown,
                              protocol::ContainerDown{container, error.message}));
        return false;
    }
    slot.worker = core::errors::take_value(started);
    return true;
}

protocol::WorkerJob RuntimeServer::build_job(const protocol::EvaluationRequest& request) const {
    protocol::WorkerJob job;
    job.evaluation = request.evaluation;
    job.code = request.code;
    job.file = request.options.file;

    for (const auto& parent : request.parents) {
        protocol::ParentContext context;
        context.evaluation = parent.evaluation;
        if (parent.container == request.container) {
            context.local = true;
            job.parents.push_back(std::move(context));
            continue;
        }
        // Another container's bindings travel by value.
        const auto it = snapshots_.find(parent);
        if (it == snapshots_.end()) {
            LOG_DEBUG("No bindings for parent " + parent.container + "/" + parent.evaluation +
                      ", skipping");
            continue;
        }
        context.local = false;
        context.bindings = it->second;
        job.parents.push_back(std::move(context));
    }
    return job;
}

void RuntimeServer::worker_down(const std::string& container) {
    ContainerSlot& slot = slots_[container];
    const std::string reason =
        slot.worker ? supervisor_.collect_exit(*slot.worker) : std::string("terminated");
    LOG_WARN("Evaluator for container " + container + " went down: " + reason);

    slot.worker.reset();
    slot.queue.clear();
    slot.in_flight.reset();
    forget_snapshots(container);

    emit(protocol::encode(protocol::kContainerDown, protocol::ContainerDown{container, reason}));
}

void RuntimeServer::drop_container(const std::string& container) {
    const auto it = slots_.find(container);
    if (it != slots_.end()) {
        if (it->second.worker) {
            auto status = supervisor_.terminate_worker(*it->second.worker);
            if (core::errors::is_error(status)) {
                LOG_WARN(core::errors::get_error(status).message);
            }
        }
        slots_.erase(it);
    }
    forget_snapshots(container);
}

void RuntimeServer::forget_snapshots(const std::string& container) {
    for (auto it = snapshots_.begin(); it != snapshots_.end();) {
        if (it->first.container == container) {
            it = snapshots_.erase(it);
        } else {
            ++it;
        }
    }
}

json RuntimeServer::fold_snapshots(const std::vector<protocol::Locator>& parents) const {
    json context = json::object();
    for (const auto& parent : parents) {
        const auto it = snapshots_.find(parent);
        if (it != snapshots_.end()) {
            evaluator::merge_missing(context, it->second);
        }
    }
    return context;
}

bool RuntimeServer::emit(const json& event) {
    if (!owner_) {
        return false;
    }
    auto sent = owner_->send(event);
    if (core::errors::is_error(sent)) {
        LOG_WARN("Owner unreachable: " + core::errors::get_error(sent).message);
        running_ = false;
        return false;
    }
    return true;
}

void RuntimeServer::shutdown() {
    for (auto& [container, slot] : slots_) {
        if (slot.worker) {
            auto status = supervisor_.terminate_worker(*slot.worker);
            if (core::errors::is_error(status)) {
                LOG_WARN(core::errors::get_error(status).message);
            }
        }
    }
    slots_.clear();
    owner_.reset();
    running_ = false;
}

core::errors::Result<protocol::ServerHandle> spawn_runtime_server(const ServerOptions& options) {
    auto bound = transport::UnixListener::bind(options.address);
    if (core::errors::is_error(bound)) {
        return core::errors::get_error(bound);
    }
    auto listener = core::errors::take_value(bound);
    const int listen_fd = listener->fd();

    auto forked = transport::fork_child(
        [listen_fd, options]() {
            core::logging::Logger::get().set_process_label(
                "server " + std::filesystem::path(options.address).filename().string());
            auto adopted =
                std::make_unique<transport::UnixListener>(listen_fd, options.address, true);
            RuntimeServer server(std::move(adopted), options);
            return server.run();
        },
        {listen_fd});
    if (core::errors::is_error(forked)) {
        return core::errors::get_error(forked);
    }

    // The child owns the socket file from here on.
    static_cast<void>(::close(listener->release()));
    return protocol::ServerHandle{options.address, core::errors::get_value(forked)};
}

}  // namespace crucible::server
