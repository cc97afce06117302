#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "core/errors/crucible_errors.hpp"
#include "protocol/bootstrap_contract.hpp"
#include "protocol/handshake_contract.hpp"
#include "protocol/init_script.hpp"
#include "runtime/bootstrap.hpp"
#include "runtime/identifier_pool.hpp"
#include "transport/message_channel.hpp"
#include "transport/process.hpp"

namespace crucible::runtime {

struct HandshakeOptions {
    std::filesystem::path node_executable;
    std::filesystem::path socket_dir;
    std::string base_label = "runtime";
    // Use this name instead of one from the pool. It is never recycled.
    std::optional<std::string> external_identity;
    std::string init_script = std::string(protocol::kChildInitScript);
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds request_timeout{30000};
    std::string log_level = "info";
    BootstrapOptions bootstrap;
};

// A runtime that finished the handshake: initialized, acknowledged and
// serving a connection server for its owner.
struct ConnectedRuntime {
    RuntimeIdentity identity;
    transport::ChildProcess process;
    std::string node_address;
    protocol::ServerHandle server;
    int manager_pid = -1;
};

// Parent side of the two-phase handshake: spawn a node, wait for it to
// announce itself, bootstrap it and acknowledge.
class HandshakeProtocol {
public:
    explicit HandshakeProtocol(IdentifierPool& pool);

    core::errors::Result<ConnectedRuntime> connect(const HandshakeOptions& options);

private:
    struct Readiness {
        protocol::ReadySignal signal;
        std::unique_ptr<transport::MessageChannel> channel;
    };

    core::errors::Result<Readiness> await_readiness(transport::UnixListener& listener,
                                                    transport::ChildProcess& child,
                                                    const std::string& identity,
                                                    std::chrono::milliseconds timeout);

    IdentifierPool& pool_;
};

// Re-logs complete lines a runtime wrote to stdout. Returns false once the
// output reached end of file.
bool relay_runtime_output(transport::ChildProcess& process, std::string& partial_line);

}  // namespace crucible::runtime
