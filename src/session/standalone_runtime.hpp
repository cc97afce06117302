#pragma once

#include <memory>
#include <optional>
#include <string>
#include "core/config/settings.hpp"
#include "core/errors/crucible_errors.hpp"
#include "runtime/identifier_pool.hpp"
#include "session/runtime_connection.hpp"

namespace crucible::session {

struct ConnectOptions {
    std::string base_label = "runtime";
    std::optional<std::string> external_identity;
};

// A runtime that runs in its own freshly spawned node process. Holds only
// settings until connect() is called; every connect() starts a new node.
class StandaloneRuntime {
public:
    StandaloneRuntime(core::config::RuntimeSettings settings,
                      std::shared_ptr<runtime::IdentifierPool> pool);

    Description describe() const;

    core::errors::Result<std::unique_ptr<RuntimeConnection>> connect(
        const ConnectOptions& options = ConnectOptions());

    // A new, unconnected runtime with the same settings and pool.
    StandaloneRuntime duplicate() const;

    const core::config::RuntimeSettings& settings() const { return settings_; }

private:
    runtime::HandshakeOptions handshake_options(const ConnectOptions& options) const;

    core::config::RuntimeSettings settings_;
    std::shared_ptr<runtime::IdentifierPool> pool_;
};

}  // namespace crucible::session
