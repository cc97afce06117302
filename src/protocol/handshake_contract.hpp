#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace crucible::protocol {

    // Message types of the two-phase handshake.
    inline constexpr const char* kReadyMessage = "ready";
    inline constexpr const char* kAckMessage = "ack";

    // Child -> parent: the node is up and serving its control address.
    struct ReadySignal {
        std::string ref;       // correlation reference chosen by the child
        std::string identity;  // the name the node was started with
        std::string address;   // node control socket
        int pid = -1;          // node process id
    };

    // Parent -> child: bootstrap finished, the node may commit to its manager.
    struct AckSignal {
        std::string ref;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ReadySignal, ref, identity, address, pid)
    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AckSignal, ref)

} // namespace crucible::protocol
