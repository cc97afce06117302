#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace crucible::protocol {

    // Requests served by the node control socket.
    inline constexpr const char* kIsCodePresent = "is_code_present";
    inline constexpr const char* kLoadCode = "load_code";
    inline constexpr const char* kPlatformVersion = "platform_version";
    inline constexpr const char* kIsManagerRunning = "is_management_process_running";
    inline constexpr const char* kStartManager = "start_management_process";
    inline constexpr const char* kStartConnectionServer = "start_connection_server";

    // Requests served by the management process.
    inline constexpr const char* kStartRuntimeServer = "start_runtime_server";

    // Symbol every runtime code unit exports to run the management process.
    inline constexpr const char* kManagerEntrySymbol = "crucible_manager_main";
    using ManagerEntry = int (*)(int listen_fd, const char* options_json);

    // Handle of a per-connection runtime server.
    struct ServerHandle {
        std::string address;
        int pid = -1;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ServerHandle, address, pid)

    // Well-known socket addresses derived from a runtime identity.
    inline std::string parent_address(const std::filesystem::path& dir,
                                      const std::string& identity) {
        return (dir / (identity + ".parent.sock")).string();
    }

    inline std::string node_address(const std::filesystem::path& dir,
                                    const std::string& identity) {
        return (dir / (identity + ".node.sock")).string();
    }

    inline std::string manager_address(const std::filesystem::path& dir,
                                       const std::string& identity) {
        return (dir / (identity + ".manager.sock")).string();
    }

    inline std::string server_address(const std::filesystem::path& dir,
                                      const std::string& identity, int index) {
        return (dir / (identity + ".server." + std::to_string(index) + ".sock")).string();
    }

    inline std::filesystem::path code_dir(const std::filesystem::path& dir,
                                          const std::string& identity) {
        return dir / (identity + ".code");
    }

} // namespace crucible::protocol
