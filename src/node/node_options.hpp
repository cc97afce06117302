#pragma once
#include <filesystem>
#include <string>
#include "core/errors/crucible_errors.hpp"

namespace crucible::node {

    // Command line of a runtime node:
    //   crucible_node [--lifeline-fd <fd>] --sname <identity> --socket-dir <dir> --eval <script>
    //                 [--log-level <level>] -- <parent address>
    struct NodeOptions {
        std::string identity;
        std::filesystem::path socket_dir;
        std::string init_script;
        std::string parent_address;
        std::string log_level = "info";
        // Read end of a pipe held open by the coordinator; -1 when absent.
        int lifeline_fd = -1;
    };

    crucible::core::errors::Result<NodeOptions> parse_node_options(int argc, char* argv[]);

} // namespace crucible::node
