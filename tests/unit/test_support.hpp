#pragma once
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <thread>
#include "core/config/short_id.hpp"

namespace crucible::testing {

// Scratch directory removed on destruction. Lives under /tmp so socket
// paths stay well below the sun_path limit.
class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::path("/tmp") /
                ("crucible-test-" + crucible::core::config::generate_short_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempWorkspace(const TempWorkspace&) = delete;
    TempWorkspace& operator=(const TempWorkspace&) = delete;

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path write(const std::string& name, const std::string& contents) const {
        const auto path = root_ / name;
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
        return path;
    }

private:
    std::filesystem::path root_;
};

template <typename Predicate>
bool eventually(Predicate predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return predicate();
}

}  // namespace crucible::testing
