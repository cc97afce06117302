#include "runtime/code_registry.hpp"

#include <dlfcn.h>
#include <fstream>
#include <iterator>
#include <system_error>
#include "core/logging/logger.hpp"

namespace crucible::runtime {

using core::errors::CrucibleError;
using core::errors::ErrorCategory;

CodeRegistry::CodeRegistry(std::filesystem::path code_dir)
    : code_dir_(std::move(code_dir)) {}

CodeRegistry::~CodeRegistry() {
    unload_all();
}

core::errors::Status CodeRegistry::load(const std::string& unit,
                                        const std::vector<std::uint8_t>& binary) {
    if (is_loaded(unit)) {
        return core::errors::ok();
    }

    std::error_code ec;
    std::filesystem::create_directories(code_dir_, ec);
    if (ec) {
        return CrucibleError{ErrorCategory::Bootstrap,
                             "Unable to create code directory " + code_dir_.string() +
                                 ": " + ec.message(),
                             "code_load_failed"};
    }

    const auto path = code_dir_ / (unit + ".so");
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return CrucibleError{ErrorCategory::Bootstrap,
                                 "Unable to write code unit to " + path.string(),
                                 "code_load_failed"};
        }
        out.write(reinterpret_cast<const char*>(binary.data()),
                  static_cast<std::streamsize>(binary.size()));
        if (!out) {
            return CrucibleError{ErrorCategory::Bootstrap,
                                 "Failed writing code unit to " + path.string(),
                                 "code_load_failed"};
        }
    }

    auto opened = open_unit(unit, path);
    if (core::errors::is_error(opened)) {
        std::filesystem::remove(path, ec);
    }
    return opened;
}

core::errors::Status CodeRegistry::open_unit(const std::string& unit,
                                             const std::filesystem::path& path) {
    // RTLD_LOCAL keeps units from resolving against each other.
    void* handle = ::dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
        const char* reason = ::dlerror();
        return CrucibleError{ErrorCategory::Bootstrap,
                             reason != nullptr ? reason : "unknown loader error",
                             "code_load_failed"};
    }
    units_[unit] = LoadedUnit{handle, path};
    LOG_DEBUG("Loaded code unit " + unit + " from " + path.string());
    return core::errors::ok();
}

bool CodeRegistry::is_loaded(const std::string& unit) const {
    return units_.find(unit) != units_.end();
}

std::vector<std::string> CodeRegistry::loaded_units() const {
    std::vector<std::string> names;
    names.reserve(units_.size());
    for (const auto& [name, loaded] : units_) {
        names.push_back(name);
    }
    return names;
}

void* CodeRegistry::find_symbol(const std::string& symbol) const {
    for (const auto& [name, loaded] : units_) {
        if (void* address = ::dlsym(loaded.handle, symbol.c_str())) {
            return address;
        }
    }
    return nullptr;
}

void CodeRegistry::unload_all() {
    for (auto& [name, loaded] : units_) {
        if (::dlclose(loaded.handle) != 0) {
            const char* reason = ::dlerror();
            LOG_WARN("Failed to close code unit " + name + ": " +
                     (reason != nullptr ? reason : "unknown"));
        }
        std::error_code ec;
        std::filesystem::remove(loaded.path, ec);
    }
    units_.clear();
}

void unload(CodeRegistry& registry) {
    for (const auto& unit : registry.loaded_units()) {
        LOG_DEBUG("Unloading code unit " + unit);
    }
    registry.unload_all();
}

core::errors::Result<std::vector<std::uint8_t>> read_binary_file(
    const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return CrucibleError{ErrorCategory::Bootstrap,
                             "Unable to read code unit " + path.string(),
                             "code_unit_unreadable",
                             "Check the code_units setting."};
    }
    return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in),
                                     std::istreambuf_iterator<char>());
}

}  // namespace crucible::runtime
