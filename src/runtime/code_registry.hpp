#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "core/errors/crucible_errors.hpp"

namespace crucible::runtime {

// Shared objects loaded into this process, keyed by unit name.
class CodeRegistry {
public:
    explicit CodeRegistry(std::filesystem::path code_dir);
    ~CodeRegistry();

    CodeRegistry(const CodeRegistry&) = delete;
    CodeRegistry& operator=(const CodeRegistry&) = delete;

    // Writes `binary` under the code directory and loads it.
    core::errors::Status load(const std::string& unit,
                              const std::vector<std::uint8_t>& binary);

    bool is_loaded(const std::string& unit) const;
    std::vector<std::string> loaded_units() const;

    // Looks the symbol up in every loaded unit; nullptr when absent.
    void* find_symbol(const std::string& symbol) const;

    // Closes every unit and deletes the files this registry wrote.
    void unload_all();

    const std::filesystem::path& code_dir() const { return code_dir_; }

private:
    struct LoadedUnit {
        void* handle = nullptr;
        std::filesystem::path path;
    };

    core::errors::Status open_unit(const std::string& unit, const std::filesystem::path& path);

    std::filesystem::path code_dir_;
    std::map<std::string, LoadedUnit> units_;
};

// Closes and deletes every unit loaded into `registry`, i.e. into this
// process. Remote nodes are unaffected.
void unload(CodeRegistry& registry);

// Reads a file into memory, e.g. a code unit about to be transferred.
core::errors::Result<std::vector<std::uint8_t>> read_binary_file(
    const std::filesystem::path& path);

}  // namespace crucible::runtime
