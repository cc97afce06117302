#pragma once
#include <string>

#ifndef CRUCIBLE_VERSION
#define CRUCIBLE_VERSION "0.0.0"
#endif

namespace crucible::core::config {

    // Identifies the build that produced this binary. Code units only load
    // into a process built by the same toolchain and project version.
    inline std::string platform_version() {
        std::string version = "crucible " CRUCIBLE_VERSION;
#if defined(__clang__)
        version += " (clang " __clang_version__;
#elif defined(__GNUC__)
        version += " (gcc " __VERSION__;
#else
        version += " (unknown compiler";
#endif
#if defined(__x86_64__)
        version += ", x86_64";
#elif defined(__aarch64__)
        version += ", aarch64";
#endif
        version += ")";
        return version;
    }

} // namespace crucible::core::config
