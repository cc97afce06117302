#pragma once
#include <string>
#include <variant>

namespace crucible::core::errors {

    // 1. Typed error categories, one per failure domain
    enum class ErrorCategory {
        Input,      // E.g., an invalid CLI flag or malformed request
        Spawn,      // E.g., the runtime executable is missing
        Handshake,  // E.g., the runtime never reported readiness
        Bootstrap,  // E.g., a code unit failed to load on the runtime
        Worker,     // E.g., an evaluator process could not be started
        Transport,  // E.g., a socket closed mid-request
        Internal    // E.g., a system call failed unexpectedly
    };

    // The standardized error payload
    struct CrucibleError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a CrucibleError.
    template <typename T>
    using Result = std::variant<T, CrucibleError>;

    // Result for operations that only succeed or fail.
    using Status = Result<std::monostate>;

    inline Status ok() {
        return std::monostate{};
    }

    // --- Helpers to work with std::variant ---

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<CrucibleError>(result);
    }

    template <typename T>
    const CrucibleError& get_error(const Result<T>& result) {
        return std::get<CrucibleError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:
                return "input";
            case ErrorCategory::Spawn:
                return "spawn";
            case ErrorCategory::Handshake:
                return "handshake";
            case ErrorCategory::Bootstrap:
                return "bootstrap";
            case ErrorCategory::Worker:
                return "worker";
            case ErrorCategory::Transport:
                return "transport";
            case ErrorCategory::Internal:
                return "internal";
            default:
                return "unknown";
        }
    }

} // namespace crucible::core::errors
