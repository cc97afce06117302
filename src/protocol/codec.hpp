#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/crucible_errors.hpp"

namespace crucible::protocol {

    // Converts a received message into a contract struct. Missing or mistyped
    // fields become a Transport error instead of an exception.
    template <typename T>
    core::errors::Result<T> decode(const nlohmann::json& message) {
        try {
            return message.get<T>();
        } catch (const nlohmann::json::exception& e) {
            return core::errors::CrucibleError{
                core::errors::ErrorCategory::Transport,
                std::string("Malformed message: ") + e.what(),
                "malformed_message"};
        }
    }

    // Encodes a contract struct as a message tagged with `type`.
    template <typename T>
    nlohmann::json encode(const std::string& type, const T& body) {
        nlohmann::json message = body;
        message["type"] = type;
        return message;
    }

    // Replies on request/response links carry {"ok": bool} plus either the
    // payload or {"code", "reason"}.
    inline nlohmann::json ok_reply(nlohmann::json payload = nlohmann::json::object()) {
        payload["ok"] = true;
        return payload;
    }

    inline nlohmann::json error_reply(const core::errors::CrucibleError& error) {
        return nlohmann::json{{"ok", false},
                              {"code", error.code},
                              {"reason", error.message},
                              {"category", core::errors::to_string(error.category)}};
    }

    inline core::errors::Result<nlohmann::json> unwrap_reply(
        const nlohmann::json& reply, core::errors::ErrorCategory category) {
        if (!reply.is_object() || !reply.contains("ok") || !reply["ok"].is_boolean()) {
            return core::errors::CrucibleError{core::errors::ErrorCategory::Transport,
                                               "Reply is missing the 'ok' flag.",
                                               "malformed_message"};
        }
        if (reply["ok"].get<bool>()) {
            return reply;
        }
        return core::errors::CrucibleError{category,
                                           reply.value("reason", std::string("unknown failure")),
                                           reply.value("code", std::string("remote_error"))};
    }

} // namespace crucible::protocol
