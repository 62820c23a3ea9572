#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace shopagent::protocol {

    // 200 for success, 400 when the store rejects the operation, 422 when the
    // proposal itself is malformed (unknown tool, uncoercible parameters).
    constexpr int kStatusOk = 200;
    constexpr int kStatusDomainError = 400;
    constexpr int kStatusContractError = 422;

    enum class ToolErrorKind {
        Domain,     // The action was valid but the store said no
        Contract    // The action could not be dispatched at all
    };

    struct ToolError {
        ToolErrorKind kind = ToolErrorKind::Domain;
        std::string code;
        std::string message;
        nlohmann::json details = nlohmann::json::object();
    };

    // Uniform envelope every dispatched action produces.
    struct ToolResult {
        bool success = false;
        nlohmann::json payload = nlohmann::json::object();
        std::optional<ToolError> error;
        int status_code = kStatusOk;
    };

    inline std::string to_string(const ToolErrorKind kind) {
        switch (kind) {
            case ToolErrorKind::Domain:
                return "domain";
            case ToolErrorKind::Contract:
                return "contract";
            default:
                return "unknown";
        }
    }

    inline nlohmann::json to_json(const ToolResult& result) {
        nlohmann::json envelope;
        envelope["success"] = result.success;
        envelope["status_code"] = result.status_code;
        if (result.success) {
            envelope["payload"] = result.payload;
        } else if (result.error.has_value()) {
            envelope["error"] = {{"kind", to_string(result.error->kind)},
                                 {"code", result.error->code},
                                 {"message", result.error->message},
                                 {"details", result.error->details}};
        }
        return envelope;
    }

    // Compact JSON text. Invalid UTF-8 inside strings is written as U+FFFD
    // instead of throwing.
    inline std::string to_text(const nlohmann::json& value) {
        return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }

} // namespace shopagent::protocol
