#pragma once
#include <string>
#include <variant>

namespace shopagent::core::errors {

    // 1. Define typed error categories
    enum class ErrorCategory {
        Input,      // E.g., User provided an invalid CLI flag or a broken catalog file
        Domain,     // E.g., The store rejected an operation (page limit, inventory)
        Contract,   // E.g., The proposer asked for an unknown tool or sent bad parameters
        Provider,   // E.g., The action proposer could not produce a next step
        Internal    // E.g., C++ logic bug or I/O failure
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Define the Propagation Strategy (Result Object)
    // A Result holds either a successful value of type T, OR an error of type E.
    // Everything outside the store uses the default AgentError.
    template <typename T, typename E = AgentError>
    using Result = std::variant<T, E>;

    template <typename T, typename E>
    bool is_error(const std::variant<T, E>& result) {
        return std::holds_alternative<E>(result);
    }

    template <typename T, typename E>
    const E& get_error(const std::variant<T, E>& result) {
        return std::get<E>(result);
    }

    template <typename T, typename E>
    const T& get_value(const std::variant<T, E>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Domain:   return "domain";
            case ErrorCategory::Contract: return "contract";
            case ErrorCategory::Provider: return "provider";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace shopagent::core::errors
