#include "tools/parameter_coercion.hpp"

#include <charconv>
#include <climits>
#include <cmath>
#include <optional>
#include <system_error>

namespace shopagent::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::AddToBasketArgs;
using protocol::CheckoutBasketArgs;
using protocol::ListProductsArgs;
using protocol::RemoveFromBasketArgs;
using protocol::ToolArguments;
using protocol::ViewBasketArgs;

namespace {

AgentError coercion_error(const std::string& message) {
    return AgentError{ErrorCategory::Contract, message, "parameter_coercion_failed"};
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Missing keys and explicit nulls are both "not provided".
const json* find_field(const json& parameters, const std::string& field) {
    if (!parameters.is_object()) {
        return nullptr;
    }
    const auto it = parameters.find(field);
    if (it == parameters.end() || it->is_null()) {
        return nullptr;
    }
    return &(*it);
}

core::errors::Result<int> bounded_int(const json& parameters, const std::string& field,
                                      const long long min_value,
                                      const std::optional<int> fallback) {
    const json* value = find_field(parameters, field);
    if (value == nullptr) {
        if (fallback.has_value()) {
            return fallback.value();
        }
        return coercion_error("Missing required parameter '" + field + "'");
    }

    auto parsed = coerce_integer(*value, field);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const long long number = core::errors::get_value(parsed);
    if (number < min_value || number > INT_MAX) {
        return coercion_error("Parameter '" + field + "' out of range: " +
                              std::to_string(number) + " (minimum " +
                              std::to_string(min_value) + ")");
    }
    return static_cast<int>(number);
}

core::errors::Result<std::string> required_sku(const json& parameters) {
    const json* value = find_field(parameters, "sku");
    if (value == nullptr) {
        return coercion_error("Missing required parameter 'sku'");
    }

    std::string sku;
    if (value->is_string()) {
        sku = trim(value->get<std::string>());
    } else if (value->is_number_integer()) {
        sku = value->dump();
    } else {
        return coercion_error("Parameter 'sku' must be a string");
    }

    if (sku.empty()) {
        return coercion_error("Parameter 'sku' cannot be empty");
    }
    return sku;
}

template <typename Args>
core::errors::Result<ToolArguments> sku_and_amount(const json& parameters) {
    auto sku = required_sku(parameters);
    if (core::errors::is_error(sku)) {
        return core::errors::get_error(sku);
    }
    auto amount = bounded_int(parameters, "amount", 1, std::nullopt);
    if (core::errors::is_error(amount)) {
        return core::errors::get_error(amount);
    }

    Args args;
    args.sku = core::errors::get_value(sku);
    args.amount = core::errors::get_value(amount);
    return ToolArguments{args};
}

}  // namespace

core::errors::Result<long long> coerce_integer(const json& value,
                                               const std::string& field) {
    if (value.is_boolean()) {
        return coercion_error("Parameter '" + field + "' must be an integer, got a boolean");
    }

    if (value.is_number_unsigned()) {
        const auto number = value.get<unsigned long long>();
        if (number > static_cast<unsigned long long>(LLONG_MAX)) {
            return coercion_error("Parameter '" + field + "' is too large");
        }
        return static_cast<long long>(number);
    }

    if (value.is_number_integer()) {
        return value.get<long long>();
    }

    if (value.is_number_float()) {
        const double number = value.get<double>();
        if (!std::isfinite(number) || std::floor(number) != number ||
            std::fabs(number) > 9.0e15) {
            return coercion_error("Parameter '" + field + "' must be a whole number, got " +
                                  value.dump());
        }
        return static_cast<long long>(number);
    }

    if (value.is_string()) {
        std::string text = trim(value.get<std::string>());
        if (!text.empty() && text.front() == '+') {
            text.erase(0, 1);
        }
        long long number = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, number);
        if (text.empty() || ec != std::errc() || ptr != end) {
            return coercion_error("Parameter '" + field + "' is not a valid integer: \"" +
                                  value.get<std::string>() + "\"");
        }
        return number;
    }

    return coercion_error("Parameter '" + field + "' must be an integer, got " +
                          std::string(value.type_name()));
}

core::errors::Result<ToolArguments> coerce_arguments(const std::string& action_name,
                                                     const json& parameters) {
    const bool known = action_name == protocol::kListProducts ||
                       action_name == protocol::kAddToBasket ||
                       action_name == protocol::kViewBasket ||
                       action_name == protocol::kRemoveFromBasket ||
                       action_name == protocol::kCheckoutBasket;
    if (!known) {
        return AgentError{ErrorCategory::Contract,
                          "Unknown action: '" + action_name + "'", "unknown_action",
                          "Use list_products, add_to_basket, view_basket, "
                          "remove_from_basket or checkout_basket."};
    }

    if (!parameters.is_null() && !parameters.is_object()) {
        return coercion_error("Parameters for '" + action_name +
                              "' must be a JSON object, got " +
                              std::string(parameters.type_name()));
    }

    if (action_name == protocol::kListProducts) {
        auto offset = bounded_int(parameters, "offset", 0, 0);
        if (core::errors::is_error(offset)) {
            return core::errors::get_error(offset);
        }
        auto limit = bounded_int(parameters, "limit", 1, 3);
        if (core::errors::is_error(limit)) {
            return core::errors::get_error(limit);
        }
        ListProductsArgs args;
        args.offset = static_cast<std::size_t>(core::errors::get_value(offset));
        args.limit = static_cast<std::size_t>(core::errors::get_value(limit));
        return ToolArguments{args};
    }
    if (action_name == protocol::kAddToBasket) {
        return sku_and_amount<AddToBasketArgs>(parameters);
    }
    if (action_name == protocol::kViewBasket) {
        return ToolArguments{ViewBasketArgs{}};
    }
    if (action_name == protocol::kRemoveFromBasket) {
        return sku_and_amount<RemoveFromBasketArgs>(parameters);
    }
    return ToolArguments{CheckoutBasketArgs{}};
}

}  // namespace shopagent::tools
