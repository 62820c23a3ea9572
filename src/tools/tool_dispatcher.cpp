#include "tools/tool_dispatcher.hpp"

#include <type_traits>
#include <utility>
#include <variant>
#include "core/logging/logger.hpp"
#include "tools/parameter_coercion.hpp"

namespace shopagent::tools {

using nlohmann::json;
using protocol::ToolError;
using protocol::ToolErrorKind;
using protocol::ToolResult;
using store::StoreError;
using store::StoreErrorKind;

namespace {

ToolResult success(json payload) {
    ToolResult result;
    result.success = true;
    result.payload = std::move(payload);
    result.status_code = protocol::kStatusOk;
    return result;
}

json error_details(const StoreError& error) {
    json details = json::object();
    switch (error.kind) {
        case StoreErrorKind::PageLimitExceeded:
            details["limit"] = error.limit;
            details["max_limit"] = error.max_limit;
            break;
        case StoreErrorKind::InsufficientInventory:
            details["sku"] = error.sku;
            details["available"] = error.available;
            details["requested"] = error.requested;
            break;
        case StoreErrorKind::InvalidAmount:
            details["sku"] = error.sku;
            details["amount"] = error.requested;
            if (error.in_basket > 0) {
                details["in_basket"] = error.in_basket;
            }
            break;
        case StoreErrorKind::UnknownProduct:
        case StoreErrorKind::NotInBasket:
            details["sku"] = error.sku;
            break;
        case StoreErrorKind::EmptyBasket:
            break;
    }
    return details;
}

ToolResult domain_failure(const StoreError& error) {
    ToolResult result;
    result.success = false;
    result.status_code = protocol::kStatusDomainError;
    result.error = ToolError{ToolErrorKind::Domain, store::to_code(error.kind),
                             error.message, error_details(error)};
    return result;
}

ToolResult contract_failure(const core::errors::AgentError& error) {
    ToolResult result;
    result.success = false;
    result.status_code = protocol::kStatusContractError;
    json details = json::object();
    if (!error.hint.empty()) {
        details["hint"] = error.hint;
    }
    result.error = ToolError{ToolErrorKind::Contract, error.code, error.message,
                             std::move(details)};
    return result;
}

json acknowledgement_payload(const store::Acknowledgement& ack) {
    return json{{"message", ack.message}};
}

}  // namespace

ToolDispatcher::ToolDispatcher(store::ResourceStore& store) : store_(store) {}

std::vector<std::string> ToolDispatcher::action_names() {
    return {protocol::kListProducts, protocol::kAddToBasket, protocol::kViewBasket,
            protocol::kRemoveFromBasket, protocol::kCheckoutBasket};
}

ToolResult ToolDispatcher::dispatch(const protocol::ProposedAction& action) const {
    auto arguments = coerce_arguments(action.name, action.parameters);
    if (core::errors::is_error(arguments)) {
        const auto& err = core::errors::get_error(arguments);
        LOG_WARN("Dispatcher: rejected '" + action.name + "' [" + err.code +
                 "]: " + err.message);
        return contract_failure(err);
    }
    return invoke(core::errors::get_value(arguments));
}

ToolResult ToolDispatcher::invoke(const protocol::ToolArguments& arguments) const {
    return std::visit(
        [this](const auto& args) -> ToolResult {
            using Args = std::decay_t<decltype(args)>;
            if constexpr (std::is_same_v<Args, protocol::ListProductsArgs>) {
                return list_products(args);
            } else if constexpr (std::is_same_v<Args, protocol::AddToBasketArgs>) {
                return add_to_basket(args);
            } else if constexpr (std::is_same_v<Args, protocol::ViewBasketArgs>) {
                return view_basket();
            } else if constexpr (std::is_same_v<Args, protocol::RemoveFromBasketArgs>) {
                return remove_from_basket(args);
            } else {
                return checkout_basket();
            }
        },
        arguments);
}

ToolResult ToolDispatcher::list_products(const protocol::ListProductsArgs& args) const {
    auto page = store_.list_products(args.offset, args.limit);
    if (core::errors::is_error(page)) {
        return domain_failure(core::errors::get_error(page));
    }

    const auto& value = core::errors::get_value(page);
    json products = json::array();
    for (const auto& listing : value.products) {
        products.push_back({{"sku", listing.product.sku},
                            {"name", listing.product.name},
                            {"category", listing.product.category},
                            {"price", listing.product.price},
                            {"available", listing.available}});
    }

    json payload;
    payload["products"] = std::move(products);
    payload["next_offset"] = value.next_offset.has_value()
                                 ? static_cast<long long>(value.next_offset.value())
                                 : -1LL;
    payload["message"] = "Products retrieved successfully";
    return success(std::move(payload));
}

ToolResult ToolDispatcher::add_to_basket(const protocol::AddToBasketArgs& args) const {
    auto ack = store_.add_to_basket(args.sku, args.amount);
    if (core::errors::is_error(ack)) {
        return domain_failure(core::errors::get_error(ack));
    }
    return success(acknowledgement_payload(core::errors::get_value(ack)));
}

ToolResult ToolDispatcher::view_basket() const {
    json items = json::array();
    for (const auto& line : store_.view_basket()) {
        items.push_back({{"sku", line.sku},
                         {"name", line.name},
                         {"quantity", line.quantity},
                         {"price", line.unit_price}});
    }
    return success(json{{"items", std::move(items)}});
}

ToolResult ToolDispatcher::remove_from_basket(
    const protocol::RemoveFromBasketArgs& args) const {
    auto ack = store_.remove_from_basket(args.sku, args.amount);
    if (core::errors::is_error(ack)) {
        return domain_failure(core::errors::get_error(ack));
    }
    return success(acknowledgement_payload(core::errors::get_value(ack)));
}

ToolResult ToolDispatcher::checkout_basket() const {
    auto receipt = store_.checkout();
    if (core::errors::is_error(receipt)) {
        return domain_failure(core::errors::get_error(receipt));
    }

    const auto& value = core::errors::get_value(receipt);
    json purchased = json::array();
    for (const auto& line : value.purchased) {
        purchased.push_back(json{{"sku", line.sku}, {"quantity", line.quantity}});
    }
    return success(json{{"message", "ok"},
                        {"purchased", std::move(purchased)},
                        {"total_price", value.total_price}});
}

}  // namespace shopagent::tools
