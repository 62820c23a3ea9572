#pragma once
#include <cstddef>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

namespace shopagent::protocol {

    // What the proposer hands the executor: a tool name plus loosely typed
    // parameters exactly as proposed, and the reason for choosing it.
    struct ProposedAction {
        std::string name;
        nlohmann::json parameters = nlohmann::json::object();
        std::string rationale;
    };

    // The proposer's way of saying "stop, the task is finished".
    struct GoalAchieved {
        std::string rationale;
    };

    using Proposal = std::variant<ProposedAction, GoalAchieved>;

    // Tool names understood by the dispatcher.
    inline constexpr const char* kListProducts = "list_products";
    inline constexpr const char* kAddToBasket = "add_to_basket";
    inline constexpr const char* kViewBasket = "view_basket";
    inline constexpr const char* kRemoveFromBasket = "remove_from_basket";
    inline constexpr const char* kCheckoutBasket = "checkout_basket";

    // Typed, validated arguments, one struct per tool. Produced by the
    // coercion step before anything touches the store.
    struct ListProductsArgs {
        std::size_t offset = 0;
        std::size_t limit = 3;
    };

    struct AddToBasketArgs {
        std::string sku;
        int amount = 0;
    };

    struct ViewBasketArgs {};

    struct RemoveFromBasketArgs {
        std::string sku;
        int amount = 0;
    };

    struct CheckoutBasketArgs {};

    using ToolArguments = std::variant<
        ListProductsArgs,
        AddToBasketArgs,
        ViewBasketArgs,
        RemoveFromBasketArgs,
        CheckoutBasketArgs
    >;

} // namespace shopagent::protocol
