#pragma once

#include <cstddef>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace shopagent::store {

enum class StoreErrorKind {
    PageLimitExceeded,
    UnknownProduct,
    NotInBasket,
    InsufficientInventory,
    EmptyBasket,
    InvalidAmount
};

// Domain failure reported by the store. Only the fields relevant to the kind
// are filled in.
struct StoreError {
    StoreErrorKind kind;
    std::string message;
    std::string sku;
    int available = 0;
    int requested = 0;
    int in_basket = 0;
    std::size_t limit = 0;
    std::size_t max_limit = 0;
};

template <typename T>
using StoreResult = core::errors::Result<T, StoreError>;

inline std::string to_code(const StoreErrorKind kind) {
    switch (kind) {
        case StoreErrorKind::PageLimitExceeded:
            return "page_limit_exceeded";
        case StoreErrorKind::UnknownProduct:
            return "unknown_product";
        case StoreErrorKind::NotInBasket:
            return "not_in_basket";
        case StoreErrorKind::InsufficientInventory:
            return "insufficient_inventory";
        case StoreErrorKind::EmptyBasket:
            return "empty_basket";
        case StoreErrorKind::InvalidAmount:
            return "invalid_amount";
        default:
            return "unknown";
    }
}

}  // namespace shopagent::store
