#include "store/resource_store.hpp"

#include <algorithm>
#include <climits>
#include <cstdint>
#include <limits>
#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace shopagent::store {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

// price * quantity, or std::nullopt when it does not fit in 64 bits.
std::optional<std::int64_t> checked_line_price(const std::int64_t price,
                                               const int quantity) {
    if (quantity > 0 && price > std::numeric_limits<std::int64_t>::max() / quantity) {
        return std::nullopt;
    }
    return price * quantity;
}

}  // namespace

core::errors::Result<std::shared_ptr<ResourceStore>> ResourceStore::create(
    CatalogSeed seed) {
    std::vector<Product> catalog;
    std::vector<int> inventory;
    catalog.reserve(seed.entries.size());
    inventory.reserve(seed.entries.size());

    std::unordered_set<std::string> seen;
    for (auto& entry : seed.entries) {
        if (entry.product.sku.empty()) {
            return AgentError{ErrorCategory::Input,
                              "Catalog entry has an empty SKU.", "invalid_sku"};
        }
        if (!seen.insert(entry.product.sku).second) {
            return AgentError{ErrorCategory::Input,
                              "Duplicate SKU in catalog: " + entry.product.sku,
                              "duplicate_sku"};
        }
        if (entry.product.price < 0) {
            return AgentError{ErrorCategory::Input,
                              "Negative price for SKU: " + entry.product.sku,
                              "invalid_price"};
        }
        if (entry.available < 0) {
            return AgentError{ErrorCategory::Input,
                              "Negative inventory for SKU: " + entry.product.sku,
                              "invalid_inventory"};
        }
        inventory.push_back(entry.available);
        catalog.push_back(std::move(entry.product));
    }

    for (const auto& line : seed.competing_purchase) {
        if (seen.find(line.sku) == seen.end()) {
            return AgentError{ErrorCategory::Input,
                              "Competing purchase names unknown SKU: " + line.sku,
                              "unknown_sku"};
        }
        if (line.quantity < 0) {
            return AgentError{ErrorCategory::Input,
                              "Competing purchase quantity is negative for SKU: " +
                                  line.sku,
                              "invalid_inventory"};
        }
    }

    return std::make_shared<ResourceStore>(PassKey{}, std::move(catalog),
                                           std::move(inventory),
                                           std::move(seed.competing_purchase));
}

ResourceStore::ResourceStore(PassKey,
                             std::vector<Product> catalog,
                             std::vector<int> inventory,
                             std::vector<PurchasedLine> competing_purchase)
    : catalog_(std::move(catalog)),
      inventory_(std::move(inventory)),
      competing_purchase_(std::move(competing_purchase)) {
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        index_.emplace(catalog_[i].sku, i);
    }
}

std::optional<std::size_t> ResourceStore::find_index(const std::string& sku) const {
    const auto it = index_.find(sku);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

StoreResult<ProductPage> ResourceStore::list_products(const std::size_t offset,
                                                      const std::size_t limit) const {
    if (limit > kMaxPageSize) {
        StoreError error{StoreErrorKind::PageLimitExceeded,
                         "page limit exceeded limit: " + std::to_string(kMaxPageSize)};
        error.limit = limit;
        error.max_limit = kMaxPageSize;
        return error;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ProductPage page;
    const std::size_t begin = std::min(offset, catalog_.size());
    const std::size_t end = std::min(begin + limit, catalog_.size());
    for (std::size_t i = begin; i < end; ++i) {
        page.products.push_back(ProductListing{catalog_[i], inventory_[i]});
    }

    const std::size_t consumed = offset + page.products.size();
    if (consumed < catalog_.size()) {
        page.next_offset = consumed;
    }
    return page;
}

StoreResult<Acknowledgement> ResourceStore::add_to_basket(const std::string& sku,
                                                          const int amount) {
    if (amount <= 0) {
        StoreError error{StoreErrorKind::InvalidAmount,
                         "Amount must be positive, got " + std::to_string(amount)};
        error.sku = sku;
        error.requested = amount;
        return error;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!find_index(sku).has_value()) {
        StoreError error{StoreErrorKind::UnknownProduct,
                         "Product " + sku + " not found"};
        error.sku = sku;
        return error;
    }

    const auto line = basket_.find(sku);
    const int current = line == basket_.end() ? 0 : line->second;
    if (amount > INT_MAX - current) {
        StoreError error{StoreErrorKind::InvalidAmount,
                         "Adding " + std::to_string(amount) + " of " + sku +
                             " would overflow the basket quantity " +
                             std::to_string(current)};
        error.sku = sku;
        error.requested = amount;
        error.in_basket = current;
        return error;
    }

    basket_[sku] = current + amount;
    return Acknowledgement{};
}

StoreResult<Acknowledgement> ResourceStore::remove_from_basket(
    const std::string& sku, const int amount) {
    if (amount <= 0) {
        StoreError error{StoreErrorKind::InvalidAmount,
                         "Amount must be positive, got " + std::to_string(amount)};
        error.sku = sku;
        error.requested = amount;
        return error;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = basket_.find(sku);
    if (it == basket_.end()) {
        StoreError error{StoreErrorKind::NotInBasket,
                         "Product " + sku + " not in basket"};
        error.sku = sku;
        return error;
    }

    if (amount >= it->second) {
        basket_.erase(it);
    } else {
        it->second -= amount;
    }
    return Acknowledgement{};
}

std::vector<BasketLine> ResourceStore::view_basket() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BasketLine> lines;
    for (const auto& product : catalog_) {
        const auto it = basket_.find(product.sku);
        if (it == basket_.end()) {
            continue;
        }
        lines.push_back(BasketLine{product.sku, product.name, it->second, product.price});
    }
    return lines;
}

void ResourceStore::apply_competing_purchase() {
    for (const auto& line : competing_purchase_) {
        const auto index = find_index(line.sku);
        if (!index.has_value()) {
            continue;
        }
        int& level = inventory_[index.value()];
        const int before = level;
        level = std::max(0, level - line.quantity);
        LOG_WARN("Store: another customer bought " +
                 std::to_string(before - level) + " x " + line.sku +
                 " (available " + std::to_string(before) + " -> " +
                 std::to_string(level) + ")");
    }
}

StoreResult<CheckoutReceipt> ResourceStore::checkout() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (basket_.empty()) {
        return StoreError{StoreErrorKind::EmptyBasket, "Basket is empty"};
    }

    if (!checkout_attempted_) {
        checkout_attempted_ = true;
        apply_competing_purchase();
    }

    // Validate everything first, in catalog order, so the first shortfall
    // reported is stable and nothing is touched on failure.
    std::int64_t total_price = 0;
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        const auto it = basket_.find(catalog_[i].sku);
        if (it == basket_.end()) {
            continue;
        }
        if (it->second <= inventory_[i]) {
            const auto line_price = checked_line_price(catalog_[i].price, it->second);
            if (!line_price.has_value() ||
                total_price > std::numeric_limits<std::int64_t>::max() - *line_price) {
                StoreError error{StoreErrorKind::InvalidAmount,
                                 "Basket total overflows at product " + catalog_[i].sku};
                error.sku = catalog_[i].sku;
                error.requested = it->second;
                error.in_basket = it->second;
                return error;
            }
            total_price += *line_price;
            continue;
        }
        StoreError error{StoreErrorKind::InsufficientInventory,
                         "insufficient inventory for product " + catalog_[i].sku +
                             " during checkout: available " +
                             std::to_string(inventory_[i]) + ", in basket " +
                             std::to_string(it->second)};
        error.sku = catalog_[i].sku;
        error.available = inventory_[i];
        error.requested = it->second;
        return error;
    }

    CheckoutReceipt receipt;
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        const auto it = basket_.find(catalog_[i].sku);
        if (it == basket_.end()) {
            continue;
        }
        inventory_[i] -= it->second;
        receipt.purchased.push_back(PurchasedLine{catalog_[i].sku, it->second});
    }
    receipt.total_price = total_price;
    basket_.clear();
    return receipt;
}

std::vector<ProductListing> ResourceStore::inventory_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ProductListing> snapshot;
    snapshot.reserve(catalog_.size());
    for (std::size_t i = 0; i < catalog_.size(); ++i) {
        snapshot.push_back(ProductListing{catalog_[i], inventory_[i]});
    }
    return snapshot;
}

std::map<std::string, int> ResourceStore::basket_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::map<std::string, int>(basket_.begin(), basket_.end());
}

std::optional<int> ResourceStore::available(const std::string& sku) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto index = find_index(sku);
    if (!index.has_value()) {
        return std::nullopt;
    }
    return inventory_[index.value()];
}

std::size_t ResourceStore::catalog_size() const {
    return catalog_.size();
}

}  // namespace shopagent::store
