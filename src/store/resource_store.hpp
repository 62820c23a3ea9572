#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "store/product.hpp"
#include "store/store_errors.hpp"

namespace shopagent::store {

// Owns the catalog, per-SKU inventory and the basket. Every public operation
// runs under one mutex, so a store can be shared between sessions.
class ResourceStore {
    struct PassKey {
        explicit PassKey() = default;
    };

public:
    static constexpr std::size_t kMaxPageSize = 3;

    // Validates the seed (unique non-empty SKUs, non-negative price and
    // inventory) and builds a store with an empty basket.
    static core::errors::Result<std::shared_ptr<ResourceStore>> create(
        CatalogSeed seed);

    // Only reachable through create().
    ResourceStore(PassKey, std::vector<Product> catalog, std::vector<int> inventory,
                  std::vector<PurchasedLine> competing_purchase);

    ResourceStore(const ResourceStore&) = delete;
    ResourceStore& operator=(const ResourceStore&) = delete;

    StoreResult<ProductPage> list_products(std::size_t offset,
                                           std::size_t limit) const;

    // Fails with InvalidAmount when the basket quantity would exceed INT_MAX.
    StoreResult<Acknowledgement> add_to_basket(const std::string& sku, int amount);

    // Removing more than the basket holds deletes the entry.
    StoreResult<Acknowledgement> remove_from_basket(const std::string& sku,
                                                    int amount);

    std::vector<BasketLine> view_basket() const;

    // All-or-nothing: either every basket line is covered by inventory and
    // committed, or nothing changes.
    StoreResult<CheckoutReceipt> checkout();

    std::vector<ProductListing> inventory_snapshot() const;
    std::map<std::string, int> basket_snapshot() const;
    std::optional<int> available(const std::string& sku) const;
    std::size_t catalog_size() const;

private:
    std::optional<std::size_t> find_index(const std::string& sku) const;
    void apply_competing_purchase();

    const std::vector<Product> catalog_;
    std::vector<int> inventory_;
    std::unordered_map<std::string, std::size_t> index_;
    std::unordered_map<std::string, int> basket_;
    std::vector<PurchasedLine> competing_purchase_;
    bool checkout_attempted_ = false;
    mutable std::mutex mutex_;
};

}  // namespace shopagent::store
