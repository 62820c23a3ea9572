#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace shopagent::store {

// Immutable catalog entry. Prices are integer cents.
struct Product {
    std::string sku;
    std::string name;
    std::int64_t price = 0;
    std::string category;
};

// One catalog entry as seen through list_products: the product plus the
// inventory level at the moment of listing.
struct ProductListing {
    Product product;
    int available = 0;
};

struct ProductPage {
    std::vector<ProductListing> products;
    // std::nullopt means there are no more pages.
    std::optional<std::size_t> next_offset;
};

struct BasketLine {
    std::string sku;
    std::string name;
    int quantity = 0;
    std::int64_t unit_price = 0;
};

struct PurchasedLine {
    std::string sku;
    int quantity = 0;
};

struct CheckoutReceipt {
    std::vector<PurchasedLine> purchased;
    std::int64_t total_price = 0;
};

struct Acknowledgement {
    std::string message = "ok";
};

// Seed data handed to a store at creation time.
struct SeedEntry {
    Product product;
    int available = 0;
};

struct CatalogSeed {
    std::vector<SeedEntry> entries;
    // Units another customer buys right before the first checkout attempt.
    std::vector<PurchasedLine> competing_purchase;
};

}  // namespace shopagent::store
