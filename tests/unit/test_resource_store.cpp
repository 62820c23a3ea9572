#include <atomic>
#include <climits>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "store/catalog_seed.hpp"
#include "store/resource_store.hpp"

namespace {

using shopagent::core::errors::get_error;
using shopagent::core::errors::get_value;
using shopagent::core::errors::is_error;
using shopagent::store::CatalogSeed;
using shopagent::store::ResourceStore;
using shopagent::store::StoreErrorKind;

std::shared_ptr<ResourceStore> make_store(bool with_race = false) {
    CatalogSeed seed = shopagent::store::default_catalog();
    if (with_race) {
        seed.competing_purchase = shopagent::store::demo_competing_purchase();
    }
    auto created = ResourceStore::create(std::move(seed));
    EXPECT_FALSE(is_error(created));
    return get_value(created);
}

CatalogSeed tiny_seed() {
    CatalogSeed seed;
    seed.entries = {{{"a", "Alpha", 100, "x"}, 2}, {{"b", "Beta", 250, "x"}, 1}};
    return seed;
}

TEST(ResourceStoreTest, PagesThroughCatalogInOrder) {
    auto store = make_store();

    auto first = store->list_products(0, 3);
    ASSERT_FALSE(is_error(first));
    ASSERT_EQ(get_value(first).products.size(), 3u);
    EXPECT_EQ(get_value(first).products[0].product.sku, "rc-1200");
    EXPECT_EQ(get_value(first).products[1].product.sku, "gpu-h100");
    EXPECT_EQ(get_value(first).products[1].available, 3);
    ASSERT_TRUE(get_value(first).next_offset.has_value());
    EXPECT_EQ(get_value(first).next_offset.value(), 3u);

    auto last = store->list_products(6, 3);
    ASSERT_FALSE(is_error(last));
    ASSERT_EQ(get_value(last).products.size(), 2u);
    EXPECT_EQ(get_value(last).products[1].product.sku, "psu-1200w");
    EXPECT_FALSE(get_value(last).next_offset.has_value());
}

TEST(ResourceStoreTest, OffsetPastEndYieldsEmptyFinalPage) {
    auto store = make_store();
    auto page = store->list_products(50, 2);
    ASSERT_FALSE(is_error(page));
    EXPECT_TRUE(get_value(page).products.empty());
    EXPECT_FALSE(get_value(page).next_offset.has_value());
}

TEST(ResourceStoreTest, RejectsPagesLargerThanThree) {
    auto store = make_store();
    auto page = store->list_products(0, 5);
    ASSERT_TRUE(is_error(page));
    const auto& err = get_error(page);
    EXPECT_EQ(err.kind, StoreErrorKind::PageLimitExceeded);
    EXPECT_EQ(err.message, "page limit exceeded limit: 3");
    EXPECT_EQ(err.limit, 5u);
    EXPECT_EQ(err.max_limit, 3u);
}

TEST(ResourceStoreTest, AddAccumulatesAndDoesNotReserveInventory) {
    auto store = make_store();
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 2)));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 5)));

    EXPECT_EQ(store->basket_snapshot().at("gpu-h100"), 7);
    EXPECT_EQ(store->available("gpu-h100").value(), 3);
}

TEST(ResourceStoreTest, AddRejectsUnknownProductAndBadAmount) {
    auto store = make_store();

    auto unknown = store->add_to_basket("nope", 1);
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).kind, StoreErrorKind::UnknownProduct);
    EXPECT_EQ(get_error(unknown).message, "Product nope not found");

    auto zero = store->add_to_basket("gpu-h100", 0);
    ASSERT_TRUE(is_error(zero));
    EXPECT_EQ(get_error(zero).kind, StoreErrorKind::InvalidAmount);
    EXPECT_TRUE(store->basket_snapshot().empty());
}

TEST(ResourceStoreTest, RemoveDecrementsOrDeletesLine) {
    auto store = make_store();
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-a100", 4)));

    ASSERT_FALSE(is_error(store->remove_from_basket("gpu-a100", 1)));
    EXPECT_EQ(store->basket_snapshot().at("gpu-a100"), 3);

    ASSERT_FALSE(is_error(store->remove_from_basket("gpu-a100", 10)));
    EXPECT_TRUE(store->basket_snapshot().empty());

    auto missing = store->remove_from_basket("gpu-a100", 1);
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).kind, StoreErrorKind::NotInBasket);
    EXPECT_EQ(get_error(missing).message, "Product gpu-a100 not in basket");
}

TEST(ResourceStoreTest, ViewBasketFollowsCatalogOrder) {
    auto store = make_store();
    ASSERT_FALSE(is_error(store->add_to_basket("psu-1200w", 1)));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 2)));

    const auto lines = store->view_basket();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].sku, "gpu-h100");
    EXPECT_EQ(lines[0].quantity, 2);
    EXPECT_EQ(lines[0].unit_price, 20000);
    EXPECT_EQ(lines[1].sku, "psu-1200w");
}

TEST(ResourceStoreTest, CheckoutCommitsAndClearsBasket) {
    auto store = make_store();
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 3)));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-a100", 1)));

    auto receipt = store->checkout();
    ASSERT_FALSE(is_error(receipt));
    ASSERT_EQ(get_value(receipt).purchased.size(), 2u);
    EXPECT_EQ(get_value(receipt).purchased[0].sku, "gpu-h100");
    EXPECT_EQ(get_value(receipt).purchased[0].quantity, 3);
    EXPECT_EQ(get_value(receipt).total_price, 3 * 20000 + 11950);

    EXPECT_EQ(store->available("gpu-h100").value(), 0);
    EXPECT_EQ(store->available("gpu-a100").value(), 3);
    EXPECT_TRUE(store->basket_snapshot().empty());
}

TEST(ResourceStoreTest, CheckoutIsAllOrNothing) {
    auto store = make_store();
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-a100", 1)));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 4)));

    auto receipt = store->checkout();
    ASSERT_TRUE(is_error(receipt));
    const auto& err = get_error(receipt);
    EXPECT_EQ(err.kind, StoreErrorKind::InsufficientInventory);
    EXPECT_EQ(err.sku, "gpu-h100");
    EXPECT_EQ(err.available, 3);
    EXPECT_EQ(err.requested, 4);
    EXPECT_EQ(err.message,
              "insufficient inventory for product gpu-h100 during checkout: "
              "available 3, in basket 4");

    EXPECT_EQ(store->available("gpu-a100").value(), 4);
    EXPECT_EQ(store->available("gpu-h100").value(), 3);
    EXPECT_EQ(store->basket_snapshot().at("gpu-a100"), 1);
    EXPECT_EQ(store->basket_snapshot().at("gpu-h100"), 4);
}

TEST(ResourceStoreTest, EmptyBasketCheckoutFails) {
    auto store = make_store();
    auto receipt = store->checkout();
    ASSERT_TRUE(is_error(receipt));
    EXPECT_EQ(get_error(receipt).kind, StoreErrorKind::EmptyBasket);
    EXPECT_EQ(get_error(receipt).message, "Basket is empty");
}

TEST(ResourceStoreTest, CompetingPurchaseLandsOnFirstCheckoutOnly) {
    auto store = make_store(true);
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 3)));

    EXPECT_EQ(store->available("gpu-h100").value(), 3);
    auto first = store->checkout();
    ASSERT_TRUE(is_error(first));
    EXPECT_EQ(get_error(first).available, 1);
    EXPECT_EQ(store->available("gpu-a100").value(), 3);

    ASSERT_FALSE(is_error(store->remove_from_basket("gpu-h100", 2)));
    auto second = store->checkout();
    ASSERT_FALSE(is_error(second));
    EXPECT_EQ(store->available("gpu-h100").value(), 0);
    EXPECT_EQ(store->available("gpu-a100").value(), 3);
}

TEST(ResourceStoreTest, EmptyCheckoutDoesNotTriggerCompetingPurchase) {
    auto store = make_store(true);
    ASSERT_TRUE(is_error(store->checkout()));
    EXPECT_EQ(store->available("gpu-h100").value(), 3);
}

TEST(ResourceStoreTest, CreateRejectsBadSeeds) {
    CatalogSeed duplicate = tiny_seed();
    duplicate.entries.push_back(duplicate.entries.front());
    auto dup = ResourceStore::create(duplicate);
    ASSERT_TRUE(is_error(dup));
    EXPECT_EQ(get_error(dup).code, "duplicate_sku");

    CatalogSeed negative = tiny_seed();
    negative.entries[1].available = -1;
    auto neg = ResourceStore::create(negative);
    ASSERT_TRUE(is_error(neg));
    EXPECT_EQ(get_error(neg).code, "invalid_inventory");

    CatalogSeed race = tiny_seed();
    race.competing_purchase = {{"zzz", 1}};
    auto bad_race = ResourceStore::create(race);
    ASSERT_TRUE(is_error(bad_race));
    EXPECT_EQ(get_error(bad_race).code, "unknown_sku");
}

TEST(ResourceStoreTest, UnknownSkuHasNoAvailability) {
    auto created = ResourceStore::create(tiny_seed());
    ASSERT_FALSE(is_error(created));
    const auto store = get_value(created);
    EXPECT_EQ(store->catalog_size(), 2u);
    EXPECT_FALSE(store->available("zzz").has_value());
}

CatalogSeed gpu_seed() {
    CatalogSeed seed;
    seed.entries = {{{"gpu-h100", "Nvidia H100", 20000, "gpu"}, 3},
                    {{"gpu-a100", "Nvidia A100", 11950, "gpu"}, 4}};
    return seed;
}

TEST(ResourceStoreTest, BuyingEveryGpuEmptiesInventory) {
    auto store = get_value(ResourceStore::create(gpu_seed()));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 3)));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-a100", 4)));
    ASSERT_FALSE(is_error(store->checkout()));
    EXPECT_EQ(store->available("gpu-h100").value(), 0);
    EXPECT_EQ(store->available("gpu-a100").value(), 0);
    EXPECT_TRUE(store->basket_snapshot().empty());
}

TEST(ResourceStoreTest, OverfullBasketLeavesEverythingUnchanged) {
    auto store = get_value(ResourceStore::create(gpu_seed()));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", 5)));
    auto receipt = store->checkout();
    ASSERT_TRUE(is_error(receipt));
    EXPECT_EQ(get_error(receipt).kind, StoreErrorKind::InsufficientInventory);
    EXPECT_EQ(get_error(receipt).available, 3);
    EXPECT_EQ(get_error(receipt).requested, 5);
    EXPECT_EQ(store->available("gpu-h100").value(), 3);
    EXPECT_EQ(store->basket_snapshot(), (std::map<std::string, int>{{"gpu-h100", 5}}));
}

TEST(ResourceStoreTest, RepeatedReadsAgree) {
    auto store = make_store();
    ASSERT_FALSE(is_error(store->add_to_basket("ram-ddr5", 2)));

    const auto first = get_value(store->list_products(3, 3));
    const auto second = get_value(store->list_products(3, 3));
    ASSERT_EQ(first.products.size(), second.products.size());
    for (std::size_t i = 0; i < first.products.size(); ++i) {
        EXPECT_EQ(first.products[i].product.sku, second.products[i].product.sku);
        EXPECT_EQ(first.products[i].available, second.products[i].available);
    }
    EXPECT_EQ(first.next_offset, second.next_offset);

    const auto basket_a = store->view_basket();
    const auto basket_b = store->view_basket();
    ASSERT_EQ(basket_a.size(), 1u);
    ASSERT_EQ(basket_b.size(), 1u);
    EXPECT_EQ(basket_a[0].quantity, basket_b[0].quantity);
}

TEST(ResourceStoreTest, CreateReturnsSoleOwner) {
    auto created = ResourceStore::create(gpu_seed());
    ASSERT_FALSE(is_error(created));
    const auto& store = get_value(created);
    EXPECT_EQ(store.use_count(), 1);
    EXPECT_EQ(store->catalog_size(), 2u);
}

TEST(ResourceStoreTest, AddRejectsQuantityOverflow) {
    auto store = get_value(ResourceStore::create(gpu_seed()));
    ASSERT_FALSE(is_error(store->add_to_basket("gpu-h100", INT_MAX)));

    auto overflow = store->add_to_basket("gpu-h100", 2);
    ASSERT_TRUE(is_error(overflow));
    EXPECT_EQ(get_error(overflow).kind, StoreErrorKind::InvalidAmount);
    EXPECT_EQ(get_error(overflow).sku, "gpu-h100");
    EXPECT_EQ(get_error(overflow).requested, 2);
    EXPECT_EQ(get_error(overflow).in_basket, INT_MAX);
    EXPECT_EQ(store->basket_snapshot().at("gpu-h100"), INT_MAX);

    auto receipt = store->checkout();
    ASSERT_TRUE(is_error(receipt));
    EXPECT_EQ(get_error(receipt).kind, StoreErrorKind::InsufficientInventory);
    EXPECT_EQ(store->available("gpu-h100").value(), 3);
}

TEST(ResourceStoreTest, CheckoutRejectsTotalThatOverflows) {
    CatalogSeed seed;
    const std::int64_t huge = std::numeric_limits<std::int64_t>::max() / 2;
    seed.entries = {{{"gold", "Gold bar", huge, "metal"}, 3}};
    auto store = get_value(ResourceStore::create(seed));
    ASSERT_FALSE(is_error(store->add_to_basket("gold", 3)));

    auto receipt = store->checkout();
    ASSERT_TRUE(is_error(receipt));
    EXPECT_EQ(get_error(receipt).kind, StoreErrorKind::InvalidAmount);
    EXPECT_EQ(get_error(receipt).sku, "gold");
    EXPECT_EQ(store->available("gold").value(), 3);
    EXPECT_EQ(store->basket_snapshot().at("gold"), 3);
}

TEST(ResourceStoreTest, SharedStoreSurvivesConcurrentSessions) {
    constexpr int kSeeded = 40;
    constexpr int kThreads = 8;
    constexpr int kRounds = 50;

    CatalogSeed seed;
    seed.entries = {{{"gpu-h100", "Nvidia H100", 20000, "gpu"}, kSeeded}};
    auto store = get_value(ResourceStore::create(seed));

    std::atomic<int> bought{0};
    std::atomic<bool> went_negative{false};
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&store, &bought, &went_negative]() {
            for (int round = 0; round < kRounds; ++round) {
                if (is_error(store->add_to_basket("gpu-h100", 1))) {
                    continue;
                }
                auto receipt = store->checkout();
                if (!is_error(receipt)) {
                    for (const auto& line : get_value(receipt).purchased) {
                        bought += line.quantity;
                    }
                } else if (get_error(receipt).kind ==
                           StoreErrorKind::InsufficientInventory) {
                    // NotInBasket is fine here.
                    (void)store->remove_from_basket("gpu-h100", 1);
                }
                if (store->available("gpu-h100").value() < 0) {
                    went_negative = true;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const int remaining = store->available("gpu-h100").value();
    EXPECT_FALSE(went_negative.load());
    EXPECT_GE(remaining, 0);
    EXPECT_EQ(bought.load() + remaining, kSeeded);
}

}  // namespace
