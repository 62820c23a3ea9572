#include "store/catalog_seed.hpp"

#include <climits>
#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <utility>

namespace shopagent::store {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError catalog_error(const std::string& message) {
    return AgentError{ErrorCategory::Input, message, "invalid_catalog",
                      "Each product needs sku, name, price, category and available."};
}

// Unit counts must fit a non-negative int; wider JSON integers are rejected
// rather than narrowed.
std::optional<int> unit_count(const json& value) {
    if (value.is_number_unsigned()) {
        const auto count = value.get<std::uint64_t>();
        if (count > static_cast<std::uint64_t>(INT_MAX)) {
            return std::nullopt;
        }
        return static_cast<int>(count);
    }
    const auto count = value.get<std::int64_t>();
    if (count < 0 || count > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(count);
}

}  // namespace

CatalogSeed default_catalog() {
    CatalogSeed seed;
    seed.entries = {
        {{"rc-1200", "Remote Control Unit", 2500, "accessories"}, 10},
        {{"gpu-h100", "Nvidia H100", 20000, "gpu"}, 3},
        {{"gpu-a100", "Nvidia A100", 11950, "gpu"}, 4},
        {{"mb-450", "Motherboard X45", 500, "motherboard"}, 7},
        {{"cpu-001", "Intel Xeon", 3500, "cpu"}, 15},
        {{"ram-ddr5", "DDR5 RAM 64GB", 800, "memory"}, 20},
        {{"ssd-2tb", "NVMe SSD 2TB", 250, "storage"}, 12},
        {{"psu-1200w", "Power Supply 1200W", 300, "power"}, 8},
    };
    return seed;
}

std::vector<PurchasedLine> demo_competing_purchase() {
    return {{"gpu-h100", 2}, {"gpu-a100", 1}};
}

core::errors::Result<CatalogSeed> parse_catalog(const json& document) {
    if (!document.is_object()) {
        return catalog_error("Catalog document must be a JSON object.");
    }
    const auto products = document.find("products");
    if (products == document.end() || !products->is_array()) {
        return catalog_error("Catalog document needs a \"products\" array.");
    }

    CatalogSeed seed;
    for (const auto& item : *products) {
        if (!item.is_object()) {
            return catalog_error("Catalog products must be JSON objects.");
        }
        const auto sku = item.find("sku");
        const auto name = item.find("name");
        const auto price = item.find("price");
        const auto available = item.find("available");
        if (sku == item.end() || !sku->is_string() || name == item.end() ||
            !name->is_string() || price == item.end() ||
            !price->is_number_integer() || available == item.end() ||
            !available->is_number_integer()) {
            return catalog_error("Catalog product is missing a field or has the wrong type.");
        }

        SeedEntry entry;
        entry.product.sku = sku->get<std::string>();
        entry.product.name = name->get<std::string>();
        entry.product.price = price->get<std::int64_t>();
        const auto category = item.find("category");
        if (category != item.end() && category->is_string()) {
            entry.product.category = category->get<std::string>();
        }
        const auto units = unit_count(*available);
        if (!units.has_value()) {
            return catalog_error("Available units for " + entry.product.sku +
                                 " must be between 0 and " + std::to_string(INT_MAX) +
                                 ".");
        }
        entry.available = *units;
        seed.entries.push_back(std::move(entry));
    }

    const auto competing = document.find("competing_purchase");
    if (competing != document.end()) {
        if (!competing->is_object()) {
            return catalog_error("\"competing_purchase\" must map SKUs to unit counts.");
        }
        for (auto it = competing->begin(); it != competing->end(); ++it) {
            if (!it.value().is_number_integer()) {
                return catalog_error("Competing purchase for " + it.key() +
                                     " must be an integer.");
            }
            const auto units = unit_count(it.value());
            if (!units.has_value()) {
                return catalog_error("Competing purchase for " + it.key() +
                                     " must be between 0 and " +
                                     std::to_string(INT_MAX) + ".");
            }
            seed.competing_purchase.push_back(PurchasedLine{it.key(), *units});
        }
    }

    return seed;
}

core::errors::Result<CatalogSeed> load_catalog_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Catalog file does not exist: " + path.string(),
                          "catalog_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Failed to open catalog file: " + path.string(),
                          "catalog_open_failed"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return AgentError{ErrorCategory::Input,
                          "Catalog file is not valid JSON: " + path.string(),
                          "invalid_json"};
    }
    return parse_catalog(document);
}

}  // namespace shopagent::store
