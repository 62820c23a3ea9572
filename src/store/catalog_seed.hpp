#pragma once

#include <filesystem>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "store/product.hpp"

namespace shopagent::store {

// Built-in demo catalog: eight products, two of them GPUs.
CatalogSeed default_catalog();

// The demo race: another customer takes 2 x gpu-h100 and 1 x gpu-a100.
std::vector<PurchasedLine> demo_competing_purchase();

// {"products": [{"sku", "name", "price", "category", "available"}],
//  "competing_purchase": {"<sku>": units}}
core::errors::Result<CatalogSeed> parse_catalog(const nlohmann::json& document);

core::errors::Result<CatalogSeed> load_catalog_file(const std::filesystem::path& path);

}  // namespace shopagent::store
