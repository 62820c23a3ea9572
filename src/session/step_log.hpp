#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/step_contract.hpp"
#include "store/product.hpp"

namespace shopagent::session {

// "limit=3 offset=0", keys in sorted order. Non-object parameters are
// dumped as-is.
std::string format_parameters(const nlohmann::json& parameters);

// step_<n>: <rationale>
//   tool='<name>' <parameters>
//   OUTPUT <result envelope>
std::string render_step(const protocol::Step& step);

std::string render_inventory(const std::vector<store::ProductListing>& inventory);
std::string render_basket(const std::vector<store::BasketLine>& basket);

}  // namespace shopagent::session
