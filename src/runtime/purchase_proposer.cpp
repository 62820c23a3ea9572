#include "runtime/purchase_proposer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <utility>
#include <nlohmann/json.hpp>
#include "protocol/action_contract.hpp"
#include "tools/parameter_coercion.hpp"

namespace shopagent::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::GoalAchieved;
using protocol::Proposal;
using protocol::ProposedAction;
using protocol::Step;

namespace {

const std::set<std::string> kFillerWords = {
    "a",    "all",    "an",   "and",  "any",   "buy",     "every", "for",
    "get",  "me",     "now",  "of",   "order", "please",  "some",  "the",
    "them", "purchase", "available", "stock", "in",     "that",  "you", "can"};

struct KnownProduct {
    std::string sku;
    std::string name;
    std::string category;
    int available = 0;
};

// Everything the history says about the catalog and the basket.
struct Knowledge {
    std::vector<KnownProduct> products;
    std::size_t page_size = 3;
    std::size_t next_offset = 0;
    bool listing_complete = false;
    std::map<std::string, int> basket;
    std::set<std::string> attempted;
    bool purchased = false;
};

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

std::string string_field(const json& object, const char* field) {
    const auto it = object.find(field);
    if (it != object.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

long long integer_field(const json& object, const char* field, const long long fallback) {
    if (!object.is_object()) {
        return fallback;
    }
    const auto it = object.find(field);
    if (it == object.end()) {
        return fallback;
    }
    auto value = tools::coerce_integer(*it, field);
    if (core::errors::is_error(value)) {
        return fallback;
    }
    return core::errors::get_value(value);
}

std::string sku_of(const ProposedAction& action) {
    if (!action.parameters.is_object()) {
        return "";
    }
    return string_field(action.parameters, "sku");
}

const json* error_details(const Step& step) {
    if (!step.result.error.has_value()) {
        return nullptr;
    }
    return &step.result.error->details;
}

std::string error_code(const Step& step) {
    return step.result.error.has_value() ? step.result.error->code : "";
}

void record_listing(Knowledge& knowledge, const json& payload) {
    const auto products = payload.find("products");
    if (products != payload.end() && products->is_array()) {
        for (const auto& item : *products) {
            KnownProduct product;
            product.sku = string_field(item, "sku");
            product.name = string_field(item, "name");
            product.category = string_field(item, "category");
            product.available = static_cast<int>(integer_field(item, "available", 0));

            auto existing = std::find_if(
                knowledge.products.begin(), knowledge.products.end(),
                [&product](const KnownProduct& known) { return known.sku == product.sku; });
            if (existing == knowledge.products.end()) {
                knowledge.products.push_back(std::move(product));
            } else {
                *existing = std::move(product);
            }
        }
    }

    const long long next = integer_field(payload, "next_offset", -1);
    if (next < 0) {
        knowledge.listing_complete = true;
    } else {
        knowledge.next_offset = static_cast<std::size_t>(next);
    }
}

Knowledge replay(const std::vector<Step>& history, const std::size_t initial_page_size) {
    Knowledge knowledge;
    knowledge.page_size = std::max<std::size_t>(1, initial_page_size);

    for (const auto& step : history) {
        const auto& name = step.action.name;
        const auto& result = step.result;

        if (name == protocol::kListProducts) {
            if (result.success) {
                record_listing(knowledge, result.payload);
            } else if (error_code(step) == "page_limit_exceeded") {
                const long long max_limit =
                    integer_field(*error_details(step), "max_limit", 0);
                knowledge.page_size =
                    max_limit > 0 ? static_cast<std::size_t>(max_limit)
                                  : std::max<std::size_t>(1, knowledge.page_size / 2);
            }
        } else if (name == protocol::kAddToBasket) {
            const std::string sku = sku_of(step.action);
            knowledge.attempted.insert(sku);
            if (result.success) {
                knowledge.basket[sku] +=
                    static_cast<int>(integer_field(step.action.parameters, "amount", 0));
            }
        } else if (name == protocol::kRemoveFromBasket && result.success) {
            const std::string sku = sku_of(step.action);
            auto line = knowledge.basket.find(sku);
            if (line != knowledge.basket.end()) {
                line->second -=
                    static_cast<int>(integer_field(step.action.parameters, "amount", 0));
                if (line->second <= 0) {
                    knowledge.basket.erase(line);
                }
            }
        } else if (name == protocol::kViewBasket && result.success) {
            knowledge.basket.clear();
            const auto items = result.payload.find("items");
            if (items != result.payload.end() && items->is_array()) {
                for (const auto& item : *items) {
                    knowledge.basket[string_field(item, "sku")] =
                        static_cast<int>(integer_field(item, "quantity", 0));
                }
            }
        } else if (name == protocol::kCheckoutBasket && result.success) {
            knowledge.basket.clear();
            knowledge.purchased = true;
        }
    }
    return knowledge;
}

bool matches(const KnownProduct& product, const std::string& keyword) {
    return lowercase(product.sku).find(keyword) != std::string::npos ||
           lowercase(product.name).find(keyword) != std::string::npos ||
           lowercase(product.category).find(keyword) != std::string::npos;
}

Proposal action(const char* name, json parameters, std::string rationale) {
    return ProposedAction{name, std::move(parameters), std::move(rationale)};
}

}  // namespace

PurchaseProposer::PurchaseProposer(PurchaseProposerOptions options)
    : options_(options) {}

std::optional<std::string> PurchaseProposer::target_keyword(const std::string& goal) {
    std::vector<std::string> tokens;
    std::string token;
    for (const char c : goal) {
        if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
            token.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            continue;
        }
        if (!token.empty()) {
            tokens.push_back(token);
            token.clear();
        }
    }
    if (!token.empty()) {
        tokens.push_back(token);
    }

    for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
        if (kFillerWords.count(*it) != 0) {
            continue;
        }
        std::string keyword = *it;
        if (keyword.size() > 3 && keyword.back() == 's') {
            keyword.pop_back();
        }
        return keyword;
    }
    return std::nullopt;
}

core::errors::Result<Proposal> PurchaseProposer::propose(
    const std::string& goal, const std::vector<Step>& history) {
    const auto keyword = target_keyword(goal);
    if (!keyword.has_value()) {
        return AgentError{ErrorCategory::Provider,
                          "Cannot tell what to buy from goal: \"" + goal + "\"",
                          "unsupported_goal",
                          "Phrase the goal like \"Buy all GPUs\"."};
    }

    const Knowledge knowledge = replay(history, options_.initial_page_size);
    if (knowledge.purchased) {
        return GoalAchieved{"Checkout succeeded; every in-stock '" + *keyword +
                            "' product has been bought."};
    }

    if (!knowledge.listing_complete) {
        return action(protocol::kListProducts,
                      json{{"offset", knowledge.next_offset},
                           {"limit", knowledge.page_size}},
                      "Listing products from offset " +
                          std::to_string(knowledge.next_offset) + " to find every '" +
                          *keyword + "' product.");
    }

    std::vector<const KnownProduct*> wanted;
    for (const auto& product : knowledge.products) {
        if (product.available > 0 && matches(product, *keyword)) {
            wanted.push_back(&product);
        }
    }
    if (wanted.empty()) {
        return GoalAchieved{"No in-stock product matches '" + *keyword +
                            "'; nothing to buy."};
    }

    for (const auto* product : wanted) {
        if (knowledge.attempted.count(product->sku) == 0) {
            return action(protocol::kAddToBasket,
                          json{{"sku", product->sku}, {"amount", product->available}},
                          "Adding all " + std::to_string(product->available) +
                              " listed units of " + product->name + " (" +
                              product->sku + ") to the basket.");
        }
    }

    const Step* last = history.empty() ? nullptr : &history.back();
    if (last != nullptr && !last->result.success) {
        const std::string code = error_code(*last);
        const json* details = error_details(*last);

        if (last->action.name == protocol::kCheckoutBasket &&
            code == "insufficient_inventory" && details != nullptr) {
            const std::string sku = string_field(*details, "sku");
            const long long available = integer_field(*details, "available", 0);
            const long long requested = integer_field(*details, "requested", 0);
            const long long excess =
                available <= 0 ? requested : requested - available;
            if (!sku.empty() && excess > 0) {
                return action(protocol::kRemoveFromBasket,
                              json{{"sku", sku}, {"amount", excess}},
                              "Only " + std::to_string(available) + " of " + sku +
                                  " left but " + std::to_string(requested) +
                                  " in the basket; removing " +
                                  std::to_string(excess) + ".");
            }
        }

        if (code == "empty_basket") {
            return GoalAchieved{"Basket is empty; no '" + *keyword +
                                "' product can be bought any more."};
        }

        if (last->action.name != protocol::kViewBasket &&
            last->action.name != protocol::kCheckoutBasket) {
            return action(protocol::kViewBasket, json::object(),
                          "Last action failed with " + code +
                              "; checking what the basket really holds.");
        }
    }

    if (knowledge.basket.empty()) {
        return GoalAchieved{"Every matching product sold out before checkout; "
                            "nothing left to buy."};
    }

    int units = 0;
    for (const auto& [sku, quantity] : knowledge.basket) {
        units += quantity;
    }
    return action(protocol::kCheckoutBasket, json::object(),
                  "Checking out " + std::to_string(units) + " units across " +
                      std::to_string(knowledge.basket.size()) + " products.");
}

}  // namespace shopagent::runtime
