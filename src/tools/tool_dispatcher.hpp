#pragma once

#include <string>
#include <vector>
#include "protocol/action_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "store/resource_store.hpp"

namespace shopagent::tools {

// Maps proposed actions onto ResourceStore operations. Holds no state of its
// own; every side effect lands in the store it was given.
class ToolDispatcher {
public:
    explicit ToolDispatcher(store::ResourceStore& store);

    // Never fails: unknown tools and bad parameters come back as contract
    // errors (422), store rejections as domain errors (400).
    protocol::ToolResult dispatch(const protocol::ProposedAction& action) const;

    // Runs already-validated arguments.
    protocol::ToolResult invoke(const protocol::ToolArguments& arguments) const;

    static std::vector<std::string> action_names();

private:
    protocol::ToolResult list_products(const protocol::ListProductsArgs& args) const;
    protocol::ToolResult add_to_basket(const protocol::AddToBasketArgs& args) const;
    protocol::ToolResult view_basket() const;
    protocol::ToolResult remove_from_basket(
        const protocol::RemoveFromBasketArgs& args) const;
    protocol::ToolResult checkout_basket() const;

    store::ResourceStore& store_;
};

}  // namespace shopagent::tools
