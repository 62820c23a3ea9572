#include "runtime/goal_predicate.hpp"

#include "protocol/action_contract.hpp"

namespace shopagent::runtime {

bool purchase_completed(const std::vector<protocol::Step>& history) {
    if (history.empty()) {
        return false;
    }

    const auto& last = history.back();
    if (last.action.name != protocol::kCheckoutBasket || !last.result.success) {
        return false;
    }

    const auto purchased = last.result.payload.find("purchased");
    return purchased != last.result.payload.end() && purchased->is_array() &&
           !purchased->empty();
}

bool never_achieved(const std::vector<protocol::Step>&) {
    return false;
}

}  // namespace shopagent::runtime
