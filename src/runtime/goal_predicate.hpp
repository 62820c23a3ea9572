#pragma once

#include <functional>
#include <vector>
#include "protocol/step_contract.hpp"

namespace shopagent::runtime {

// Evaluated after every recorded step. Returning true ends the run as Done.
using GoalPredicate = std::function<bool(const std::vector<protocol::Step>&)>;

// True when the latest step is a successful checkout that actually bought
// something. This is the only goal shape the demo knows how to recognise.
bool purchase_completed(const std::vector<protocol::Step>& history);

// Never fires; the run ends only on the proposer's signal or the budget.
bool never_achieved(const std::vector<protocol::Step>& history);

}  // namespace shopagent::runtime
