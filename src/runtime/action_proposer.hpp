#pragma once

#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/step_contract.hpp"

namespace shopagent::runtime {

// Decides the next action from the goal and everything that happened so far.
// May be a rule engine, a fixed script or a language model. The executor
// makes no assumptions about it: invalid proposals are rejected by the
// dispatcher, and an error result here ends the run as Failed with the
// history kept.
class ActionProposer {
public:
    virtual ~ActionProposer() = default;

    virtual core::errors::Result<protocol::Proposal> propose(
        const std::string& goal, const std::vector<protocol::Step>& history) = 0;
};

}  // namespace shopagent::runtime
