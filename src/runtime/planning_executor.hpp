#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/step_contract.hpp"
#include "runtime/action_proposer.hpp"
#include "runtime/goal_predicate.hpp"
#include "tools/tool_dispatcher.hpp"

namespace shopagent::runtime {

enum class ExecutorState {
    Planning,
    Executing,
    Observing,
    Done,
    Aborted,
    Failed
};

std::string to_string(ExecutorState state);

// Called once per step, right after the step is appended to the history.
using StepObserver = std::function<void(const protocol::Step&)>;

struct ExecutorOptions {
    std::uint32_t step_budget = 20;
};

// Drives Planning -> Executing -> Observing until the goal is reached or the
// step budget runs out. Store rejections are recorded like any other
// observation; recovering from them is the proposer's job.
class PlanningExecutor {
public:
    explicit PlanningExecutor(const tools::ToolDispatcher& dispatcher,
                              GoalPredicate goal_predicate = purchase_completed,
                              ExecutorOptions options = {});

    // Done, Aborted and Failed all come back as a TaskResult with the full
    // history. A proposer that cannot answer ends the run as Failed with its
    // error attached as a Provider error. Only a zero budget is an Input error.
    core::errors::Result<protocol::TaskResult> execute(
        const std::string& session_id, const std::string& goal,
        ActionProposer& proposer, const StepObserver& observer = {}) const;

private:
    const tools::ToolDispatcher& dispatcher_;
    GoalPredicate goal_predicate_;
    ExecutorOptions options_;
};

}  // namespace shopagent::runtime
