#include "runtime/planning_executor.hpp"

#include <utility>
#include <variant>
#include "core/logging/logger.hpp"

namespace shopagent::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ProposedAction;
using protocol::Step;
using protocol::TaskOutcome;
using protocol::TaskResult;
using protocol::ToolResult;

std::string to_string(const ExecutorState state) {
    switch (state) {
        case ExecutorState::Planning:
            return "planning";
        case ExecutorState::Executing:
            return "executing";
        case ExecutorState::Observing:
            return "observing";
        case ExecutorState::Done:
            return "done";
        case ExecutorState::Aborted:
            return "aborted";
        case ExecutorState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

PlanningExecutor::PlanningExecutor(const tools::ToolDispatcher& dispatcher,
                                   GoalPredicate goal_predicate,
                                   ExecutorOptions options)
    : dispatcher_(dispatcher),
      goal_predicate_(std::move(goal_predicate)),
      options_(options) {
    if (!goal_predicate_) {
        goal_predicate_ = never_achieved;
    }
}

core::errors::Result<TaskResult> PlanningExecutor::execute(
    const std::string& session_id, const std::string& goal,
    ActionProposer& proposer, const StepObserver& observer) const {
    if (options_.step_budget == 0) {
        return AgentError{ErrorCategory::Input, "Step budget must be at least 1.",
                          "invalid_step_budget"};
    }

    TaskResult result;
    result.session_id = session_id;
    result.goal = goal;
    result.step_budget = options_.step_budget;

    ExecutorState state = ExecutorState::Planning;
    auto transition = [&state](const ExecutorState next) {
        LOG_DEBUG("Executor: " + to_string(state) + " -> " + to_string(next));
        state = next;
    };

    ProposedAction pending;
    ToolResult observation;
    std::string finish_reason;

    while (state != ExecutorState::Done && state != ExecutorState::Aborted &&
           state != ExecutorState::Failed) {
        switch (state) {
            case ExecutorState::Planning: {
                if (result.steps.size() >= options_.step_budget) {
                    finish_reason = "step budget of " +
                                    std::to_string(options_.step_budget) +
                                    " exhausted";
                    transition(ExecutorState::Aborted);
                    break;
                }

                auto proposal = proposer.propose(goal, result.steps);
                if (core::errors::is_error(proposal)) {
                    const auto& err = core::errors::get_error(proposal);
                    LOG_ERROR("Executor: proposer failed after " +
                              std::to_string(result.steps.size()) + " steps [" +
                              err.code + "]: " + err.message);
                    result.error = AgentError{ErrorCategory::Provider,
                                              "Action proposer failed: " + err.message,
                                              err.code, err.hint};
                    finish_reason = result.error->message;
                    transition(ExecutorState::Failed);
                    break;
                }

                const auto& value = core::errors::get_value(proposal);
                if (const auto* achieved = std::get_if<protocol::GoalAchieved>(&value)) {
                    LOG_INFO("Proposer reports goal achieved: " + achieved->rationale);
                    result.goal_achieved = true;
                    finish_reason = achieved->rationale.empty()
                                        ? "proposer reported the goal as achieved"
                                        : achieved->rationale;
                    transition(ExecutorState::Done);
                    break;
                }

                pending = std::get<ProposedAction>(value);
                transition(ExecutorState::Executing);
                break;
            }

            case ExecutorState::Executing:
                observation = dispatcher_.dispatch(pending);
                transition(ExecutorState::Observing);
                break;

            case ExecutorState::Observing: {
                Step step;
                step.number = static_cast<std::uint32_t>(result.steps.size() + 1);
                step.rationale = pending.rationale;
                step.action = std::move(pending);
                step.result = std::move(observation);
                result.steps.push_back(std::move(step));
                pending = ProposedAction{};
                observation = ToolResult{};

                if (observer) {
                    observer(result.steps.back());
                }

                if (goal_predicate_(result.steps)) {
                    result.goal_achieved = true;
                    finish_reason = "goal detected after step " +
                                    std::to_string(result.steps.back().number);
                    transition(ExecutorState::Done);
                    break;
                }
                transition(ExecutorState::Planning);
                break;
            }

            case ExecutorState::Done:
            case ExecutorState::Aborted:
            case ExecutorState::Failed:
                break;
        }
    }

    switch (state) {
        case ExecutorState::Done:
            result.outcome = TaskOutcome::Done;
            break;
        case ExecutorState::Failed:
            result.outcome = TaskOutcome::Failed;
            break;
        default:
            result.outcome = TaskOutcome::Aborted;
            break;
    }
    result.summary = "Task " + protocol::to_string(result.outcome) + " after " +
                     std::to_string(result.steps.size()) + " of " +
                     std::to_string(options_.step_budget) + " steps: " +
                     finish_reason + ".";
    return result;
}

}  // namespace shopagent::runtime
