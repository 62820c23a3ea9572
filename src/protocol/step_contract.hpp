#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/action_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace shopagent::protocol {

enum class TaskOutcome {
    Done,
    Aborted,
    Failed
};

// One loop iteration. Never modified after it is appended to the history.
struct Step {
    std::uint32_t number = 0;
    ProposedAction action;
    ToolResult result;
    std::string rationale;
};

struct TaskResult {
    std::string session_id;
    std::string goal;
    TaskOutcome outcome = TaskOutcome::Aborted;
    bool goal_achieved = false;
    std::uint32_t step_budget = 0;
    std::vector<Step> steps;
    std::string summary;
    // Set only when outcome is Failed.
    std::optional<core::errors::AgentError> error;
};

inline std::string to_string(const TaskOutcome outcome) {
    switch (outcome) {
        case TaskOutcome::Done:
            return "done";
        case TaskOutcome::Aborted:
            return "aborted";
        case TaskOutcome::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

}  // namespace shopagent::protocol
