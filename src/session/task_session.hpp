#pragma once

#include <memory>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/step_contract.hpp"
#include "runtime/action_proposer.hpp"
#include "runtime/goal_predicate.hpp"
#include "runtime/planning_executor.hpp"
#include "store/resource_store.hpp"

namespace shopagent::session {

enum class SessionState {
    Created,
    Running,
    Done,
    Aborted,
    Failed
};

std::string to_string(SessionState state);
bool is_terminal(SessionState state);

// One goal run against one store. A session runs at most once; the store is
// shared so callers can inspect inventory and basket afterwards.
class TaskSession {
public:
    TaskSession(std::string goal, std::shared_ptr<store::ResourceStore> store,
                runtime::ExecutorOptions options = {},
                runtime::GoalPredicate goal_predicate = runtime::purchase_completed);

    core::errors::Result<protocol::TaskResult> run(
        runtime::ActionProposer& proposer,
        const runtime::StepObserver& observer = {});

    SessionState state() const;
    const std::string& id() const;
    const std::string& goal() const;
    const std::optional<std::string>& failure_reason() const;
    const std::shared_ptr<store::ResourceStore>& store() const;

private:
    void transition(SessionState next);

    std::string id_;
    std::string goal_;
    std::shared_ptr<store::ResourceStore> store_;
    runtime::ExecutorOptions options_;
    runtime::GoalPredicate goal_predicate_;
    SessionState state_ = SessionState::Created;
    std::optional<std::string> failure_reason_;
};

}  // namespace shopagent::session
