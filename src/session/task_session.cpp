#include "session/task_session.hpp"

#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"
#include "tools/tool_dispatcher.hpp"

namespace shopagent::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::TaskOutcome;
using protocol::TaskResult;

bool is_terminal(const SessionState state) {
    return state == SessionState::Done || state == SessionState::Aborted ||
           state == SessionState::Failed;
}

std::string to_string(const SessionState state) {
    switch (state) {
        case SessionState::Created:
            return "created";
        case SessionState::Running:
            return "running";
        case SessionState::Done:
            return "done";
        case SessionState::Aborted:
            return "aborted";
        case SessionState::Failed:
            return "failed";
        default:
            return "unknown";
    }
}

TaskSession::TaskSession(std::string goal, std::shared_ptr<store::ResourceStore> store,
                         runtime::ExecutorOptions options,
                         runtime::GoalPredicate goal_predicate)
    : id_(core::config::generate_session_id()),
      goal_(std::move(goal)),
      store_(std::move(store)),
      options_(options),
      goal_predicate_(std::move(goal_predicate)) {}

void TaskSession::transition(const SessionState next) {
    LOG_INFO("TaskSession: session " + id_ + " transition " + to_string(state_) +
             " -> " + to_string(next));
    state_ = next;
}

core::errors::Result<TaskResult> TaskSession::run(runtime::ActionProposer& proposer,
                                                 const runtime::StepObserver& observer) {
    if (state_ != SessionState::Created) {
        return AgentError{ErrorCategory::Input,
                          "Session " + id_ + " cannot run from state " +
                              to_string(state_),
                          "invalid_state_transition",
                          "Create a new session for every goal."};
    }
    if (!store_) {
        return AgentError{ErrorCategory::Internal, "Session has no store attached.",
                          "missing_store"};
    }

    transition(SessionState::Running);

    const tools::ToolDispatcher dispatcher(*store_);
    const runtime::PlanningExecutor executor(dispatcher, goal_predicate_, options_);
    auto execution = executor.execute(id_, goal_, proposer, observer);
    if (core::errors::is_error(execution)) {
        failure_reason_ = core::errors::get_error(execution).message;
        transition(SessionState::Failed);
        return execution;
    }

    const auto& result = core::errors::get_value(execution);
    switch (result.outcome) {
        case TaskOutcome::Done:
            transition(SessionState::Done);
            break;
        case TaskOutcome::Failed:
            failure_reason_ = result.error.has_value() ? result.error->message
                                                       : result.summary;
            transition(SessionState::Failed);
            break;
        default:
            transition(SessionState::Aborted);
            break;
    }
    return execution;
}

SessionState TaskSession::state() const {
    return state_;
}

const std::string& TaskSession::id() const {
    return id_;
}

const std::string& TaskSession::goal() const {
    return goal_;
}

const std::optional<std::string>& TaskSession::failure_reason() const {
    return failure_reason_;
}

const std::shared_ptr<store::ResourceStore>& TaskSession::store() const {
    return store_;
}

}  // namespace shopagent::session
