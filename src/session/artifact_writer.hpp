#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/run_request.hpp"
#include "protocol/step_contract.hpp"
#include "session/task_session.hpp"

namespace shopagent::session {

// Appends one JSON object per line to <workspace>/.shop_agent_runs/<session>.jsonl:
// a "request" event, one "step" event per step, and a "final" event.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path workspace_root,
                            std::filesystem::path artifact_subdir = ".shop_agent_runs");

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& session_id, const protocol::RunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_step(
        const std::string& session_id, const protocol::Step& step) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& session_id, SessionState state,
        const std::string& summary,
        const std::optional<std::string>& error_message = std::nullopt) const;

    core::errors::Result<std::filesystem::path> session_log_path(
        const std::string& session_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& session_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path artifact_subdir_;
};

}  // namespace shopagent::session
