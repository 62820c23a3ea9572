#include "session/artifact_writer.hpp"

#include <chrono>
#include <fstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace shopagent::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t now_unix_ms() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        now.time_since_epoch())
                        .count();
    return static_cast<std::int64_t>(ms);
}

json request_to_json(const protocol::RunRequest& request) {
    json payload;
    payload["task_description"] = request.task_description;
    payload["working_directory"] = request.working_directory.string();
    payload["max_steps"] = request.max_steps;
    payload["simulate_race"] = request.simulate_race;
    payload["verbose"] = request.verbose;
    payload["plan_file"] =
        request.plan_file.has_value() ? request.plan_file.value().string() : "";
    payload["catalog_file"] =
        request.catalog_file.has_value() ? request.catalog_file.value().string() : "";
    return payload;
}

json step_to_json(const protocol::Step& step) {
    json payload;
    payload["number"] = step.number;
    payload["tool"] = step.action.name;
    payload["parameters"] = step.action.parameters;
    payload["rationale"] = step.rationale;
    payload["result"] = protocol::to_json(step.result);
    return payload;
}

json make_event(const char* kind, const std::string& session_id, json payload) {
    json event;
    event["ts_unix_ms"] = now_unix_ms();
    event["event"] = kind;
    event["session_id"] = session_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path workspace_root,
                               std::filesystem::path artifact_subdir)
    : workspace_root_(std::move(workspace_root)),
      artifact_subdir_(std::move(artifact_subdir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::session_log_path(
    const std::string& session_id) const {
    if (session_id.empty()) {
        return AgentError{ErrorCategory::Input, "Session ID cannot be empty.",
                          "invalid_session_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Workspace root is not a directory: " +
                              workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto canonical_root =
        std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " +
                              workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    auto artifacts_dir = canonical_root / artifact_subdir_;
    std::filesystem::create_directories(artifacts_dir, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create artifacts directory: " +
                              artifacts_dir.string(),
                          "artifact_dir_create_failed"};
    }

    return artifacts_dir / (session_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& session_id, const std::string& event_json) const {
    auto path_result = session_log_path(session_id);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto log_path = core::errors::get_value(path_result);

    std::ofstream out(log_path, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open artifact file: " + log_path.string(),
                          "artifact_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write artifact event: " + log_path.string(),
                          "artifact_write_failed"};
    }

    return log_path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_request(
    const std::string& session_id, const protocol::RunRequest& request) const {
    return append_event(session_id,
                        protocol::to_text(make_event("request", session_id,
                                                     request_to_json(request))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_step(
    const std::string& session_id, const protocol::Step& step) const {
    return append_event(session_id,
                        protocol::to_text(
                            make_event("step", session_id, step_to_json(step))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_final(
    const std::string& session_id, const SessionState state,
    const std::string& summary,
    const std::optional<std::string>& error_message) const {
    json payload;
    payload["status"] = to_string(state);
    payload["summary"] = summary;
    payload["error_message"] =
        error_message.has_value() ? error_message.value() : "";
    return append_event(session_id,
                        protocol::to_text(
                            make_event("final", session_id, std::move(payload))));
}

}  // namespace shopagent::session
