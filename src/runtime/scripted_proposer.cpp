#include "runtime/scripted_proposer.hpp"

#include <fstream>
#include <utility>

namespace shopagent::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::GoalAchieved;
using protocol::Proposal;
using protocol::ProposedAction;

namespace {

AgentError plan_error(const std::string& message) {
    return AgentError{ErrorCategory::Input, message, "invalid_plan",
                      "Each entry needs \"tool\" (or \"goal_achieved\": true)."};
}

std::string reasoning_of(const json& entry) {
    const auto reasoning = entry.find("reasoning");
    if (reasoning != entry.end() && reasoning->is_string()) {
        return reasoning->get<std::string>();
    }
    return "";
}

}  // namespace

ScriptedProposer::ScriptedProposer(std::vector<Proposal> script)
    : script_(std::move(script)) {}

core::errors::Result<Proposal> ScriptedProposer::propose(
    const std::string&, const std::vector<protocol::Step>&) {
    if (cursor_ >= script_.size()) {
        return AgentError{ErrorCategory::Provider,
                          "Scripted plan has no more actions after " +
                              std::to_string(script_.size()) + " entries.",
                          "script_exhausted",
                          "End the plan with {\"goal_achieved\": true}."};
    }
    return script_[cursor_++];
}

std::size_t ScriptedProposer::remaining() const {
    return script_.size() - cursor_;
}

core::errors::Result<std::vector<Proposal>> parse_script(const json& document) {
    if (!document.is_array()) {
        return plan_error("Plan must be a JSON array of actions.");
    }

    std::vector<Proposal> script;
    script.reserve(document.size());
    for (const auto& entry : document) {
        if (!entry.is_object()) {
            return plan_error("Plan entries must be JSON objects.");
        }

        const auto achieved = entry.find("goal_achieved");
        if (achieved != entry.end() && achieved->is_boolean() &&
            achieved->get<bool>()) {
            script.emplace_back(GoalAchieved{reasoning_of(entry)});
            continue;
        }

        auto tool = entry.find("tool");
        if (tool == entry.end()) {
            tool = entry.find("tool_name");
        }
        if (tool == entry.end() || !tool->is_string()) {
            return plan_error("Plan entry is missing a string \"tool\".");
        }

        ProposedAction action;
        action.name = tool->get<std::string>();
        const auto parameters = entry.find("parameters");
        if (parameters != entry.end()) {
            action.parameters = *parameters;
        }
        action.rationale = reasoning_of(entry);
        script.emplace_back(std::move(action));
    }
    return script;
}

core::errors::Result<std::vector<Proposal>> load_script_file(
    const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Plan file does not exist: " + path.string(),
                          "plan_not_found"};
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Failed to open plan file: " + path.string(),
                          "plan_open_failed"};
    }

    const json document = json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return AgentError{ErrorCategory::Input,
                          "Plan file is not valid JSON: " + path.string(),
                          "invalid_json"};
    }
    return parse_script(document);
}

}  // namespace shopagent::runtime
