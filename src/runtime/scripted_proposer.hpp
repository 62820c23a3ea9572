#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "runtime/action_proposer.hpp"

namespace shopagent::runtime {

// Replays a fixed list of proposals in order, ignoring the history. Running
// past the end is a "script_exhausted" error.
class ScriptedProposer : public ActionProposer {
public:
    explicit ScriptedProposer(std::vector<protocol::Proposal> script);

    core::errors::Result<protocol::Proposal> propose(
        const std::string& goal, const std::vector<protocol::Step>& history) override;

    std::size_t remaining() const;

private:
    std::vector<protocol::Proposal> script_;
    std::size_t cursor_ = 0;
};

// [{"tool": "...", "parameters": {...}, "reasoning": "..."},
//  {"goal_achieved": true, "reasoning": "..."}]
core::errors::Result<std::vector<protocol::Proposal>> parse_script(
    const nlohmann::json& document);

core::errors::Result<std::vector<protocol::Proposal>> load_script_file(
    const std::filesystem::path& path);

}  // namespace shopagent::runtime
