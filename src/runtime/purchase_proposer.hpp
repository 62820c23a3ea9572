#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "runtime/action_proposer.hpp"

namespace shopagent::runtime {

struct PurchaseProposerOptions {
    std::size_t initial_page_size = 3;
};

// Rule-based proposer for goals of the form "buy all <thing>". Every decision
// is derived from the step history alone, so the same history always yields
// the same proposal.
//
// Plan: page through the whole catalog, put every in-stock matching product
// in the basket at its listed availability, check out, and trim the basket
// whenever checkout reports that less stock is left than requested.
class PurchaseProposer : public ActionProposer {
public:
    explicit PurchaseProposer(PurchaseProposerOptions options = {});

    core::errors::Result<protocol::Proposal> propose(
        const std::string& goal, const std::vector<protocol::Step>& history) override;

    // Last significant word of the goal, lowercased and singularised:
    // "Buy ALL GPUs" -> "gpu".
    static std::optional<std::string> target_keyword(const std::string& goal);

private:
    PurchaseProposerOptions options_;
};

}  // namespace shopagent::runtime
