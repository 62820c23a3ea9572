#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/action_contract.hpp"

namespace shopagent::tools {

// Turns a proposed (name, loosely typed parameters) pair into the typed
// argument struct for that tool.
//
// Errors are ErrorCategory::Contract with code "unknown_action" or
// "parameter_coercion_failed".
core::errors::Result<protocol::ToolArguments> coerce_arguments(
    const std::string& action_name, const nlohmann::json& parameters);

// Exposed for tests. Accepts JSON integers, integral floats and decimal
// strings; rejects booleans, fractions and anything non-numeric.
core::errors::Result<long long> coerce_integer(const nlohmann::json& value,
                                               const std::string& field);

}  // namespace shopagent::tools
