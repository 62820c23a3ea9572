#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/agent_errors.hpp"

namespace shopagent::app::cli {
    shopagent::core::errors::Result<shopagent::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);
}
