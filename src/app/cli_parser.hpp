#pragma once
#include "protocol/run_request.hpp"
#include "core/errors/agent_errors.hpp"

namespace tailcall::app::cli {
    tailcall::core::errors::Result<tailcall::protocol::RunRequest> parse_and_validate(int argc, char* argv[]);
}
