#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/response_parser.hpp"

namespace tailcall::runtime {

// Immutable per-orchestrator settings. Nothing here is shared global state;
// each orchestrator receives its own copy at construction.
struct AgentConfig {
    std::string agent_name = "tailcall";
    protocol::ProtocolMarkers markers;
    std::string system_prompt = default_system_prompt();
    // Requested step budgets above this are reduced to it.
    std::uint32_t max_step_ceiling = 100;
    // Role used for entries that steer the model back onto the protocol.
    protocol::Role corrective_role = protocol::Role::User;
    std::string budget_exhausted_result = "Reached max_steps without calling finish";

    static std::string default_system_prompt();
};

// Reads overrides from a JSON object on top of `base`. Recognised keys:
// agent_name, system_prompt, max_step_ceiling, corrective_role,
// budget_exhausted_result and markers{begin_call, end_call, arg_sep, value_sep}.
// Codes: config_read_failed, invalid_config_json, invalid_config_value,
// invalid_protocol_markers.
core::errors::Result<AgentConfig> load_agent_config(
    const std::filesystem::path& path, AgentConfig base = {});

core::errors::Result<AgentConfig> parse_agent_config(const std::string& json_text,
                                                     AgentConfig base = {});

}  // namespace tailcall::runtime
