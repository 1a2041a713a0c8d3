#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/execution_environment.hpp"

namespace tailcall::tools {

// run_bash_cmd, show_file, replace_in_file, create_file, append_to_file,
// list_dir and grep, all operating through `env`.
std::vector<protocol::ToolDescriptor> make_builtin_tools(
    std::shared_ptr<const ExecutionEnvironment> env);

// A `finish` whose result is the staged workspace diff, falling back to the
// model's summary when there is nothing to diff.
protocol::ToolDescriptor make_patch_finish_tool(
    std::shared_ptr<const ExecutionEnvironment> env);

// Refuses to let the run finish while the workspace diff is empty.
protocol::FinishGuard make_pending_changes_guard(
    std::shared_ptr<const ExecutionEnvironment> env);

// Value of a named argument, or a missing_argument error.
core::errors::Result<std::string> require_argument(
    const protocol::ToolArguments& arguments, const std::string& name);

// Parses a decimal line number; bad text yields invalid_integer.
core::errors::Result<std::size_t> parse_line_number(const std::string& name,
                                                    const std::string& text);

}  // namespace tailcall::tools
