#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace tailcall::tools {

struct ProcessCapture {
    int exit_code = -1;
    bool timed_out = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs `command` through /bin/sh in `cwd`, capturing both streams. A
// timeout of 0 disables the deadline. The deadline counts from spawn until
// both pipes close, so a background job holding them open is killed along
// with the rest of the process group. Only failure to spawn is an error;
// a nonzero exit or a timeout is reported through the capture.
core::errors::Result<ProcessCapture> run_shell_command(
    const std::string& command, const std::filesystem::path& cwd,
    std::uint32_t timeout_ms);

// Wraps `value` in single quotes for safe use as one shell word.
std::string shell_quote(const std::string& value);

}  // namespace tailcall::tools
