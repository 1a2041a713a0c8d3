#include "runtime/command_completion_provider.hpp"

#include <fstream>
#include <system_error>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/run_id.hpp"
#include "core/logging/logger.hpp"
#include "tools/process_runner.hpp"

namespace tailcall::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

CommandCompletionProvider::CommandCompletionProvider(std::string command,
                                                     std::filesystem::path scratch_dir,
                                                     const std::uint32_t timeout_ms)
    : command_(std::move(command)),
      scratch_dir_(std::move(scratch_dir)),
      timeout_ms_(timeout_ms) {}

core::errors::Result<std::string> CommandCompletionProvider::complete(
    const CompletionRequest& request) {
    if (command_.empty()) {
        return AgentError{ErrorCategory::Input, "Provider command is empty.",
                          "empty_provider_command",
                          "Pass --provider-cmd with a program that prints a completion."};
    }

    std::error_code ec;
    std::filesystem::create_directories(scratch_dir_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create provider scratch directory: " +
                              scratch_dir_.string(),
                          "provider_scratch_failed"};
    }

    json payload;
    payload["system"] = request.system_text;
    payload["task"] = request.task_text;
    payload["transcript"] = request.transcript_text;
    payload["stop"] = request.stop_sequences;

    const auto request_file =
        scratch_dir_ / (core::config::generate_run_id("completion") + "_" +
                        std::to_string(++calls_) + ".json");
    {
        std::ofstream out(request_file);
        if (!out.is_open()) {
            return AgentError{ErrorCategory::Internal,
                              "Failed to open provider request file: " +
                                  request_file.string(),
                              "provider_scratch_failed"};
        }
        out << payload.dump();
        if (!out.good()) {
            return AgentError{ErrorCategory::Internal,
                              "Failed to write provider request file: " +
                                  request_file.string(),
                              "provider_scratch_failed"};
        }
    }

    const std::string command = command_ + " " + tools::shell_quote(request_file.string());
    TAILCALL_LOG_DEBUG("CommandCompletionProvider: " + command);
    // The command runs from the invocation directory so relative program paths work.
    auto cwd = std::filesystem::current_path(ec);
    if (ec) {
        cwd = scratch_dir_;
    }
    auto capture_result = tools::run_shell_command(command, cwd, timeout_ms_);

    std::filesystem::remove(request_file, ec);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }

    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out) {
        return AgentError{ErrorCategory::Provider,
                          "Completion provider timed out after " +
                              std::to_string(timeout_ms_) + " ms.",
                          "provider_timed_out"};
    }
    if (capture.exit_code != 0) {
        return AgentError{ErrorCategory::Provider,
                          "Completion provider exited with code " +
                              std::to_string(capture.exit_code) + ": " +
                              capture.stderr_text,
                          "provider_failed"};
    }
    if (capture.stdout_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return AgentError{ErrorCategory::Provider,
                          "Completion provider returned no output.",
                          "empty_completion"};
    }
    return capture.stdout_text;
}

}  // namespace tailcall::runtime
