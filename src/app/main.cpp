#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <variant>
#include "app/cli_parser.hpp"
#include "core/config/run_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "runtime/agent_config.hpp"
#include "runtime/agent_orchestrator.hpp"
#include "runtime/command_completion_provider.hpp"
#include "session/artifact_writer.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/execution_environment.hpp"

namespace {

constexpr const char* kArtifactSubdir = ".tailcall_runs";

tailcall::core::errors::Result<std::string> load_task(
    const tailcall::protocol::RunRequest& req) {
    if (req.task_description.has_value()) {
        return req.task_description.value();
    }

    const auto& path = req.task_file.value();
    std::ifstream in(path);
    if (!in.is_open()) {
        return tailcall::core::errors::AgentError{
            tailcall::core::errors::ErrorCategory::Input,
            "Unable to open task file: " + path.string(), "task_file_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (buffer.str().find_first_not_of(" \t\r\n") == std::string::npos) {
        return tailcall::core::errors::AgentError{
            tailcall::core::errors::ErrorCategory::Input,
            "Task file is empty: " + path.string(), "empty_task"};
    }
    return buffer.str();
}

void log_input_error(const std::string& what,
                     const tailcall::core::errors::AgentError& err) {
    TAILCALL_LOG_ERROR(what + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        TAILCALL_LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    const std::string run_id = tailcall::core::config::generate_run_id();
    tailcall::core::logging::Logger::get().set_run_id(run_id);

    // 1. Parse CLI input, config and task
    auto parsed = tailcall::app::cli::parse_and_validate(argc, argv);
    if (tailcall::core::errors::is_error(parsed)) {
        log_input_error("Input error", tailcall::core::errors::get_error(parsed));
        return 2;
    }
    const auto& req = tailcall::core::errors::get_value(parsed);
    if (req.verbose) {
        tailcall::core::logging::Logger::get().set_min_level(
            tailcall::core::logging::LogLevel::DEBUG);
    }

    tailcall::runtime::AgentConfig config;
    if (req.config_file.has_value()) {
        auto loaded = tailcall::runtime::load_agent_config(req.config_file.value());
        if (tailcall::core::errors::is_error(loaded)) {
            log_input_error("Config error", tailcall::core::errors::get_error(loaded));
            return 2;
        }
        config = tailcall::core::errors::get_value(loaded);
    }

    auto task = load_task(req);
    if (tailcall::core::errors::is_error(task)) {
        log_input_error("Task error", tailcall::core::errors::get_error(task));
        return 2;
    }

    // 2. Wire the environment, provider and orchestrator
    auto env = std::make_shared<tailcall::tools::ExecutionEnvironment>(req.working_directory);
    env->exclude_from_diff(kArtifactSubdir);

    std::error_code ec;
    auto scratch_dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        scratch_dir = req.working_directory / kArtifactSubdir;
    }
    tailcall::runtime::CommandCompletionProvider provider(
        req.provider_command, scratch_dir / "tailcall" / run_id, req.provider_timeout_ms);

    auto created = tailcall::runtime::AgentOrchestrator::create(config, provider);
    if (tailcall::core::errors::is_error(created)) {
        log_input_error("Failed to create agent", tailcall::core::errors::get_error(created));
        return 3;
    }
    auto& agent = *tailcall::core::errors::get_value(created);

    auto builtins = agent.add_tools(tailcall::tools::make_builtin_tools(env));
    if (tailcall::core::errors::is_error(builtins)) {
        log_input_error("Failed to register tools", tailcall::core::errors::get_error(builtins));
        return 3;
    }
    auto finish = agent.add_tools({tailcall::tools::make_patch_finish_tool(env)});
    if (tailcall::core::errors::is_error(finish)) {
        log_input_error("Failed to register finish", tailcall::core::errors::get_error(finish));
        return 3;
    }
    if (req.finish_guard) {
        auto guarded = agent.set_finish_guard(tailcall::tools::make_pending_changes_guard(env));
        if (tailcall::core::errors::is_error(guarded)) {
            log_input_error("Failed to set finish guard",
                            tailcall::core::errors::get_error(guarded));
            return 3;
        }
    }

    // 3. Persist the request and every new ledger entry as it is appended
    tailcall::session::ArtifactWriter artifact_writer(req.working_directory, kArtifactSubdir);
    if (req.write_artifacts) {
        auto request_artifact = artifact_writer.write_request(run_id, req);
        if (tailcall::core::errors::is_error(request_artifact)) {
            log_input_error("Failed to write request artifact",
                            tailcall::core::errors::get_error(request_artifact));
            return 6;
        }
    }

    agent.set_event_sink([&](const tailcall::protocol::AgentEvent& event) {
        if (const auto* step = std::get_if<tailcall::protocol::StepStartEvent>(&event)) {
            TAILCALL_LOG_INFO("Step " + std::to_string(step->step) + " started");
            return;
        }
        const auto* appended = std::get_if<tailcall::protocol::MessageAppendedEvent>(&event);
        if (appended == nullptr || !req.write_artifacts) {
            return;
        }
        auto written = artifact_writer.write_message(run_id, appended->message);
        if (tailcall::core::errors::is_error(written)) {
            const auto& err = tailcall::core::errors::get_error(written);
            TAILCALL_LOG_ERROR("Failed to write message artifact [" + err.code + "]: " +
                               err.message);
        }
    });

    // 4. Run
    auto outcome_result =
        agent.run(tailcall::core::errors::get_value(task), req.max_steps);
    if (tailcall::core::errors::is_error(outcome_result)) {
        log_input_error("Run failed", tailcall::core::errors::get_error(outcome_result));
        return 1;
    }
    const auto& outcome = tailcall::core::errors::get_value(outcome_result);

    if (req.write_artifacts) {
        auto final_artifact = artifact_writer.write_final(run_id, outcome);
        if (tailcall::core::errors::is_error(final_artifact)) {
            log_input_error("Failed to write final artifact",
                            tailcall::core::errors::get_error(final_artifact));
            return 6;
        }
        TAILCALL_LOG_INFO("Artifacts: " +
                          tailcall::core::errors::get_value(final_artifact).string());
    }

    TAILCALL_LOG_INFO("Run " + tailcall::protocol::to_string(outcome.reason) + " after " +
                      std::to_string(outcome.steps_executed) + " steps");
    std::cout << outcome.result << std::endl;
    return 0;
}
