#include "session/artifact_writer.hpp"

#include <chrono>
#include <cstdint>
#include <fstream>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace tailcall::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::int64_t to_unix_ms(const std::chrono::system_clock::time_point time) {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch())
            .count());
}

json request_to_json(const protocol::RunRequest& request) {
    json payload;
    payload["working_directory"] = request.working_directory.string();
    payload["max_steps"] = request.max_steps;
    payload["task_description"] =
        request.task_description.has_value() ? request.task_description.value() : "";
    payload["task_file"] =
        request.task_file.has_value() ? request.task_file.value().string() : "";
    payload["provider_command"] = request.provider_command;
    payload["finish_guard"] = request.finish_guard;
    return payload;
}

json message_to_json(const protocol::Message& message) {
    json payload;
    payload["id"] = message.id;
    payload["role"] = protocol::to_string(message.role);
    payload["content"] = message.content;
    payload["ts_unix_ms"] = to_unix_ms(message.timestamp);
    return payload;
}

// Model output is not guaranteed to be valid UTF-8; replace bad bytes instead of throwing.
std::string serialize(const json& event) {
    return event.dump(-1, ' ', false, json::error_handler_t::replace);
}

json make_event(const std::string& event_name, const std::string& run_id,
                json payload) {
    json event;
    event["ts_unix_ms"] = to_unix_ms(std::chrono::system_clock::now());
    event["event"] = event_name;
    event["run_id"] = run_id;
    event["payload"] = std::move(payload);
    return event;
}

}  // namespace

ArtifactWriter::ArtifactWriter(std::filesystem::path workspace_root,
                               std::filesystem::path artifact_subdir)
    : workspace_root_(std::move(workspace_root)),
      artifact_subdir_(std::move(artifact_subdir)) {}

core::errors::Result<std::filesystem::path> ArtifactWriter::run_log_path(
    const std::string& run_id) const {
    if (run_id.empty() || run_id.find('/') != std::string::npos) {
        return AgentError{ErrorCategory::Input, "Invalid run ID: '" + run_id + "'",
                          "invalid_run_id"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(workspace_root_, ec) || ec) {
        return AgentError{ErrorCategory::Input,
                          "Workspace root is not a directory: " +
                              workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto canonical_root = std::filesystem::weakly_canonical(workspace_root_, ec);
    if (ec) {
        return AgentError{ErrorCategory::Input,
                          "Unable to resolve workspace root: " +
                              workspace_root_.string(),
                          "invalid_workspace_root"};
    }

    const auto artifacts_dir = canonical_root / artifact_subdir_;
    std::filesystem::create_directories(artifacts_dir, ec);
    if (ec) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to create artifacts directory: " +
                              artifacts_dir.string(),
                          "artifact_dir_create_failed"};
    }

    return artifacts_dir / (run_id + ".jsonl");
}

core::errors::Result<std::filesystem::path> ArtifactWriter::append_event(
    const std::string& run_id, const std::string& event_json) const {
    auto run_path_result = run_log_path(run_id);
    if (core::errors::is_error(run_path_result)) {
        return core::errors::get_error(run_path_result);
    }
    const auto run_path = core::errors::get_value(run_path_result);

    std::ofstream out(run_path, std::ios::app);
    if (!out.is_open()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to open artifact file: " + run_path.string(),
                          "artifact_open_failed"};
    }

    out << event_json << "\n";
    if (!out.good()) {
        return AgentError{ErrorCategory::Internal,
                          "Unable to write artifact event: " + run_path.string(),
                          "artifact_write_failed"};
    }
    return run_path;
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_request(
    const std::string& run_id, const protocol::RunRequest& request) const {
    return append_event(run_id,
                        serialize(make_event("request", run_id, request_to_json(request))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_message(
    const std::string& run_id, const protocol::Message& message) const {
    return append_event(run_id,
                        serialize(make_event("message", run_id, message_to_json(message))));
}

core::errors::Result<std::filesystem::path> ArtifactWriter::write_final(
    const std::string& run_id, const protocol::RunOutcome& outcome) const {
    json payload;
    payload["reason"] = protocol::to_string(outcome.reason);
    payload["steps_executed"] = outcome.steps_executed;
    payload["result"] = outcome.result;
    return append_event(run_id, serialize(make_event("final", run_id, std::move(payload))));
}

}  // namespace tailcall::session
