#pragma once

#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/run_request.hpp"

namespace tailcall::session {

// Appends one JSON object per line to <workspace>/<subdir>/<run_id>.jsonl:
// a "request" event, a "message" event for each appended ledger entry, and
// a "final" event.
class ArtifactWriter {
public:
    explicit ArtifactWriter(std::filesystem::path workspace_root,
                            std::filesystem::path artifact_subdir = ".tailcall_runs");

    core::errors::Result<std::filesystem::path> write_request(
        const std::string& run_id, const protocol::RunRequest& request) const;

    core::errors::Result<std::filesystem::path> write_message(
        const std::string& run_id, const protocol::Message& message) const;

    core::errors::Result<std::filesystem::path> write_final(
        const std::string& run_id, const protocol::RunOutcome& outcome) const;

    core::errors::Result<std::filesystem::path> run_log_path(
        const std::string& run_id) const;

private:
    core::errors::Result<std::filesystem::path> append_event(
        const std::string& run_id, const std::string& event_json) const;

    std::filesystem::path workspace_root_;
    std::filesystem::path artifact_subdir_;
};

}  // namespace tailcall::session
