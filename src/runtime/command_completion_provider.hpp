#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "runtime/completion_provider.hpp"

namespace tailcall::runtime {

// Delegates completion to an external program. The request is written as a
// JSON object {system, task, transcript, stop} to a scratch file, the path of
// which is appended to `command` as its last argument. Whatever the program
// prints on stdout is the model output.
class CommandCompletionProvider : public CompletionProvider {
public:
    CommandCompletionProvider(std::string command, std::filesystem::path scratch_dir,
                              std::uint32_t timeout_ms = 120000);

    // Codes: empty_provider_command, provider_scratch_failed,
    // provider_timed_out, provider_failed, empty_completion.
    core::errors::Result<std::string> complete(const CompletionRequest& request) override;

private:
    std::string command_;
    std::filesystem::path scratch_dir_;
    std::uint32_t timeout_ms_;
    unsigned calls_ = 0;
};

}  // namespace tailcall::runtime
