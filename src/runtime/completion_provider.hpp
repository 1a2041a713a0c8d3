#pragma once

#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace tailcall::runtime {

// Everything the model sees for one step.
struct CompletionRequest {
    std::string system_text;
    std::string task_text;
    std::string transcript_text;
    std::vector<std::string> stop_sequences;
};

// Black-box text-in/text-out model backend. Called once per step and
// expected to block until the full response is available.
class CompletionProvider {
public:
    virtual ~CompletionProvider() = default;

    virtual core::errors::Result<std::string> complete(
        const CompletionRequest& request) = 0;
};

}  // namespace tailcall::runtime
