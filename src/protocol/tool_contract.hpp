#pragma once
#include <functional>
#include <map>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace tailcall::protocol {

    // Decoded argument name -> raw string value. Names are unique.
    using ToolArguments = std::map<std::string, std::string>;

    // A capability returns its observation text, or a capability-specific error.
    using ToolFunction =
        std::function<core::errors::Result<std::string>(const ToolArguments&)>;

    struct ToolParameter {
        std::string name;
        std::string description;
        bool required = true;
    };

    // One registry entry. The parameter list is declared up front and is
    // the only schema the registry validates calls against.
    struct ToolDescriptor {
        std::string name;
        std::vector<ToolParameter> parameters;
        std::string description;
        ToolFunction invoke;
    };

    // What the decoder recovers from one model response.
    struct ParsedCall {
        std::string thought;
        std::string name;
        ToolArguments arguments;
    };

    // Consulted when `finish` is called; false (or an error) vetoes termination.
    using FinishGuard = std::function<core::errors::Result<bool>()>;

    // Name of the capability whose invocation ends a run.
    inline constexpr const char* kFinishToolName = "finish";

} // namespace tailcall::protocol
