#pragma once
#include <string>
#include <variant>

namespace tailcall::core::errors {

    // Every failure in the agent falls into one of these buckets.
    enum class ErrorCategory {
        Input,      // Bad CLI flag, bad config value, misuse of a ledger id
        Protocol,   // Model output does not follow the call-block template
        Dispatch,   // Unknown tool name or arguments not matching its schema
        Execution,  // A tool, shell command or file operation failed
        Provider,   // The completion provider failed or timed out
        Internal    // Logic bug, I/O failure in our own bookkeeping
    };

    struct AgentError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // A Result holds either a value of type T or an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Protocol:  return "protocol";
            case ErrorCategory::Dispatch:  return "dispatch";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Provider:  return "provider";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

    // "[code] message" form used in log lines and corrective messages.
    inline std::string describe(const AgentError& error) {
        return "[" + error.code + "] " + error.message;
    }

} // namespace tailcall::core::errors
