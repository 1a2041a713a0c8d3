#pragma once

#include <cstdint>
#include <string>

namespace tailcall::protocol {

enum class TerminationReason {
    Finished,
    BudgetExhausted
};

struct RunOutcome {
    std::string result;
    TerminationReason reason = TerminationReason::Finished;
    std::uint32_t steps_executed = 0;
};

inline std::string to_string(const TerminationReason reason) {
    switch (reason) {
        case TerminationReason::Finished:
            return "finished";
        case TerminationReason::BudgetExhausted:
            return "budget_exhausted";
        default:
            return "unknown";
    }
}

}  // namespace tailcall::protocol
