#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <variant>
#include "protocol/message_contract.hpp"
#include "protocol/run_execution_contract.hpp"

namespace tailcall::protocol {

    // Lifecycle events reported by the orchestrator while a run progresses.
    struct RunStartEvent { std::string task; std::uint32_t step_budget; };
    struct StepStartEvent { std::uint32_t step; };
    struct MessageAppendedEvent { Message message; };
    struct ProtocolErrorEvent { std::uint32_t step; std::string code; };
    struct ToolInvokedEvent { std::string tool_name; bool success; };
    struct RunEndEvent { RunOutcome outcome; };

    using AgentEvent = std::variant<
        RunStartEvent,
        StepStartEvent,
        MessageAppendedEvent,
        ProtocolErrorEvent,
        ToolInvokedEvent,
        RunEndEvent
    >;

    using EventSink = std::function<void(const AgentEvent&)>;

} // namespace tailcall::protocol
