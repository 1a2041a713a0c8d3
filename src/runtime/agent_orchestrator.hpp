#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/response_parser.hpp"
#include "protocol/run_execution_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "runtime/agent_config.hpp"
#include "runtime/completion_provider.hpp"
#include "session/message_ledger.hpp"
#include "tools/tool_registry.hpp"

namespace tailcall::runtime {

enum class AgentState {
    Init,
    Running,
    Terminated
};

std::string to_string(AgentState state);

// Drives one reason/act run: render the prompt from the ledger and the tool
// catalog, ask the provider for a step, decode exactly one call, dispatch it,
// record everything in the ledger, and stop when `finish` is accepted or the
// step budget runs out.
//
// Protocol, dispatch, provider and tool failures never abort a run; they are
// fed back to the model as ledger entries. One orchestrator serves one run.
class AgentOrchestrator {
public:
    // Fails when the configured protocol markers are unusable.
    static core::errors::Result<std::unique_ptr<AgentOrchestrator>> create(
        AgentConfig config, CompletionProvider& provider);

    AgentOrchestrator(const AgentOrchestrator&) = delete;
    AgentOrchestrator& operator=(const AgentOrchestrator&) = delete;

    // Setup operations; only valid before run() (invalid_state_transition).
    core::errors::Result<std::size_t> add_tools(std::vector<protocol::ToolDescriptor> tools);
    core::errors::Result<AgentState> set_finish_guard(protocol::FinishGuard guard);
    core::errors::Result<AgentState> set_system_prompt(std::string prompt);
    void set_event_sink(protocol::EventSink sink) { event_sink_ = std::move(sink); }

    // Runs to completion. The budget is clamped to the configured ceiling.
    // Only state misuse is reported as an error; budget exhaustion returns the
    // forced finish result.
    core::errors::Result<protocol::RunOutcome> run(const std::string& task,
                                                   std::uint32_t step_budget);

    // Instructions + tool catalog + response template.
    std::string render_system_prompt() const;

    AgentState state() const { return state_; }
    const session::MessageLedger& ledger() const { return ledger_; }
    const tools::ToolRegistry& registry() const { return registry_; }
    const protocol::ResponseParser& parser() const { return parser_; }
    const AgentConfig& config() const { return config_; }
    protocol::MessageId system_message_id() const { return system_message_id_; }
    protocol::MessageId task_message_id() const { return task_message_id_; }

private:
    AgentOrchestrator(AgentConfig config, protocol::ResponseParser parser,
                      CompletionProvider& provider);

    core::errors::Result<AgentState> require_init(const std::string& operation) const;
    protocol::MessageId record(protocol::Role role, std::string content);
    void record_correction(std::string content);
    void emit(const protocol::AgentEvent& event) const;

    // Executes one iteration. Returns true when the run terminated.
    bool step(std::uint32_t step_number, protocol::RunOutcome& outcome);
    protocol::RunOutcome force_finish(std::uint32_t steps_executed);
    protocol::RunOutcome terminate(protocol::RunOutcome outcome);

    AgentConfig config_;
    protocol::ResponseParser parser_;
    CompletionProvider& provider_;
    session::MessageLedger ledger_;
    tools::ToolRegistry registry_;
    protocol::FinishGuard finish_guard_;
    protocol::EventSink event_sink_;
    AgentState state_ = AgentState::Init;
    protocol::MessageId system_message_id_ = 0;
    protocol::MessageId task_message_id_ = 0;
};

// The mandatory `finish(result)` capability; it simply returns `result`.
protocol::ToolDescriptor make_default_finish_tool();

}  // namespace tailcall::runtime
