#include "runtime/agent_orchestrator.hpp"

#include <set>
#include <utility>
#include "core/logging/logger.hpp"

namespace tailcall::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::MessageId;
using protocol::Role;
using protocol::RunOutcome;
using protocol::TerminationReason;
using protocol::ToolArguments;
using protocol::ToolDescriptor;

std::string to_string(const AgentState state) {
    switch (state) {
        case AgentState::Init:
            return "init";
        case AgentState::Running:
            return "running";
        case AgentState::Terminated:
            return "terminated";
        default:
            return "unknown";
    }
}

ToolDescriptor make_default_finish_tool() {
    return ToolDescriptor{
        protocol::kFinishToolName,
        {protocol::ToolParameter{"result", "the final result of the task"}},
        "Call this with the final result once the task is solved. The result is "
        "returned as the outcome of the run.",
        [](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto it = args.find("result");
            if (it == args.end()) {
                return AgentError{ErrorCategory::Input,
                                  "Missing required argument: result",
                                  "missing_argument"};
            }
            return it->second;
        }};
}

core::errors::Result<std::unique_ptr<AgentOrchestrator>> AgentOrchestrator::create(
    AgentConfig config, CompletionProvider& provider) {
    auto parser = protocol::ResponseParser::create(config.markers);
    if (core::errors::is_error(parser)) {
        return core::errors::get_error(parser);
    }

    std::unique_ptr<AgentOrchestrator> orchestrator(new AgentOrchestrator(
        std::move(config), core::errors::get_value(parser), provider));

    auto registered = orchestrator->registry_.register_tools({make_default_finish_tool()});
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }
    return std::move(orchestrator);
}

AgentOrchestrator::AgentOrchestrator(AgentConfig config, protocol::ResponseParser parser,
                                     CompletionProvider& provider)
    : config_(std::move(config)), parser_(std::move(parser)), provider_(provider) {
    system_message_id_ = ledger_.append_slot(Role::System, config_.system_prompt);
    task_message_id_ = ledger_.append_slot(Role::User, "");
}

core::errors::Result<AgentState> AgentOrchestrator::require_init(
    const std::string& operation) const {
    if (state_ != AgentState::Init) {
        return AgentError{ErrorCategory::Input,
                          "Cannot " + operation + " while agent is " + to_string(state_),
                          "invalid_state_transition"};
    }
    return state_;
}

core::errors::Result<std::size_t> AgentOrchestrator::add_tools(
    std::vector<ToolDescriptor> tools) {
    auto allowed = require_init("register tools");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }
    return registry_.register_tools(std::move(tools));
}

core::errors::Result<AgentState> AgentOrchestrator::set_finish_guard(
    protocol::FinishGuard guard) {
    auto allowed = require_init("set the finish guard");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }
    finish_guard_ = std::move(guard);
    return state_;
}

core::errors::Result<AgentState> AgentOrchestrator::set_system_prompt(std::string prompt) {
    auto allowed = require_init("change the system prompt");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }
    auto updated = ledger_.set_slot_content(system_message_id_, std::move(prompt));
    if (core::errors::is_error(updated)) {
        return core::errors::get_error(updated);
    }
    return state_;
}

std::string AgentOrchestrator::render_system_prompt() const {
    std::string prompt;
    auto system_message = ledger_.at(system_message_id_);
    if (!core::errors::is_error(system_message)) {
        prompt = core::errors::get_value(system_message).content;
    }
    prompt += "\n--- AVAILABLE TOOLS ---\n";
    prompt += registry_.describe();
    prompt += "\n--- RESPONSE FORMAT ---\n";
    prompt += parser_.response_template();
    return prompt;
}

void AgentOrchestrator::emit(const protocol::AgentEvent& event) const {
    if (event_sink_) {
        event_sink_(event);
    }
}

MessageId AgentOrchestrator::record(const Role role, std::string content) {
    const MessageId id = ledger_.append(role, std::move(content));
    auto message = ledger_.at(id);
    if (!core::errors::is_error(message)) {
        emit(protocol::MessageAppendedEvent{core::errors::get_value(message)});
    }
    return id;
}

void AgentOrchestrator::record_correction(std::string content) {
    record(config_.corrective_role, std::move(content));
}

core::errors::Result<RunOutcome> AgentOrchestrator::run(const std::string& task,
                                                        std::uint32_t step_budget) {
    auto allowed = require_init("start a run");
    if (core::errors::is_error(allowed)) {
        return core::errors::get_error(allowed);
    }

    if (step_budget > config_.max_step_ceiling) {
        TAILCALL_LOG_WARN("Agent " + config_.agent_name + ": step budget " +
                          std::to_string(step_budget) + " exceeds ceiling, using " +
                          std::to_string(config_.max_step_ceiling));
        step_budget = config_.max_step_ceiling;
    }

    auto task_set = ledger_.set_slot_content(task_message_id_, task);
    if (core::errors::is_error(task_set)) {
        return core::errors::get_error(task_set);
    }

    state_ = AgentState::Running;
    TAILCALL_LOG_INFO("Agent " + config_.agent_name + ": run started with budget " +
                      std::to_string(step_budget));
    emit(protocol::RunStartEvent{task, step_budget});

    RunOutcome outcome;
    for (std::uint32_t step_number = 1; step_number <= step_budget; ++step_number) {
        if (step(step_number, outcome)) {
            return terminate(std::move(outcome));
        }
    }
    return terminate(force_finish(step_budget));
}

bool AgentOrchestrator::step(const std::uint32_t step_number, RunOutcome& outcome) {
    TAILCALL_LOG_DEBUG("Agent " + config_.agent_name + ": step " +
                       std::to_string(step_number));
    emit(protocol::StepStartEvent{step_number});

    CompletionRequest request;
    request.system_text = render_system_prompt();
    auto task_message = ledger_.at(task_message_id_);
    if (!core::errors::is_error(task_message)) {
        request.task_text = core::errors::get_value(task_message).content;
    }
    request.transcript_text =
        ledger_.render_transcript({system_message_id_, task_message_id_});
    request.stop_sequences = {parser_.stop_sequence()};

    auto response = provider_.complete(request);
    if (core::errors::is_error(response)) {
        const auto& err = core::errors::get_error(response);
        TAILCALL_LOG_WARN("Agent " + config_.agent_name + ": completion failed " +
                          core::errors::describe(err));
        record_correction("The completion request failed (" + core::errors::describe(err) +
                          "). Continue with the task and respond using the required "
                          "format.");
        return false;
    }
    const std::string response_text =
        parser_.restore_stop_sequence(core::errors::get_value(response));

    auto parsed = parser_.parse(response_text);
    if (core::errors::is_error(parsed)) {
        const auto& err = core::errors::get_error(parsed);
        TAILCALL_LOG_WARN("Agent " + config_.agent_name + ": unparseable response " +
                          core::errors::describe(err));
        emit(protocol::ProtocolErrorEvent{step_number, err.code});
        record_correction("The previous response could not be parsed: " + err.message +
                          "\nPlease use the correct response format:\n" +
                          parser_.response_template() +
                          "\nYour previous response was:\n" + response_text);
        return false;
    }
    const auto& call = core::errors::get_value(parsed);

    record(Role::Assistant, call.thought);

    auto validated = registry_.validate_arguments(call.name, call.arguments);
    if (core::errors::is_error(validated)) {
        const auto& err = core::errors::get_error(validated);
        TAILCALL_LOG_WARN("Agent " + config_.agent_name + ": rejected call " +
                          core::errors::describe(err));
        if (err.code == "unknown_tool") {
            record_correction("The function '" + call.name +
                              "' is not recognized. Please use one of the available "
                              "tools: " +
                              registry_.name_list() + ".");
        } else {
            record_correction("The call to '" + call.name + "' is invalid: " +
                              err.message + ". " + err.hint);
        }
        return false;
    }

    TAILCALL_LOG_INFO("Agent " + config_.agent_name + ": step " +
                      std::to_string(step_number) + " calls " + call.name);
    auto invoked = registry_.invoke(call.name, call.arguments);
    const bool success = !core::errors::is_error(invoked);
    std::string observation;
    if (success) {
        observation = core::errors::get_value(invoked);
    } else {
        const auto& err = core::errors::get_error(invoked);
        TAILCALL_LOG_INFO("Agent " + config_.agent_name + ": tool " + call.name +
                          " failed " + core::errors::describe(err));
        observation = "Error: " + err.message;
    }
    record(Role::Tool, observation);
    emit(protocol::ToolInvokedEvent{call.name, success});

    if (call.name != protocol::kFinishToolName || !success) {
        return false;
    }

    if (finish_guard_) {
        auto allowed = finish_guard_();
        if (core::errors::is_error(allowed)) {
            record_correction("Finishing now is rejected: the finish check failed (" +
                              core::errors::get_error(allowed).message +
                              "). Keep working on the task.");
            return false;
        }
        if (!core::errors::get_value(allowed)) {
            record_correction("Finishing now is rejected: there are no changes in the "
                              "workspace yet. Make the required changes in place, then "
                              "call finish again.");
            return false;
        }
    }

    outcome.result = observation;
    outcome.reason = TerminationReason::Finished;
    outcome.steps_executed = step_number;
    return true;
}

RunOutcome AgentOrchestrator::force_finish(const std::uint32_t steps_executed) {
    TAILCALL_LOG_WARN("Agent " + config_.agent_name +
                      ": step budget exhausted without finish");

    RunOutcome outcome;
    outcome.reason = TerminationReason::BudgetExhausted;
    outcome.steps_executed = steps_executed;
    outcome.result = config_.budget_exhausted_result;

    const ToolArguments arguments = {{"result", config_.budget_exhausted_result}};
    auto validated = registry_.validate_arguments(protocol::kFinishToolName, arguments);
    if (core::errors::is_error(validated)) {
        TAILCALL_LOG_ERROR("Agent " + config_.agent_name + ": forced finish rejected " +
                           core::errors::describe(core::errors::get_error(validated)));
        return outcome;
    }

    auto finished = registry_.invoke(protocol::kFinishToolName, arguments);
    if (core::errors::is_error(finished)) {
        TAILCALL_LOG_ERROR("Agent " + config_.agent_name + ": forced finish failed " +
                           core::errors::describe(core::errors::get_error(finished)));
        return outcome;
    }
    outcome.result = core::errors::get_value(finished);
    record(Role::Tool, outcome.result);
    return outcome;
}

RunOutcome AgentOrchestrator::terminate(RunOutcome outcome) {
    state_ = AgentState::Terminated;
    TAILCALL_LOG_INFO("Agent " + config_.agent_name + ": run " +
                      protocol::to_string(outcome.reason) + " after " +
                      std::to_string(outcome.steps_executed) + " steps");
    emit(protocol::RunEndEvent{outcome});
    return outcome;
}

}  // namespace tailcall::runtime
