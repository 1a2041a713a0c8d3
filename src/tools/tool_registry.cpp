#include "tools/tool_registry.hpp"

#include <sstream>
#include <unordered_set>
#include <utility>
#include "core/logging/logger.hpp"

namespace tailcall::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolArguments;
using protocol::ToolDescriptor;

namespace {

std::string signature_of(const ToolDescriptor& tool) {
    std::string signature = tool.name + "(";
    for (std::size_t i = 0; i < tool.parameters.size(); ++i) {
        if (i > 0) {
            signature += ", ";
        }
        const auto& parameter = tool.parameters[i];
        signature += parameter.required ? parameter.name : "[" + parameter.name + "]";
    }
    return signature + ")";
}

core::errors::Result<std::size_t> check_descriptor(const ToolDescriptor& tool) {
    if (tool.name.empty()) {
        return AgentError{ErrorCategory::Input, "Tool name cannot be empty.",
                          "invalid_tool_descriptor"};
    }
    if (!tool.invoke) {
        return AgentError{ErrorCategory::Input,
                          "Tool has no invoke function: " + tool.name,
                          "invalid_tool_descriptor"};
    }
    std::unordered_set<std::string> seen;
    for (const auto& parameter : tool.parameters) {
        if (parameter.name.empty() || !seen.insert(parameter.name).second) {
            return AgentError{ErrorCategory::Input,
                              "Tool " + tool.name +
                                  " declares an empty or duplicated parameter name.",
                              "invalid_tool_descriptor"};
        }
    }
    return tool.parameters.size();
}

}  // namespace

core::errors::Result<std::size_t> ToolRegistry::register_tools(
    std::vector<ToolDescriptor> descriptors) {
    for (const auto& tool : descriptors) {
        auto checked = check_descriptor(tool);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
    }

    for (auto& tool : descriptors) {
        auto it = index_.find(tool.name);
        if (it != index_.end()) {
            TAILCALL_LOG_DEBUG("ToolRegistry: replacing tool " + tool.name);
            tools_[it->second] = std::move(tool);
            continue;
        }
        index_.emplace(tool.name, tools_.size());
        TAILCALL_LOG_DEBUG("ToolRegistry: registered tool " + tool.name);
        tools_.push_back(std::move(tool));
    }
    return descriptors.size();
}

std::string ToolRegistry::describe() const {
    std::ostringstream out;
    for (const auto& tool : tools_) {
        out << "Function: " << signature_of(tool) << "\n";
        if (!tool.description.empty()) {
            out << tool.description << "\n";
        }
        if (!tool.parameters.empty()) {
            out << "Args:\n";
            for (const auto& parameter : tool.parameters) {
                out << "    " << parameter.name
                    << (parameter.required ? "" : " (optional)") << ": "
                    << parameter.description << "\n";
            }
        }
        out << "\n";
    }
    return out.str();
}

const ToolDescriptor* ToolRegistry::lookup(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &tools_[it->second];
}

core::errors::Result<const ToolDescriptor*> ToolRegistry::validate_arguments(
    const std::string& name, const ToolArguments& arguments) const {
    const ToolDescriptor* tool = lookup(name);
    if (tool == nullptr) {
        return AgentError{ErrorCategory::Dispatch, "Unknown tool: " + name,
                          "unknown_tool", "Available tools: " + name_list()};
    }

    for (const auto& [arg_name, value] : arguments) {
        static_cast<void>(value);
        bool declared = false;
        for (const auto& parameter : tool->parameters) {
            if (parameter.name == arg_name) {
                declared = true;
                break;
            }
        }
        if (!declared) {
            return AgentError{ErrorCategory::Dispatch,
                              "Tool " + name + " has no parameter named '" +
                                  arg_name + "'",
                              "unexpected_argument",
                              "Expected signature: " + signature_of(*tool)};
        }
    }

    for (const auto& parameter : tool->parameters) {
        if (parameter.required && arguments.find(parameter.name) == arguments.end()) {
            return AgentError{ErrorCategory::Dispatch,
                              "Tool " + name + " is missing required argument '" +
                                  parameter.name + "'",
                              "missing_argument",
                              "Expected signature: " + signature_of(*tool)};
        }
    }
    return tool;
}

core::errors::Result<std::string> ToolRegistry::invoke(
    const std::string& name, const ToolArguments& arguments) const {
    const ToolDescriptor* tool = lookup(name);
    if (tool == nullptr) {
        return AgentError{ErrorCategory::Dispatch, "Unknown tool: " + name,
                          "unknown_tool"};
    }
    return tool->invoke(arguments);
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(tools_.size());
    for (const auto& tool : tools_) {
        result.push_back(tool.name);
    }
    return result;
}

std::string ToolRegistry::name_list() const {
    std::string joined;
    for (const auto& tool : tools_) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += tool.name;
    }
    return joined;
}

}  // namespace tailcall::tools
