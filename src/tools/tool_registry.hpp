#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"

namespace tailcall::tools {

// Name -> capability table. Catalog order follows first registration;
// re-registering a name replaces the capability in place.
class ToolRegistry {
public:
    // All-or-nothing: a descriptor with an empty name, no invoke function or
    // duplicated parameter names rejects the whole batch
    // (invalid_tool_descriptor). Returns the number of descriptors applied.
    core::errors::Result<std::size_t> register_tools(
        std::vector<protocol::ToolDescriptor> descriptors);

    // Catalog text shown to the model, one entry per capability.
    std::string describe() const;

    const protocol::ToolDescriptor* lookup(const std::string& name) const;
    bool contains(const std::string& name) const { return lookup(name) != nullptr; }

    // Checks decoded argument names against the declared parameters.
    // Codes: unknown_tool, unexpected_argument, missing_argument.
    core::errors::Result<const protocol::ToolDescriptor*> validate_arguments(
        const std::string& name, const protocol::ToolArguments& arguments) const;

    // Runs the capability. Capability errors are returned untouched.
    core::errors::Result<std::string> invoke(
        const std::string& name, const protocol::ToolArguments& arguments) const;

    std::vector<std::string> names() const;
    // Comma-separated names in catalog order.
    std::string name_list() const;
    std::size_t size() const { return tools_.size(); }

private:
    std::vector<protocol::ToolDescriptor> tools_;
    std::unordered_map<std::string, std::size_t> index_;
};

}  // namespace tailcall::tools
