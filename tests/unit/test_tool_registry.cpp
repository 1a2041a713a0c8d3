#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace {

using tailcall::core::errors::AgentError;
using tailcall::core::errors::ErrorCategory;
using tailcall::core::errors::get_error;
using tailcall::core::errors::get_value;
using tailcall::core::errors::is_error;
using tailcall::core::errors::Result;
using tailcall::protocol::ToolArguments;
using tailcall::protocol::ToolDescriptor;
using tailcall::protocol::ToolParameter;
using tailcall::tools::ToolRegistry;

ToolDescriptor make_echo(const std::string& name, const std::string& prefix = "") {
    return ToolDescriptor{
        name,
        {ToolParameter{"text", "what to echo"},
         ToolParameter{"suffix", "appended to the text", false}},
        "Echo the text back.",
        [prefix](const ToolArguments& args) -> Result<std::string> {
            std::string out = prefix + args.at("text");
            auto it = args.find("suffix");
            if (it != args.end()) {
                out += it->second;
            }
            return out;
        }};
}

ToolDescriptor make_failing() {
    return ToolDescriptor{"explode",
                          {},
                          "Always fails.",
                          [](const ToolArguments&) -> Result<std::string> {
                              return AgentError{ErrorCategory::Execution, "kaboom",
                                                "tool_exploded"};
                          }};
}

TEST(ToolRegistryTest, RegistersAndInvokes) {
    ToolRegistry registry;
    auto registered = registry.register_tools({make_echo("echo"), make_failing()});
    ASSERT_FALSE(is_error(registered));
    EXPECT_EQ(get_value(registered), 2u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_TRUE(registry.contains("echo"));

    auto result = registry.invoke("echo", {{"text", "hi"}, {"suffix", "!"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "hi!");
}

TEST(ToolRegistryTest, PassesCapabilityErrorsThrough) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tools({make_failing()})));

    auto result = registry.invoke("explode", {});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "tool_exploded");
    EXPECT_EQ(get_error(result).message, "kaboom");
}

TEST(ToolRegistryTest, ReplacesExistingNameInPlace) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tools({make_echo("echo"), make_failing()})));
    ASSERT_FALSE(is_error(registry.register_tools({make_echo("echo", ">> ")})));

    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.names(), (std::vector<std::string>{"echo", "explode"}));
    EXPECT_EQ(registry.name_list(), "echo, explode");
    auto result = registry.invoke("echo", {{"text", "hi"}});
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), ">> hi");
}

TEST(ToolRegistryTest, RejectsWholeBatchOnInvalidDescriptor) {
    ToolRegistry registry;
    ToolDescriptor nameless = make_echo("");
    auto result = registry.register_tools({make_echo("echo"), nameless});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_tool_descriptor");
    EXPECT_EQ(registry.size(), 0u);

    ToolDescriptor duplicated = make_echo("dup");
    duplicated.parameters.push_back(ToolParameter{"text", "again"});
    EXPECT_TRUE(is_error(registry.register_tools({duplicated})));

    ToolDescriptor no_body{"idle", {}, "does nothing", nullptr};
    EXPECT_TRUE(is_error(registry.register_tools({no_body})));
    EXPECT_EQ(registry.size(), 0u);
}

TEST(ToolRegistryTest, DescribesCatalogInRegistrationOrder) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tools({make_echo("echo"), make_failing()})));

    const std::string expected =
        "Function: echo(text, [suffix])\n"
        "Echo the text back.\n"
        "Args:\n"
        "    text: what to echo\n"
        "    suffix (optional): appended to the text\n"
        "\n"
        "Function: explode()\n"
        "Always fails.\n"
        "\n";
    EXPECT_EQ(registry.describe(), expected);
}

TEST(ToolRegistryTest, ValidatesUnknownTool) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tools({make_echo("echo")})));

    auto result = registry.validate_arguments("ecko", {{"text", "x"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Dispatch);
    EXPECT_EQ(get_error(result).code, "unknown_tool");
    EXPECT_EQ(get_error(result).hint, "Available tools: echo");
    EXPECT_TRUE(is_error(registry.invoke("ecko", {})));
}

TEST(ToolRegistryTest, ValidatesArgumentNames) {
    ToolRegistry registry;
    ASSERT_FALSE(is_error(registry.register_tools({make_echo("echo")})));

    auto unexpected = registry.validate_arguments("echo", {{"text", "x"}, {"colour", "red"}});
    ASSERT_TRUE(is_error(unexpected));
    EXPECT_EQ(get_error(unexpected).code, "unexpected_argument");

    auto missing = registry.validate_arguments("echo", {{"suffix", "!"}});
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_argument");

    auto ok = registry.validate_arguments("echo", {{"text", "x"}});
    ASSERT_FALSE(is_error(ok));
    EXPECT_EQ(get_value(ok)->name, "echo");
}

}  // namespace
