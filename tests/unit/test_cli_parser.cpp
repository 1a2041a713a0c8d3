#include <filesystem>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/errors/agent_errors.hpp"

namespace {

using tailcall::app::cli::parse_and_validate;
using tailcall::core::errors::ErrorCategory;
using tailcall::core::errors::get_error;
using tailcall::core::errors::get_value;
using tailcall::core::errors::is_error;
using tailcall::protocol::RunRequest;

tailcall::core::errors::Result<RunRequest> parse_tokens(
    const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("tailcall");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"status"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenTaskMissing) {
    auto result = parse_tokens({"run", "--provider-cmd", "cat"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
}

TEST(CliParserTest, FailsWhenProviderCommandMissing) {
    auto result = parse_tokens({"run", "--task", "fix issue"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
    EXPECT_FALSE(get_error(result).hint.empty());
}

TEST(CliParserTest, FailsWhenTaskAndTaskFileBothProvided) {
    auto result = parse_tokens({"run", "--task", "fix issue", "--task-file", "task.md",
                                "--provider-cmd", "cat"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "conflicting_flags");
}

TEST(CliParserTest, FailsOnUnknownArgument) {
    auto result = parse_tokens({"run", "--task", "fix issue", "--turbo"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenFlagValueMissing) {
    auto result = parse_tokens({"run", "--provider-cmd", "cat", "--task"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenMaxStepsNotNumeric) {
    auto result = parse_tokens({"run", "--task", "fix issue", "--provider-cmd", "cat",
                                "--max-steps", "abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxStepsHasTrailingCharacters) {
    auto result = parse_tokens({"run", "--task", "fix issue", "--provider-cmd", "cat",
                                "--max-steps", "12abc"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsWhenMaxStepsOutOfBounds) {
    auto result = parse_tokens({"run", "--task", "fix issue", "--provider-cmd", "cat",
                                "--max-steps", "0"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "bounds_error");
}

TEST(CliParserTest, FailsWhenCwdInvalid) {
    const auto missing_dir =
        std::filesystem::current_path() / "__definitely_missing_cli_parser_test_dir__";
    auto result = parse_tokens({"run", "--task", "fix issue", "--provider-cmd", "cat",
                                "--cwd", missing_dir.string()});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, ParsesValidTaskRequest) {
    const auto cwd = std::filesystem::current_path();
    auto result = parse_tokens({"run", "--task", "fix issue", "--cwd", cwd.string(),
                                "--max-steps", "42", "--provider-cmd", "./bin/model --fast",
                                "--provider-timeout-ms", "5000", "--no-guard",
                                "--verbose"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    ASSERT_TRUE(req.task_description.has_value());
    EXPECT_EQ(req.task_description.value(), "fix issue");
    EXPECT_FALSE(req.task_file.has_value());
    EXPECT_EQ(req.max_steps, 42u);
    EXPECT_EQ(req.provider_command, "./bin/model --fast");
    EXPECT_EQ(req.provider_timeout_ms, 5000u);
    EXPECT_FALSE(req.finish_guard);
    EXPECT_TRUE(req.write_artifacts);
    EXPECT_TRUE(req.verbose);
    EXPECT_TRUE(std::filesystem::exists(req.working_directory));
}

TEST(CliParserTest, ParsesValidTaskFileRequest) {
    auto result = parse_tokens({"run", "--task-file", "tasks/issue.md", "--provider-cmd",
                                "cat", "--config", "agent.json", "--no-artifacts"});
    ASSERT_FALSE(is_error(result));

    const auto& req = get_value(result);
    EXPECT_FALSE(req.task_description.has_value());
    ASSERT_TRUE(req.task_file.has_value());
    EXPECT_EQ(req.task_file->string(), "tasks/issue.md");
    ASSERT_TRUE(req.config_file.has_value());
    EXPECT_EQ(req.config_file->string(), "agent.json");
    EXPECT_EQ(req.max_steps, 30u);
    EXPECT_TRUE(req.finish_guard);
    EXPECT_FALSE(req.write_artifacts);
    EXPECT_FALSE(req.verbose);
}

}  // namespace
