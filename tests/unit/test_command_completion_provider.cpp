#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "runtime/command_completion_provider.hpp"

namespace {

using tailcall::core::errors::ErrorCategory;
using tailcall::core::errors::get_error;
using tailcall::core::errors::get_value;
using tailcall::core::errors::is_error;
using tailcall::runtime::CommandCompletionProvider;
using tailcall::runtime::CompletionRequest;

class ScratchDir {
public:
    ScratchDir() {
        root_ = std::filesystem::current_path() /
                (".tmp_provider_" + tailcall::core::config::generate_run_id());
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

CompletionRequest make_request() {
    CompletionRequest request;
    request.system_text = "You are a test agent.";
    request.task_text = "Say hi";
    request.transcript_text = "";
    request.stop_sequences = {"----END_FUNCTION_CALL----"};
    return request;
}

TEST(CommandCompletionProviderTest, ReturnsCommandStdout) {
    ScratchDir scratch;
    CommandCompletionProvider provider("sh -c 'printf \"model says hi\"' _", scratch.root(),
                                       5000);

    auto result = provider.complete(make_request());
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "model says hi");
}

TEST(CommandCompletionProviderTest, PassesRequestFileAsLastArgument) {
    ScratchDir scratch;
    CommandCompletionProvider provider("cat", scratch.root(), 5000);

    auto result = provider.complete(make_request());
    ASSERT_FALSE(is_error(result));
    const auto& echoed = get_value(result);
    EXPECT_NE(echoed.find("\"system\":\"You are a test agent.\""), std::string::npos);
    EXPECT_NE(echoed.find("\"task\":\"Say hi\""), std::string::npos);
    EXPECT_NE(echoed.find("\"stop\":[\"----END_FUNCTION_CALL----\"]"), std::string::npos);

    // The request file is removed once the command returns.
    EXPECT_TRUE(std::filesystem::is_empty(scratch.root()));
}

TEST(CommandCompletionProviderTest, ReportsNonzeroExit) {
    ScratchDir scratch;
    CommandCompletionProvider provider("sh -c 'echo rate limited >&2; exit 4' _",
                                       scratch.root(), 5000);

    auto result = provider.complete(make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Provider);
    EXPECT_EQ(get_error(result).code, "provider_failed");
    EXPECT_NE(get_error(result).message.find("rate limited"), std::string::npos);
}

TEST(CommandCompletionProviderTest, ReportsEmptyOutput) {
    ScratchDir scratch;
    CommandCompletionProvider provider("true", scratch.root(), 5000);

    auto result = provider.complete(make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_completion");
}

TEST(CommandCompletionProviderTest, ReportsTimeout) {
    ScratchDir scratch;
    CommandCompletionProvider provider("sleep 2;", scratch.root(), 50);

    auto result = provider.complete(make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "provider_timed_out");
}

TEST(CommandCompletionProviderTest, RejectsEmptyCommand) {
    ScratchDir scratch;
    CommandCompletionProvider provider("", scratch.root());

    auto result = provider.complete(make_request());
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "empty_provider_command");
}

}  // namespace
