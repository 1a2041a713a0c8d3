#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "core/config/run_id.hpp"
#include "core/errors/agent_errors.hpp"
#include "tools/builtin_tools.hpp"
#include "tools/execution_environment.hpp"
#include "tools/tool_registry.hpp"

namespace {

using tailcall::core::errors::get_error;
using tailcall::core::errors::get_value;
using tailcall::core::errors::is_error;
using tailcall::tools::ExecutionEnvironment;
using tailcall::tools::ToolRegistry;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_builtin_tools_" + tailcall::core::config::generate_run_id());
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

class BuiltinToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        env_ = std::make_shared<ExecutionEnvironment>(workspace_.root());
        ASSERT_FALSE(is_error(registry_.register_tools(tailcall::tools::make_builtin_tools(env_))));
        ASSERT_FALSE(is_error(registry_.register_tools(
            {tailcall::tools::make_patch_finish_tool(env_)})));
    }

    TempWorkspace workspace_;
    std::shared_ptr<ExecutionEnvironment> env_;
    ToolRegistry registry_;
};

TEST_F(BuiltinToolsTest, RegistersTheFullToolset) {
    for (const char* name : {"run_bash_cmd", "show_file", "replace_in_file", "create_file",
                             "append_to_file", "list_dir", "grep", "finish"}) {
        EXPECT_TRUE(registry_.contains(name)) << name;
    }
    EXPECT_NE(registry_.describe().find("Function: list_dir([path])"), std::string::npos);
}

TEST_F(BuiltinToolsTest, CreateShowAndReplaceThroughRegistry) {
    auto created = registry_.invoke("create_file",
                                    {{"file_path", "app.py"}, {"content", "a = 1\nb = 2\n"}});
    ASSERT_FALSE(is_error(created));

    auto replaced = registry_.invoke("replace_in_file", {{"file_path", "app.py"},
                                                         {"from_line", "2"},
                                                         {"to_line", "2"},
                                                         {"content", "b = 3"}});
    ASSERT_FALSE(is_error(replaced));
    EXPECT_EQ(get_value(replaced), "a = 1\nb = 3\n");

    auto shown = registry_.invoke("show_file", {{"file_path", "app.py"}});
    ASSERT_FALSE(is_error(shown));
    EXPECT_EQ(get_value(shown), "a = 1\nb = 3\n");
}

TEST_F(BuiltinToolsTest, ReplaceRejectsNonNumericLines) {
    ASSERT_FALSE(is_error(registry_.invoke("create_file",
                                           {{"file_path", "x.txt"}, {"content", "x\n"}})));
    auto result = registry_.invoke("replace_in_file", {{"file_path", "x.txt"},
                                                       {"from_line", "one"},
                                                       {"to_line", "1"},
                                                       {"content", "y"}});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST_F(BuiltinToolsTest, ListDirDefaultsToWorkspaceRoot) {
    ASSERT_FALSE(is_error(registry_.invoke("create_file",
                                           {{"file_path", "readme.md"}, {"content", "hi"}})));
    auto listing = registry_.invoke("list_dir", {});
    ASSERT_FALSE(is_error(listing));
    EXPECT_EQ(get_value(listing), "readme.md");
}

TEST_F(BuiltinToolsTest, BashAndGrepRunInWorkspace) {
    auto bash = registry_.invoke("run_bash_cmd", {{"command", "echo marker > m.txt && cat m.txt"}});
    ASSERT_FALSE(is_error(bash));
    EXPECT_NE(get_value(bash).find("marker"), std::string::npos);

    auto found = registry_.invoke("grep", {{"path", "."}, {"pattern", "mark"}});
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found), "m.txt:1: marker\n");
}

TEST_F(BuiltinToolsTest, FinishReturnsPatchOrSummary) {
    ASSERT_FALSE(is_error(env_->execute("git init -q .")));

    auto nothing = registry_.invoke("finish", {{"result", "Nothing to do."}});
    ASSERT_FALSE(is_error(nothing));
    EXPECT_EQ(get_value(nothing), "Nothing to do.\n\nNo changes detected to generate a patch.");

    auto guard = tailcall::tools::make_pending_changes_guard(env_);
    auto before = guard();
    ASSERT_FALSE(is_error(before));
    EXPECT_FALSE(get_value(before));

    ASSERT_FALSE(is_error(registry_.invoke("create_file",
                                           {{"file_path", "fix.c"}, {"content", "int x;\n"}})));
    auto patch = registry_.invoke("finish", {{"result", "Added fix.c"}});
    ASSERT_FALSE(is_error(patch));
    EXPECT_NE(get_value(patch).find("diff --git a/fix.c b/fix.c"), std::string::npos);
    EXPECT_NE(get_value(patch).find("+int x;"), std::string::npos);

    auto after = guard();
    ASSERT_FALSE(is_error(after));
    EXPECT_TRUE(get_value(after));
}

TEST(BuiltinToolHelpersTest, RequireArgumentAndParseLineNumber) {
    auto missing = tailcall::tools::require_argument({{"a", "1"}}, "b");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "missing_argument");

    auto parsed = tailcall::tools::parse_line_number("from_line", "42");
    ASSERT_FALSE(is_error(parsed));
    EXPECT_EQ(get_value(parsed), 42u);

    EXPECT_TRUE(is_error(tailcall::tools::parse_line_number("from_line", "")));
    EXPECT_TRUE(is_error(tailcall::tools::parse_line_number("from_line", "-3")));
    EXPECT_TRUE(is_error(tailcall::tools::parse_line_number("from_line", "7x")));
}

}  // namespace
