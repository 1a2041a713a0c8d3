#include "tools/builtin_tools.hpp"

#include <charconv>
#include <system_error>
#include <utility>

namespace tailcall::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolArguments;
using protocol::ToolDescriptor;
using protocol::ToolParameter;

core::errors::Result<std::string> require_argument(const ToolArguments& arguments,
                                                   const std::string& name) {
    auto it = arguments.find(name);
    if (it == arguments.end()) {
        return AgentError{ErrorCategory::Input, "Missing required argument: " + name,
                          "missing_argument"};
    }
    return it->second;
}

core::errors::Result<std::size_t> parse_line_number(const std::string& name,
                                                    const std::string& text) {
    std::size_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return AgentError{ErrorCategory::Input,
                          "Argument " + name + " must be a positive integer, got '" +
                              text + "'",
                          "invalid_integer"};
    }
    return value;
}

std::vector<ToolDescriptor> make_builtin_tools(
    std::shared_ptr<const ExecutionEnvironment> env) {
    std::vector<ToolDescriptor> tools;

    tools.push_back(ToolDescriptor{
        "run_bash_cmd",
        {ToolParameter{"command", "the shell command to run"}},
        "Run the command in a bash shell in the repository root and return its "
        "stdout and stderr. A nonzero exit status is reported as an error together "
        "with the captured output.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto command = require_argument(args, "command");
            if (core::errors::is_error(command)) {
                return core::errors::get_error(command);
            }
            return env->execute(core::errors::get_value(command));
        }});

    tools.push_back(ToolDescriptor{
        "show_file",
        {ToolParameter{"file_path", "path to the file"}},
        "Show the full content of a text file.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto path = require_argument(args, "file_path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            return env->read_file(core::errors::get_value(path));
        }});

    tools.push_back(ToolDescriptor{
        "replace_in_file",
        {ToolParameter{"file_path", "path to the file"},
         ToolParameter{"from_line", "first line to replace (1-indexed, inclusive)"},
         ToolParameter{"to_line", "last line to replace (1-indexed, inclusive)"},
         ToolParameter{"content", "text that replaces the range"}},
        "Replace lines from_line..to_line of a file with the given content and "
        "return the updated file.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto path = require_argument(args, "file_path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            auto from_text = require_argument(args, "from_line");
            if (core::errors::is_error(from_text)) {
                return core::errors::get_error(from_text);
            }
            auto to_text = require_argument(args, "to_line");
            if (core::errors::is_error(to_text)) {
                return core::errors::get_error(to_text);
            }
            auto content = require_argument(args, "content");
            if (core::errors::is_error(content)) {
                return core::errors::get_error(content);
            }

            auto from_line = parse_line_number("from_line", core::errors::get_value(from_text));
            if (core::errors::is_error(from_line)) {
                return core::errors::get_error(from_line);
            }
            auto to_line = parse_line_number("to_line", core::errors::get_value(to_text));
            if (core::errors::is_error(to_line)) {
                return core::errors::get_error(to_line);
            }
            return env->write_range(core::errors::get_value(path),
                                    core::errors::get_value(from_line),
                                    core::errors::get_value(to_line),
                                    core::errors::get_value(content));
        }});

    tools.push_back(ToolDescriptor{
        "create_file",
        {ToolParameter{"file_path", "path to the file"},
         ToolParameter{"content", "content to write to the file"}},
        "Create a file (and missing parent directories) with the given content, "
        "overwriting any existing file.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto path = require_argument(args, "file_path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            auto content = require_argument(args, "content");
            if (core::errors::is_error(content)) {
                return core::errors::get_error(content);
            }
            return env->create_file(core::errors::get_value(path),
                                    core::errors::get_value(content));
        }});

    tools.push_back(ToolDescriptor{
        "append_to_file",
        {ToolParameter{"file_path", "path to the file"},
         ToolParameter{"content", "content to append"}},
        "Append content to the end of a file, creating it if missing. Returns the "
        "tail of the updated file.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto path = require_argument(args, "file_path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            auto content = require_argument(args, "content");
            if (core::errors::is_error(content)) {
                return core::errors::get_error(content);
            }
            return env->append_to_file(core::errors::get_value(path),
                                       core::errors::get_value(content));
        }});

    tools.push_back(ToolDescriptor{
        "list_dir",
        {ToolParameter{"path", "directory to list, defaults to the repository root",
                       false}},
        "List the immediate children of a directory. Directories end with '/'.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto it = args.find("path");
            const std::string path = it == args.end() || it->second.empty()
                                         ? std::string(".")
                                         : it->second;
            return env->list_dir(path);
        }});

    tools.push_back(ToolDescriptor{
        "grep",
        {ToolParameter{"path", "file or directory to search"},
         ToolParameter{"pattern", "ECMAScript regular expression"}},
        "Return the lines matching a regex as 'file:line: text', searching "
        "directories recursively.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto path = require_argument(args, "path");
            if (core::errors::is_error(path)) {
                return core::errors::get_error(path);
            }
            auto pattern = require_argument(args, "pattern");
            if (core::errors::is_error(pattern)) {
                return core::errors::get_error(pattern);
            }
            return env->grep(core::errors::get_value(path),
                             core::errors::get_value(pattern));
        }});

    return tools;
}

ToolDescriptor make_patch_finish_tool(std::shared_ptr<const ExecutionEnvironment> env) {
    return ToolDescriptor{
        protocol::kFinishToolName,
        {ToolParameter{"result", "a summary of the changes you made"}},
        "Call this when the task is solved. Stages all workspace changes and "
        "returns them as a patch, which becomes the final result of the run.",
        [env](const ToolArguments& args) -> core::errors::Result<std::string> {
            auto result = require_argument(args, "result");
            if (core::errors::is_error(result)) {
                return core::errors::get_error(result);
            }
            const auto& summary = core::errors::get_value(result);

            auto patch = env->diff();
            if (core::errors::is_error(patch)) {
                return summary + "\n\n" + core::errors::get_error(patch).message;
            }
            const auto& patch_text = core::errors::get_value(patch);
            if (patch_text.find_first_not_of(" \t\r\n") == std::string::npos) {
                return summary + "\n\nNo changes detected to generate a patch.";
            }
            return patch_text;
        }};
}

protocol::FinishGuard make_pending_changes_guard(
    std::shared_ptr<const ExecutionEnvironment> env) {
    return [env]() { return env->has_pending_changes(); };
}

}  // namespace tailcall::tools
