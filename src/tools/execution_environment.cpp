#include "tools/execution_environment.hpp"

#include <algorithm>
#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "tools/process_runner.hpp"

namespace tailcall::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kAppendTailChars = 5000;
constexpr std::uintmax_t kMaxGrepFileBytes = 1024 * 1024;

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

std::string format_capture(const ProcessCapture& capture) {
    return "--STDOUT--\n" + capture.stdout_text + "\n--STDERR--\n" +
           capture.stderr_text;
}

AgentError file_error(const std::string& message, const std::string& code) {
    return AgentError{ErrorCategory::Execution, message, code};
}

// Splits keeping each line's trailing newline, so joining restores the text.
std::vector<std::string> split_lines_keep_newline(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        const std::size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start + 1));
        start = nl + 1;
    }
    return lines;
}

core::errors::Result<std::string> write_text(const std::filesystem::path& path,
                                             const std::string& content,
                                             const std::ios::openmode mode) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return file_error("Unable to create parent directory: " +
                                  path.parent_path().string(),
                              "directory_create_failed");
        }
    }

    std::ofstream out(path, mode);
    if (!out.is_open()) {
        return file_error("Failed to open file for writing: " + path.string(),
                          "file_open_failed");
    }
    out << content;
    if (!out.good()) {
        return file_error("I/O error while writing file: " + path.string(),
                          "file_write_failed");
    }
    return path.string();
}

}  // namespace

ExecutionEnvironment::ExecutionEnvironment(std::filesystem::path workspace_root,
                                           const std::uint32_t command_timeout_ms)
    : workspace_root_(std::move(workspace_root)),
      command_timeout_ms_(command_timeout_ms) {}

std::filesystem::path ExecutionEnvironment::resolve(
    const std::filesystem::path& path) const {
    if (path.is_absolute()) {
        return path;
    }
    return workspace_root_ / path;
}

core::errors::Result<std::string> ExecutionEnvironment::execute(
    const std::string& command) const {
    if (command.empty()) {
        return AgentError{ErrorCategory::Input, "Command cannot be empty.",
                          "empty_command"};
    }

    TAILCALL_LOG_DEBUG("ExecutionEnvironment: $ " + command);
    auto capture_result = run_shell_command(command, workspace_root_, command_timeout_ms_);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);

    if (capture.timed_out) {
        return AgentError{ErrorCategory::Execution,
                          "Command timed out after " +
                              std::to_string(command_timeout_ms_) +
                              " ms.\n\nPartial output:\n" + format_capture(capture),
                          "command_timed_out"};
    }
    if (capture.exit_code != 0) {
        return AgentError{ErrorCategory::Execution,
                          "Command failed with exit code " +
                              std::to_string(capture.exit_code) + "\n" +
                              format_capture(capture),
                          "command_failed"};
    }
    return format_capture(capture);
}

core::errors::Result<std::string> ExecutionEnvironment::read_file(
    const std::filesystem::path& path) const {
    const auto file_path = resolve(path);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return file_error("File not found: " + path.string(), "file_not_found");
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return file_error("Path is not a regular file: " + path.string(),
                          "not_a_regular_file");
    }
    if (is_probably_binary(file_path)) {
        return file_error("Refusing to read binary file: " + path.string(),
                          "binary_file");
    }

    std::ifstream in(file_path);
    if (!in.is_open()) {
        return file_error("Failed to open file: " + path.string(), "file_open_failed");
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return file_error("I/O error while reading file: " + path.string(),
                          "file_read_failed");
    }
    return buffer.str();
}

core::errors::Result<std::string> ExecutionEnvironment::write_range(
    const std::filesystem::path& path, const std::size_t from_line,
    const std::size_t to_line, const std::string& content) const {
    auto current = read_file(path);
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }

    std::vector<std::string> lines = split_lines_keep_newline(core::errors::get_value(current));
    const std::size_t from_idx = from_line > 0 ? from_line - 1 : 0;
    const std::size_t to_idx = std::min(lines.size(), to_line);
    if (from_idx > lines.size()) {
        return AgentError{ErrorCategory::Execution,
                          "Invalid from_line: " + std::to_string(from_line) +
                              " for file with " + std::to_string(lines.size()) +
                              " lines",
                          "invalid_line_range"};
    }
    if (to_idx < from_idx) {
        return AgentError{ErrorCategory::Execution,
                          "Invalid range: to_line (" + std::to_string(to_line) +
                              ") ends before from_line (" + std::to_string(from_line) +
                              ") - 1",
                          "invalid_line_range"};
    }

    // Keep the previous line terminated so the replacement starts on its own line.
    if (from_idx > 0 && lines[from_idx - 1].back() != '\n') {
        lines[from_idx - 1].push_back('\n');
    }

    std::string updated;
    for (std::size_t i = 0; i < from_idx; ++i) {
        updated += lines[i];
    }
    updated += content;
    if (content.empty() || content.back() != '\n') {
        updated.push_back('\n');
    }
    for (std::size_t i = to_idx; i < lines.size(); ++i) {
        updated += lines[i];
    }

    auto written = write_text(resolve(path), updated, std::ios::trunc);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return updated;
}

core::errors::Result<std::string> ExecutionEnvironment::create_file(
    const std::filesystem::path& path, const std::string& content) const {
    auto written = write_text(resolve(path), content, std::ios::trunc);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }
    return "File created: " + path.string();
}

core::errors::Result<std::string> ExecutionEnvironment::append_to_file(
    const std::filesystem::path& path, const std::string& content) const {
    auto written = write_text(resolve(path), content, std::ios::app);
    if (core::errors::is_error(written)) {
        return core::errors::get_error(written);
    }

    auto full = read_file(path);
    if (core::errors::is_error(full)) {
        return core::errors::get_error(full);
    }
    const auto& text = core::errors::get_value(full);
    if (text.size() <= kAppendTailChars) {
        return text;
    }
    return text.substr(text.size() - kAppendTailChars);
}

core::errors::Result<std::string> ExecutionEnvironment::list_dir(
    const std::filesystem::path& path) const {
    const auto dir_path = resolve(path);

    std::error_code ec;
    if (!std::filesystem::is_directory(dir_path, ec) || ec) {
        return file_error("Not a directory: " + path.string(), "not_a_directory");
    }

    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir_path, ec)) {
        std::string name = entry.path().filename().string();
        std::error_code type_ec;
        if (entry.is_directory(type_ec) && !type_ec) {
            name += "/";
        }
        names.push_back(std::move(name));
    }
    if (ec) {
        return file_error("Failed to list directory: " + path.string(),
                          "directory_list_failed");
    }

    std::sort(names.begin(), names.end());
    std::string listing;
    for (const auto& name : names) {
        if (!listing.empty()) {
            listing += "\n";
        }
        listing += name;
    }
    return listing;
}

core::errors::Result<std::string> ExecutionEnvironment::grep(
    const std::filesystem::path& path, const std::string& pattern,
    const std::size_t max_matches) const {
    if (pattern.empty()) {
        return AgentError{ErrorCategory::Input, "Search pattern cannot be empty.",
                          "empty_search_pattern"};
    }

    std::regex regex;
    try {
        regex = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return AgentError{ErrorCategory::Input,
                          "Invalid regex pattern '" + pattern + "': " + e.what(),
                          "invalid_search_pattern"};
    }

    const auto scope_path = resolve(path);
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        for (const auto& entry :
             std::filesystem::recursive_directory_iterator(scope_path, options, ec)) {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec) || entry_ec) {
                continue;
            }
            if (entry.path().string().find("/.git/") != std::string::npos) {
                continue;
            }
            files.push_back(entry.path());
        }
        std::sort(files.begin(), files.end());
    } else {
        return file_error("Path not found: " + path.string(), "file_not_found");
    }

    std::ostringstream out;
    std::size_t matches = 0;
    for (const auto& file : files) {
        if (matches >= max_matches) {
            break;
        }

        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxGrepFileBytes || is_probably_binary(file)) {
            continue;
        }

        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }

        const auto display =
            file.lexically_normal().lexically_relative(workspace_root_.lexically_normal());
        const std::string display_name =
            display.empty() ? file.string() : display.string();
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (!std::regex_search(line, regex)) {
                continue;
            }
            out << display_name << ":" << line_no << ": " << trim_line(line) << "\n";
            if (++matches >= max_matches) {
                break;
            }
        }
    }

    if (matches == 0) {
        return std::string("No matches found.");
    }
    return out.str();
}

void ExecutionEnvironment::exclude_from_diff(std::string pathspec) {
    diff_excludes_.push_back(std::move(pathspec));
}

core::errors::Result<std::string> ExecutionEnvironment::diff() const {
    std::string command = "git add -A";
    if (!diff_excludes_.empty()) {
        command += " -- .";
        for (const auto& pathspec : diff_excludes_) {
            command += " " + shell_quote(":(exclude)" + pathspec);
        }
    }
    command += " && git diff --cached";

    auto capture_result = run_shell_command(command, workspace_root_, command_timeout_ms_);
    if (core::errors::is_error(capture_result)) {
        return core::errors::get_error(capture_result);
    }
    const auto& capture = core::errors::get_value(capture_result);
    if (capture.timed_out || capture.exit_code != 0) {
        return AgentError{ErrorCategory::Execution,
                          "Error running git commands: " + capture.stderr_text,
                          "diff_failed"};
    }
    return capture.stdout_text;
}

core::errors::Result<bool> ExecutionEnvironment::has_pending_changes() const {
    auto patch = diff();
    if (core::errors::is_error(patch)) {
        return core::errors::get_error(patch);
    }
    const auto& text = core::errors::get_value(patch);
    return text.find_first_not_of(" \t\r\n") != std::string::npos;
}

}  // namespace tailcall::tools
