#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace tailcall::tools {

// File and process operations rooted at one workspace directory. Relative
// paths resolve against the workspace root. Side effects are not sandboxed.
class ExecutionEnvironment {
public:
    explicit ExecutionEnvironment(std::filesystem::path workspace_root,
                                  std::uint32_t command_timeout_ms = 60000);

    // Output is "--STDOUT--\n<out>\n--STDERR--\n<err>". A nonzero exit
    // (command_failed) or a timeout (command_timed_out) is an Execution
    // error whose message carries the same captured output.
    core::errors::Result<std::string> execute(const std::string& command) const;

    core::errors::Result<std::string> read_file(const std::filesystem::path& path) const;

    // Replaces lines [from_line, to_line] (1-indexed, inclusive) with
    // `content` and returns the updated file text.
    core::errors::Result<std::string> write_range(const std::filesystem::path& path,
                                                  std::size_t from_line,
                                                  std::size_t to_line,
                                                  const std::string& content) const;

    core::errors::Result<std::string> create_file(const std::filesystem::path& path,
                                                  const std::string& content) const;

    // Returns the last 5000 characters of the file after appending.
    core::errors::Result<std::string> append_to_file(const std::filesystem::path& path,
                                                     const std::string& content) const;

    core::errors::Result<std::string> list_dir(const std::filesystem::path& path) const;

    // ECMAScript regex search over a file or a directory tree.
    core::errors::Result<std::string> grep(const std::filesystem::path& path,
                                           const std::string& pattern,
                                           std::size_t max_matches = 200) const;

    // Stages everything and returns `git diff --cached`. Paths passed to
    // exclude_from_diff() are left out, e.g. the run's own artifacts.
    core::errors::Result<std::string> diff() const;
    void exclude_from_diff(std::string pathspec);
    core::errors::Result<bool> has_pending_changes() const;

    std::filesystem::path resolve(const std::filesystem::path& path) const;
    const std::filesystem::path& workspace_root() const { return workspace_root_; }

private:
    std::filesystem::path workspace_root_;
    std::uint32_t command_timeout_ms_;
    std::vector<std::string> diff_excludes_;
};

}  // namespace tailcall::tools
