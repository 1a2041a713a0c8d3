#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace tailcall::app::cli {

    using namespace tailcall::core::errors;
    using tailcall::protocol::RunRequest;

    namespace {

        constexpr const char* kUsage =
            "Usage: tailcall run (--task \"...\" | --task-file FILE) --provider-cmd CMD "
            "[--cwd DIR] [--max-steps N] [--provider-timeout-ms MS] [--config FILE] "
            "[--no-guard] [--no-artifacts] [--verbose]";

        // Raw strings exactly as given on the command line.
        struct RawCliOptions {
            std::optional<std::string> task;
            std::optional<std::string> task_file;
            std::optional<std::string> cwd;
            std::optional<std::string> max_steps;
            std::optional<std::string> provider_cmd;
            std::optional<std::string> provider_timeout_ms;
            std::optional<std::string> config;
            bool no_guard = false;
            bool no_artifacts = false;
            bool verbose = false;
        };

        Result<std::uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                            std::uint32_t min, std::uint32_t max) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end || text.empty()) {
                return AgentError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min || value > max) {
                return AgentError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(min) + " and " + std::to_string(max) + "."};
            }
            return value;
        }

    } // namespace

    Result<RunRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        std::string command = argv[1];
        if (command != "run") {
            return AgentError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Currently only the 'run' command is supported."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 1. Read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<std::string>* target = nullptr;
            if (args[i] == "--task") target = &raw.task;
            else if (args[i] == "--task-file") target = &raw.task_file;
            else if (args[i] == "--cwd") target = &raw.cwd;
            else if (args[i] == "--max-steps") target = &raw.max_steps;
            else if (args[i] == "--provider-cmd") target = &raw.provider_cmd;
            else if (args[i] == "--provider-timeout-ms") target = &raw.provider_timeout_ms;
            else if (args[i] == "--config") target = &raw.config;
            else if (args[i] == "--no-guard") { raw.no_guard = true; continue; }
            else if (args[i] == "--no-artifacts") { raw.no_artifacts = true; continue; }
            else if (args[i] == "--verbose") { raw.verbose = true; continue; }
            else {
                return AgentError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }

            if (i + 1 >= args.size()) {
                return AgentError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
            }
            *target = args[++i];
        }

        // 2. Enforce logic and bounds
        RunRequest req;
        req.verbose = raw.verbose;
        req.finish_guard = !raw.no_guard;
        req.write_artifacts = !raw.no_artifacts;

        if (!raw.task.has_value() && !raw.task_file.has_value()) {
            return AgentError{ErrorCategory::Input, "Must provide either --task or --task-file", "missing_required_flag", kUsage};
        }
        if (raw.task.has_value() && raw.task_file.has_value()) {
            return AgentError{ErrorCategory::Input, "Cannot provide both --task and --task-file", "conflicting_flags"};
        }
        if (raw.task) req.task_description = raw.task.value();
        if (raw.task_file) req.task_file = std::filesystem::path(raw.task_file.value());

        if (!raw.provider_cmd.has_value() || raw.provider_cmd->empty()) {
            return AgentError{ErrorCategory::Input, "Must provide --provider-cmd", "missing_required_flag",
                              "The command receives the path of a JSON request file and prints the model output."};
        }
        req.provider_command = raw.provider_cmd.value();

        if (raw.max_steps) {
            auto steps = parse_bounded("--max-steps", raw.max_steps.value(), 1, 1000);
            if (is_error(steps)) {
                return get_error(steps);
            }
            req.max_steps = get_value(steps);
        }

        if (raw.provider_timeout_ms) {
            auto timeout = parse_bounded("--provider-timeout-ms", raw.provider_timeout_ms.value(), 1, 3600000);
            if (is_error(timeout)) {
                return get_error(timeout);
            }
            req.provider_timeout_ms = get_value(timeout);
        }

        if (raw.config) req.config_file = std::filesystem::path(raw.config.value());

        if (raw.cwd) {
            std::filesystem::path p(raw.cwd.value());
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Input, "Working directory does not exist or is not a directory", "invalid_path"};
            }

            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Input, "Failed to canonicalize working directory", "invalid_path"};
            }
            req.working_directory = std::move(canonical_path);
        }

        return req;
    }

} // namespace tailcall::app::cli
