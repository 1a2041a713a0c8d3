#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace tailcall::protocol {

    // The validated user input required to start an agent run.
    struct RunRequest {
        std::optional<std::string> task_description;
        std::optional<std::filesystem::path> task_file;
        std::filesystem::path working_directory = std::filesystem::current_path();
        std::uint32_t max_steps = 30;
        std::string provider_command;
        std::uint32_t provider_timeout_ms = 120000;
        std::optional<std::filesystem::path> config_file;
        bool finish_guard = true;
        bool write_artifacts = true;
        bool verbose = false;
    };

} // namespace tailcall::protocol
