#include "runtime/agent_config.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace tailcall::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError invalid_value(const std::string& key, const std::string& expected) {
    return AgentError{ErrorCategory::Input,
                      "Config key '" + key + "' must be " + expected + ".",
                      "invalid_config_value"};
}

// Copies a string member when present. Returns false on a type mismatch.
bool read_string(const json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_string()) {
        return false;
    }
    out = it->get<std::string>();
    return true;
}

}  // namespace

std::string AgentConfig::default_system_prompt() {
    return "You are an autonomous software engineering agent working inside a "
           "source repository.\n"
           "At every step you REASON about what to do next and then ACT by calling "
           "exactly one of the available tools.\n"
           "\n"
           "How to work:\n"
           "1. Read the task carefully and identify what must change.\n"
           "2. Explore the repository: list directories, read the relevant files, "
           "search for symbols.\n"
           "3. Make the changes in place in the source files. Describing a change is "
           "not the same as making it.\n"
           "4. Verify the changes by building or running the relevant tests.\n"
           "5. When the task is done, call `finish` with a short summary of what you "
           "changed.\n"
           "\n"
           "Rules:\n"
           "- Every response must end with exactly one call block in the response "
           "format below.\n"
           "- Only call tools that are listed below, with the arguments they declare.\n"
           "- Do not ask for clarification; nobody will answer during the run.\n"
           "- The number of steps is limited. If you run out of ideas or steps, call "
           "`finish` with the best result you have. A partial solution beats none.\n";
}

core::errors::Result<AgentConfig> parse_agent_config(const std::string& json_text,
                                                     AgentConfig base) {
    const json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return AgentError{ErrorCategory::Input, "Config is not valid JSON.",
                          "invalid_config_json"};
    }
    if (!document.is_object()) {
        return AgentError{ErrorCategory::Input, "Config must be a JSON object.",
                          "invalid_config_json"};
    }

    AgentConfig config = std::move(base);
    if (!read_string(document, "agent_name", config.agent_name)) {
        return invalid_value("agent_name", "a string");
    }
    if (!read_string(document, "system_prompt", config.system_prompt)) {
        return invalid_value("system_prompt", "a string");
    }
    if (!read_string(document, "budget_exhausted_result",
                     config.budget_exhausted_result)) {
        return invalid_value("budget_exhausted_result", "a string");
    }

    if (auto it = document.find("max_step_ceiling"); it != document.end()) {
        if (!it->is_number_unsigned() || it->get<std::uint64_t>() == 0 ||
            it->get<std::uint64_t>() > 1000) {
            return invalid_value("max_step_ceiling", "an integer between 1 and 1000");
        }
        config.max_step_ceiling = it->get<std::uint32_t>();
    }

    if (auto it = document.find("corrective_role"); it != document.end()) {
        if (!it->is_string()) {
            return invalid_value("corrective_role", "a string");
        }
        const auto role = protocol::role_from_string(it->get<std::string>());
        if (!role.has_value()) {
            return invalid_value("corrective_role",
                                 "one of system, user, assistant, tool");
        }
        config.corrective_role = role.value();
    }

    if (auto it = document.find("markers"); it != document.end()) {
        if (!it->is_object()) {
            return invalid_value("markers", "an object");
        }
        auto& markers = config.markers;
        if (!read_string(*it, "begin_call", markers.begin_call) ||
            !read_string(*it, "end_call", markers.end_call) ||
            !read_string(*it, "arg_sep", markers.arg_sep) ||
            !read_string(*it, "value_sep", markers.value_sep)) {
            return invalid_value("markers", "an object of strings");
        }
    }

    auto markers = protocol::ResponseParser::validate_markers(config.markers);
    if (core::errors::is_error(markers)) {
        return core::errors::get_error(markers);
    }
    return config;
}

core::errors::Result<AgentConfig> load_agent_config(const std::filesystem::path& path,
                                                    AgentConfig base) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Input,
                          "Unable to open config file: " + path.string(),
                          "config_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return AgentError{ErrorCategory::Input,
                          "I/O error while reading config file: " + path.string(),
                          "config_read_failed"};
    }
    return parse_agent_config(buffer.str(), std::move(base));
}

}  // namespace tailcall::runtime
