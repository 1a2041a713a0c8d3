#pragma once
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace tailcall::protocol {

    enum class Role {
        System,     // Protocol and persona instructions
        User,       // Task description or corrective feedback
        Assistant,  // The model's reasoning text
        Tool        // Observation returned by a dispatched capability
    };

    // Ledger ids double as positions, so a plain index type is enough.
    using MessageId = std::size_t;

    struct Message {
        MessageId id = 0;
        Role role = Role::User;
        std::string content;
        std::chrono::system_clock::time_point timestamp;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::System:
                return "system";
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

    inline std::optional<Role> role_from_string(const std::string& text) {
        if (text == "system") return Role::System;
        if (text == "user") return Role::User;
        if (text == "assistant") return Role::Assistant;
        if (text == "tool") return Role::Tool;
        return std::nullopt;
    }

} // namespace tailcall::protocol
