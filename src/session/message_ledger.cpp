#include "session/message_ledger.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace tailcall::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::Message;
using protocol::MessageId;
using protocol::Role;

namespace {

std::string render_block(const Message& message) {
    return "----------------------------\n|MESSAGE(role=\"" +
           protocol::to_string(message.role) + "\", id=" +
           std::to_string(message.id) + ")|\n" + message.content + "\n";
}

}  // namespace

MessageId MessageLedger::append(const Role role, std::string content) {
    Message message;
    message.id = messages_.size();
    message.role = role;
    message.content = std::move(content);
    message.timestamp = std::chrono::system_clock::now();
    messages_.push_back(std::move(message));
    return messages_.back().id;
}

MessageId MessageLedger::append_slot(const Role role, std::string content) {
    const MessageId id = append(role, std::move(content));
    slot_ids_.insert(id);
    return id;
}

core::errors::Result<MessageId> MessageLedger::set_slot_content(
    const MessageId id, std::string content) {
    if (id >= messages_.size()) {
        TAILCALL_LOG_WARN("MessageLedger: rejected update of unknown message id " +
                          std::to_string(id));
        return AgentError{ErrorCategory::Input,
                          "Message id out of range: " + std::to_string(id),
                          "invalid_message_id"};
    }
    if (slot_ids_.find(id) == slot_ids_.end()) {
        TAILCALL_LOG_WARN("MessageLedger: rejected update of immutable message id " +
                          std::to_string(id));
        return AgentError{ErrorCategory::Input,
                          "Message id is not a mutable slot: " + std::to_string(id),
                          "message_not_slot"};
    }

    messages_[id].content = std::move(content);
    return id;
}

core::errors::Result<Message> MessageLedger::at(const MessageId id) const {
    if (id >= messages_.size()) {
        return AgentError{ErrorCategory::Input,
                          "Message id out of range: " + std::to_string(id),
                          "invalid_message_id"};
    }
    return messages_[id];
}

bool MessageLedger::is_slot(const MessageId id) const {
    return slot_ids_.find(id) != slot_ids_.end();
}

std::string MessageLedger::render_transcript(
    const std::set<MessageId>& exclude_ids) const {
    std::string transcript;
    for (const auto& message : messages_) {
        if (exclude_ids.find(message.id) != exclude_ids.end()) {
            continue;
        }
        transcript += render_block(message);
    }
    return transcript;
}

std::string MessageLedger::render_entry(const MessageId id) const {
    if (id >= messages_.size()) {
        return "";
    }
    return render_block(messages_[id]);
}

}  // namespace tailcall::session
