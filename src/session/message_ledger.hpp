#pragma once

#include <set>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"

namespace tailcall::session {

// Append-only conversation record of one run. Ids are positions: the n-th
// appended entry gets id n. Only entries appended as slots may later have
// their content replaced; everything else is immutable history.
class MessageLedger {
public:
    protocol::MessageId append(protocol::Role role, std::string content);
    protocol::MessageId append_slot(protocol::Role role, std::string content);

    // Rejects out-of-range ids (invalid_message_id) and ids that were not
    // appended as slots (message_not_slot); the entry is left untouched.
    core::errors::Result<protocol::MessageId> set_slot_content(
        protocol::MessageId id, std::string content);

    core::errors::Result<protocol::Message> at(protocol::MessageId id) const;
    bool is_slot(protocol::MessageId id) const;

    // One block per entry, ascending id order, skipping `exclude_ids`.
    std::string render_transcript(
        const std::set<protocol::MessageId>& exclude_ids = {}) const;
    std::string render_entry(protocol::MessageId id) const;

    const std::vector<protocol::Message>& entries() const { return messages_; }
    std::size_t size() const { return messages_.size(); }

private:
    std::vector<protocol::Message> messages_;
    std::set<protocol::MessageId> slot_ids_;
};

}  // namespace tailcall::session
