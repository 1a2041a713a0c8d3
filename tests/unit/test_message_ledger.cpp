#include <sstream>
#include <string>
#include <gtest/gtest.h>
#include "core/errors/agent_errors.hpp"
#include "core/logging/logger.hpp"
#include "session/message_ledger.hpp"

namespace {

using tailcall::core::errors::ErrorCategory;
using tailcall::core::errors::get_error;
using tailcall::core::errors::get_value;
using tailcall::core::errors::is_error;
using tailcall::core::logging::Logger;
using tailcall::protocol::Role;
using tailcall::session::MessageLedger;

class LogCapture {
public:
    LogCapture() { Logger::get().set_stream(stream_); }
    ~LogCapture() { Logger::get().set_stream(std::cerr); }

    std::string text() const { return stream_.str(); }

private:
    std::ostringstream stream_;
};

TEST(MessageLedgerTest, AssignsSequentialIds) {
    MessageLedger ledger;
    EXPECT_EQ(ledger.append(Role::System, "sys"), 0u);
    EXPECT_EQ(ledger.append(Role::User, "task"), 1u);
    EXPECT_EQ(ledger.append_slot(Role::User, ""), 2u);
    EXPECT_EQ(ledger.append(Role::Tool, "obs"), 3u);
    EXPECT_EQ(ledger.size(), 4u);

    for (std::size_t i = 0; i < ledger.entries().size(); ++i) {
        EXPECT_EQ(ledger.entries()[i].id, i);
    }
}

TEST(MessageLedgerTest, UpdatesSlotContent) {
    MessageLedger ledger;
    const auto slot = ledger.append_slot(Role::User, "");
    auto updated = ledger.set_slot_content(slot, "Fix the failing test");
    ASSERT_FALSE(is_error(updated));
    EXPECT_EQ(get_value(updated), slot);

    auto message = ledger.at(slot);
    ASSERT_FALSE(is_error(message));
    EXPECT_EQ(get_value(message).content, "Fix the failing test");
    EXPECT_EQ(get_value(message).role, Role::User);
    EXPECT_TRUE(ledger.is_slot(slot));
}

TEST(MessageLedgerTest, RejectsUpdateOfOrdinaryEntry) {
    LogCapture logs;
    MessageLedger ledger;
    const auto id = ledger.append(Role::Assistant, "I will list the files.");

    auto updated = ledger.set_slot_content(id, "rewritten history");
    ASSERT_TRUE(is_error(updated));
    EXPECT_EQ(get_error(updated).code, "message_not_slot");
    EXPECT_EQ(get_error(updated).category, ErrorCategory::Input);
    EXPECT_EQ(get_value(ledger.at(id)).content, "I will list the files.");
    EXPECT_NE(logs.text().find("WARN"), std::string::npos);
}

TEST(MessageLedgerTest, RejectsUnknownId) {
    LogCapture logs;
    MessageLedger ledger;
    ledger.append_slot(Role::System, "sys");

    auto updated = ledger.set_slot_content(7, "nothing here");
    ASSERT_TRUE(is_error(updated));
    EXPECT_EQ(get_error(updated).code, "invalid_message_id");
    EXPECT_EQ(ledger.size(), 1u);
    EXPECT_TRUE(is_error(ledger.at(7)));
    EXPECT_NE(logs.text().find("WARN"), std::string::npos);
}

TEST(MessageLedgerTest, RendersEntriesInIdOrder) {
    MessageLedger ledger;
    ledger.append(Role::Assistant, "thinking");
    ledger.append(Role::Tool, "a.txt\nb.txt");

    const std::string expected =
        "----------------------------\n"
        "|MESSAGE(role=\"assistant\", id=0)|\n"
        "thinking\n"
        "----------------------------\n"
        "|MESSAGE(role=\"tool\", id=1)|\n"
        "a.txt\nb.txt\n";
    EXPECT_EQ(ledger.render_transcript(), expected);
    EXPECT_EQ(ledger.render_entry(1),
              "----------------------------\n"
              "|MESSAGE(role=\"tool\", id=1)|\n"
              "a.txt\nb.txt\n");
    EXPECT_EQ(ledger.render_entry(9), "");
}

TEST(MessageLedgerTest, ExcludedIdsStayOutAfterMutation) {
    MessageLedger ledger;
    const auto system_id = ledger.append_slot(Role::System, "instructions");
    const auto task_id = ledger.append_slot(Role::User, "");
    ledger.append(Role::Assistant, "step one");

    ASSERT_FALSE(is_error(ledger.set_slot_content(task_id, "the real task")));

    const auto transcript = ledger.render_transcript({system_id, task_id});
    EXPECT_EQ(transcript.find("instructions"), std::string::npos);
    EXPECT_EQ(transcript.find("the real task"), std::string::npos);
    EXPECT_NE(transcript.find("step one"), std::string::npos);
    EXPECT_NE(transcript.find("id=2"), std::string::npos);
}

}  // namespace
