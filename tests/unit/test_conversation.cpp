#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "session/conversation.hpp"

namespace {

using tandem::core::errors::get_error;
using tandem::core::errors::is_error;
using tandem::protocol::complete_tool;
using tandem::protocol::make_part;
using tandem::protocol::start_tool;
using tandem::protocol::TextData;
using tandem::protocol::ToolData;
using tandem::protocol::ToolStatus;
using tandem::session::Conversation;
using tandem::session::ConversationStatus;
using tandem::session::make_assistant_message;
using tandem::session::make_user_message;
using tandem::session::Message;

TEST(ConversationTest, UserMessageCarriesTextPart) {
    const Message message = make_user_message("c1", "hello");
    EXPECT_TRUE(message.is_user());
    EXPECT_EQ(message.content, "hello");
    EXPECT_FALSE(message.deferred);
    ASSERT_EQ(message.parts.size(), 1u);
    EXPECT_EQ(message.parts[0].message_id, message.id);
    EXPECT_EQ(message.parts[0].conversation_id, "c1");
}

TEST(ConversationTest, RejectsMessageFromOtherConversation) {
    Conversation conversation("c1");
    auto added = conversation.add_message(make_user_message("c2", "hi"));
    ASSERT_TRUE(is_error(added));
    EXPECT_EQ(get_error(added).code, "conversation_mismatch");
    EXPECT_EQ(conversation.message_count(), 0u);
}

TEST(ConversationTest, RejectsDuplicateMessage) {
    Conversation conversation("c1");
    const Message message = make_user_message("c1", "hi");
    ASSERT_FALSE(is_error(conversation.add_message(message)));
    EXPECT_EQ(get_error(conversation.add_message(message)).code, "duplicate_message");
}

TEST(ConversationTest, AppendAndUpdatePart) {
    Conversation conversation("c1");
    const Message assistant = make_assistant_message("c1");
    ASSERT_FALSE(is_error(conversation.add_message(assistant)));

    auto part = make_part(assistant.id, "c1", TextData{"draft"});
    ASSERT_FALSE(is_error(conversation.append_part(part)));
    EXPECT_EQ(get_error(conversation.append_part(part)).code, "duplicate_part");

    std::get<TextData>(part.data).text = "final";
    ASSERT_FALSE(is_error(conversation.update_part(part)));
    EXPECT_EQ(std::get<TextData>(conversation.find_part(part.id)->data).text, "final");
}

TEST(ConversationTest, FinishedToolPartCannotBeReopened) {
    Conversation conversation("c1");
    const Message assistant = make_assistant_message("c1");
    ASSERT_FALSE(is_error(conversation.add_message(assistant)));

    ToolData tool;
    tool.tool_name = "read_file";
    auto part = make_part(assistant.id, "c1", tool);
    ASSERT_FALSE(is_error(conversation.append_part(part)));
    ASSERT_FALSE(is_error(start_tool(part)));
    ASSERT_FALSE(is_error(complete_tool(part, {{"ok", true}}, "read", "done")));
    ASSERT_FALSE(is_error(conversation.update_part(part)));
    // Same terminal state again is accepted.
    ASSERT_FALSE(is_error(conversation.update_part(part)));

    auto reopened = part;
    std::get<ToolData>(reopened.data).state = ToolStatus::Running;
    auto updated = conversation.update_part(reopened);
    ASSERT_TRUE(is_error(updated));
    EXPECT_EQ(get_error(updated).code, "invalid_state_transition");
    EXPECT_EQ(std::get<ToolData>(conversation.find_part(part.id)->data).state,
              ToolStatus::Completed);
}

TEST(ConversationTest, UpdateCannotChangePartKind) {
    Conversation conversation("c1");
    const Message assistant = make_assistant_message("c1");
    ASSERT_FALSE(is_error(conversation.add_message(assistant)));

    auto part = make_part(assistant.id, "c1", TextData{"draft"});
    ASSERT_FALSE(is_error(conversation.append_part(part)));

    auto swapped = part;
    swapped.data = ToolData{};
    EXPECT_EQ(get_error(conversation.update_part(swapped)).code, "invalid_state_transition");
    EXPECT_EQ(std::get<TextData>(conversation.find_part(part.id)->data).text, "draft");
}

TEST(ConversationTest, PartMustNameKnownMessageAndConversation) {
    Conversation conversation("c1");
    auto orphan = make_part("msg-missing", "c1", TextData{"x"});
    EXPECT_EQ(get_error(conversation.append_part(orphan)).code, "message_not_found");

    auto foreign = make_part("msg-missing", "c2", TextData{"x"});
    EXPECT_EQ(get_error(conversation.append_part(foreign)).code, "conversation_mismatch");

    const Message assistant = make_assistant_message("c1");
    ASSERT_FALSE(is_error(conversation.add_message(assistant)));
    auto unknown = make_part(assistant.id, "c1", TextData{"x"});
    EXPECT_EQ(get_error(conversation.update_part(unknown)).code, "part_not_found");
}

TEST(ConversationTest, LatestQueries) {
    Conversation conversation("c1");
    EXPECT_FALSE(conversation.latest_message().has_value());

    const Message user = make_user_message("c1", "a");
    const Message assistant = make_assistant_message("c1");
    ASSERT_FALSE(is_error(conversation.add_message(user)));
    ASSERT_FALSE(is_error(conversation.add_message(assistant)));

    EXPECT_EQ(conversation.latest_message()->id, assistant.id);
    EXPECT_EQ(conversation.latest_user_message()->id, user.id);
    EXPECT_EQ(conversation.latest_assistant_message()->id, assistant.id);
}

TEST(ConversationTest, HasNewUserMessageAfter) {
    Conversation conversation("c1");
    const Message first = make_user_message("c1", "a");
    ASSERT_FALSE(is_error(conversation.add_message(first)));
    EXPECT_TRUE(conversation.has_new_user_message_after(""));

    const Message assistant = make_assistant_message("c1");
    ASSERT_FALSE(is_error(conversation.add_message(assistant)));
    EXPECT_FALSE(conversation.has_new_user_message_after(assistant.id));
    EXPECT_FALSE(conversation.has_new_user_message_after(""));

    ASSERT_FALSE(is_error(conversation.add_message(make_user_message("c1", "b", true))));
    EXPECT_TRUE(conversation.has_new_user_message_after(assistant.id));
}

TEST(ConversationTest, NextUnansweredPicksNewestAfterAssistant) {
    Conversation conversation("c1");
    const Message a = make_user_message("c1", "A");
    ASSERT_FALSE(is_error(conversation.add_message(a)));
    ASSERT_FALSE(is_error(conversation.add_message(make_assistant_message("c1"))));
    EXPECT_FALSE(conversation.next_unanswered_user_message(a.id).has_value());

    const Message b = make_user_message("c1", "B", true);
    const Message c = make_user_message("c1", "C", true);
    ASSERT_FALSE(is_error(conversation.add_message(b)));
    ASSERT_FALSE(is_error(conversation.add_message(c)));

    auto next = conversation.next_unanswered_user_message(a.id);
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->id, c.id);
}

TEST(ConversationTest, ConsumedMessageIsNeverReturnedAgain) {
    // A round that failed before creating its assistant message must not loop.
    Conversation conversation("c1");
    const Message a = make_user_message("c1", "A");
    ASSERT_FALSE(is_error(conversation.add_message(a)));
    EXPECT_FALSE(conversation.next_unanswered_user_message(a.id).has_value());
    EXPECT_EQ(conversation.next_unanswered_user_message("")->id, a.id);
}

TEST(ConversationTest, StatusTransitions) {
    Conversation conversation("c1");
    EXPECT_EQ(conversation.status(), ConversationStatus::Idle);
    conversation.mark_processing();
    EXPECT_EQ(conversation.status(), ConversationStatus::Processing);
    conversation.complete();
    EXPECT_EQ(conversation.status(), ConversationStatus::Completed);
}

TEST(ConversationTest, RendersRemindersForDeferredMessages) {
    std::vector<Message> messages;
    messages.push_back(make_user_message("c1", "first"));
    messages.push_back(make_assistant_message("c1"));
    EXPECT_EQ(tandem::session::render_pending_reminders(messages), "");

    messages.push_back(make_user_message("c1", "also check the tests", true));
    const std::string reminder = tandem::session::render_pending_reminders(messages);
    EXPECT_NE(reminder.find("<system-reminder>"), std::string::npos);
    EXPECT_NE(reminder.find("also check the tests"), std::string::npos);
    EXPECT_EQ(reminder.find("first"), std::string::npos);
}

TEST(ConversationTest, ConcurrentAppendsAreAllKept) {
    Conversation conversation("c1");
    std::vector<std::thread> writers;
    for (int i = 0; i < 8; ++i) {
        writers.emplace_back([&conversation, i] {
            for (int k = 0; k < 25; ++k) {
                auto added = conversation.add_message(
                    make_user_message("c1", std::to_string(i) + ":" + std::to_string(k)));
                EXPECT_FALSE(is_error(added));
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    EXPECT_EQ(conversation.message_count(), 200u);
}

}  // namespace
