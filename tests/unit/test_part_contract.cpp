#include <string>
#include <gtest/gtest.h>
#include "protocol/part_contract.hpp"

namespace {

using tandem::core::errors::get_error;
using tandem::core::errors::is_error;
using tandem::protocol::GoalData;
using tandem::protocol::make_part;
using tandem::protocol::Part;
using tandem::protocol::PartType;
using tandem::protocol::SubTaskData;
using tandem::protocol::SubTaskStatus;
using tandem::protocol::TodoData;
using tandem::protocol::TodoStatus;
using tandem::protocol::ToolData;
using tandem::protocol::ToolStatus;

Part tool_part() {
    ToolData data;
    data.tool_name = "read_file";
    return make_part("msg-1", "c1", data);
}

TEST(PartContractTest, MakePartCarriesOwnership) {
    const Part part = make_part("msg-1", "c1", GoalData{"title", "desc"});
    EXPECT_FALSE(part.id.empty());
    EXPECT_EQ(part.message_id, "msg-1");
    EXPECT_EQ(part.conversation_id, "c1");
    EXPECT_EQ(part.type(), PartType::Goal);
}

TEST(PartContractTest, ToolFollowsHappyPath) {
    Part part = tool_part();
    ASSERT_FALSE(is_error(tandem::protocol::start_tool(part)));
    ASSERT_FALSE(is_error(tandem::protocol::complete_tool(part, {{"lines", 3}}, "read", "abc")));

    const auto& data = std::get<ToolData>(part.data);
    EXPECT_EQ(data.state, ToolStatus::Completed);
    EXPECT_EQ(data.content, "abc");
    EXPECT_TRUE(data.start_time.has_value());
    EXPECT_TRUE(data.end_time.has_value());
}

TEST(PartContractTest, PendingToolCanFailDirectly) {
    Part part = tool_part();
    ASSERT_FALSE(is_error(tandem::protocol::fail_tool(part, "no connection")));
    EXPECT_EQ(std::get<ToolData>(part.data).state, ToolStatus::Error);
    EXPECT_EQ(std::get<ToolData>(part.data).error.value(), "no connection");
}

TEST(PartContractTest, CompletedToolIsFrozen) {
    Part part = tool_part();
    ASSERT_FALSE(is_error(tandem::protocol::start_tool(part)));
    ASSERT_FALSE(is_error(tandem::protocol::complete_tool(part, nullptr, "t", "c")));

    auto restart = tandem::protocol::start_tool(part);
    ASSERT_TRUE(is_error(restart));
    EXPECT_EQ(get_error(restart).code, "invalid_state_transition");

    auto fail = tandem::protocol::fail_tool(part, "late");
    ASSERT_TRUE(is_error(fail));
    EXPECT_EQ(get_error(fail).code, "invalid_state_transition");
    EXPECT_EQ(std::get<ToolData>(part.data).state, ToolStatus::Completed);
}

TEST(PartContractTest, ErroredToolIsFrozen) {
    Part part = tool_part();
    ASSERT_FALSE(is_error(tandem::protocol::fail_tool(part, "timeout")));
    EXPECT_TRUE(is_error(tandem::protocol::start_tool(part)));
    EXPECT_TRUE(is_error(tandem::protocol::complete_tool(part, nullptr, "t", "c")));
    EXPECT_TRUE(is_error(tandem::protocol::fail_tool(part, "again")));
}

TEST(PartContractTest, CompleteRequiresRunning) {
    Part part = tool_part();
    auto completed = tandem::protocol::complete_tool(part, nullptr, "t", "c");
    ASSERT_TRUE(is_error(completed));
    EXPECT_EQ(get_error(completed).code, "invalid_state_transition");
}

TEST(PartContractTest, ToolTransitionOnOtherVariantIsRejected) {
    Part part = make_part("msg-1", "c1", GoalData{});
    auto started = tandem::protocol::start_tool(part);
    ASSERT_TRUE(is_error(started));
    EXPECT_EQ(get_error(started).code, "wrong_part_type");
}

TEST(PartContractTest, SubTaskLifecycle) {
    Part part = make_part("msg-1", "c1", SubTaskData{});
    ASSERT_FALSE(is_error(tandem::protocol::start_subtask(part)));
    EXPECT_TRUE(is_error(tandem::protocol::start_subtask(part)));
    ASSERT_FALSE(is_error(tandem::protocol::complete_subtask(part, "found it")));
    EXPECT_EQ(std::get<SubTaskData>(part.data).status, SubTaskStatus::Completed);
    EXPECT_TRUE(is_error(tandem::protocol::cancel_subtask(part)));
}

TEST(PartContractTest, TodoProgress) {
    TodoData todo;
    auto& first = tandem::protocol::add_todo_item(todo, "read config");
    const std::string first_id = first.id;
    tandem::protocol::add_todo_item(todo, "write answer");

    EXPECT_TRUE(tandem::protocol::update_todo_status(todo, first_id, TodoStatus::Completed));
    EXPECT_FALSE(tandem::protocol::update_todo_status(todo, "missing", TodoStatus::Completed));
    EXPECT_EQ(tandem::protocol::completed_count(todo), 1u);
    EXPECT_DOUBLE_EQ(tandem::protocol::progress(todo), 0.5);
}

TEST(PartContractTest, WireNames) {
    EXPECT_EQ(tandem::protocol::to_string(PartType::SubTask), "SUBTASK");
    EXPECT_EQ(tandem::protocol::to_string(ToolStatus::Running), "RUNNING");
    EXPECT_EQ(tandem::protocol::to_string(SubTaskStatus::InProgress), "IN_PROGRESS");
}

}  // namespace
