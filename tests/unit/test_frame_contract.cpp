#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/frame_contract.hpp"

namespace {

using nlohmann::json;
using tandem::core::errors::get_error;
using tandem::core::errors::get_value;
using tandem::core::errors::is_error;
using tandem::protocol::ConversationRequest;
using tandem::protocol::decode_inbound;
using tandem::protocol::RequestKind;
using tandem::protocol::ToolData;
using tandem::protocol::ToolResultFrame;

TEST(FrameContractTest, DecodesChatRequest) {
    auto decoded = decode_inbound(
        R"({"type":"chat","sessionId":"c1","input":"hi","projectKey":"p","userName":"ana"})");
    ASSERT_FALSE(is_error(decoded));

    const auto* request = std::get_if<ConversationRequest>(&get_value(decoded));
    ASSERT_NE(request, nullptr);
    EXPECT_EQ(request->kind, RequestKind::Chat);
    EXPECT_EQ(request->conversation_id, "c1");
    EXPECT_EQ(request->input, "hi");
    EXPECT_EQ(request->project_key.value(), "p");
    EXPECT_EQ(request->user_name.value(), "ana");
    EXPECT_FALSE(request->user_ip.has_value());
}

TEST(FrameContractTest, DecodesAnalyzeRequest) {
    auto decoded = decode_inbound(R"({"type":"analyze","sessionId":"c2","input":"x"})");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(std::get<ConversationRequest>(get_value(decoded)).kind, RequestKind::Analyze);
}

TEST(FrameContractTest, RejectsMalformedFrames) {
    EXPECT_EQ(get_error(decode_inbound("not json")).code, "malformed_frame");
    EXPECT_EQ(get_error(decode_inbound("[1,2]")).code, "malformed_frame");
    EXPECT_EQ(get_error(decode_inbound(R"({"input":"x"})")).code, "missing_frame_type");
    EXPECT_EQ(get_error(decode_inbound(R"({"type":"chat","input":"x"})")).code,
              "missing_session_id");
    EXPECT_EQ(get_error(decode_inbound(R"({"type":"chat","sessionId":"c1"})")).code,
              "missing_input");
    EXPECT_EQ(get_error(decode_inbound(R"({"type":"TOOL_RESULT"})")).code,
              "missing_tool_call_id");
}

TEST(FrameContractTest, AcceptsBothToolResultSpellings) {
    for (const std::string type : {"tool_result", "TOOL_RESULT"}) {
        json frame = {{"type", type}, {"toolCallId", "t-1"}, {"success", true}, {"result", "ok"}};
        auto decoded = decode_inbound(frame.dump());
        ASSERT_FALSE(is_error(decoded)) << type;
        const auto& result = std::get<ToolResultFrame>(get_value(decoded));
        EXPECT_EQ(result.tool_call_id, "t-1");
        EXPECT_EQ(result.payload.at("result"), "ok");
    }
}

TEST(FrameContractTest, UnknownTypeIsNotAnError) {
    auto decoded = decode_inbound(R"({"type":"telemetry"})");
    ASSERT_FALSE(is_error(decoded));
    EXPECT_EQ(std::get<tandem::protocol::UnknownFrame>(get_value(decoded)).type, "telemetry");
}

TEST(FrameContractTest, ToolResultPayloadInterpretation) {
    auto ok = tandem::protocol::tool_result_from_payload("t-1", {{"result", {{"a", 1}}}});
    EXPECT_TRUE(ok.success);
    EXPECT_EQ(ok.output, R"({"a":1})");

    auto failed = tandem::protocol::tool_result_from_payload(
        "t-2", {{"success", false}, {"error", "file missing"}});
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error_message, "file missing");

    auto implicit = tandem::protocol::tool_result_from_payload("t-3", {{"error", "nope"}});
    EXPECT_FALSE(implicit.success);
}

TEST(FrameContractTest, PartFrameHasWireShape) {
    ToolData data;
    data.tool_name = "read_file";
    data.title = "read";
    auto part = tandem::protocol::make_part("m1", "c1", data);
    const json frame = tandem::protocol::part_frame("c1", part);

    EXPECT_EQ(frame.at("type"), "part");
    EXPECT_EQ(frame.at("sessionId"), "c1");
    const auto& wire = frame.at("part");
    EXPECT_EQ(wire.at("id"), part.id);
    EXPECT_EQ(wire.at("messageId"), "m1");
    EXPECT_EQ(wire.at("sessionId"), "c1");
    EXPECT_EQ(wire.at("type"), "TOOL");
    EXPECT_EQ(wire.at("data").at("toolName"), "read_file");
    EXPECT_EQ(wire.at("data").at("state"), "PENDING");
    EXPECT_FALSE(wire.at("data").contains("error"));
    EXPECT_EQ(wire.at("createdTime").get<std::string>().back(), 'Z');
}

TEST(FrameContractTest, PartSurvivesJsonForPersistence) {
    tandem::protocol::SubTaskData subtask;
    subtask.target = "Loader";
    subtask.depends_on = {"a", "b"};
    subtask.status = tandem::protocol::SubTaskStatus::Blocked;
    auto part = tandem::protocol::make_part("m1", "c1", subtask);

    auto decoded = tandem::protocol::part_from_json(tandem::protocol::part_to_json(part));
    ASSERT_FALSE(is_error(decoded));
    const auto& restored = get_value(decoded);
    EXPECT_EQ(restored.id, part.id);
    const auto& data = std::get<tandem::protocol::SubTaskData>(restored.data);
    EXPECT_EQ(data.target, "Loader");
    EXPECT_EQ(data.depends_on.size(), 2u);
    EXPECT_EQ(data.status, tandem::protocol::SubTaskStatus::Blocked);
}

TEST(FrameContractTest, OutboundControlFrames) {
    EXPECT_EQ(tandem::protocol::connected_frame().at("type"), "connected");
    EXPECT_EQ(tandem::protocol::complete_frame("c1").at("sessionId"), "c1");
    EXPECT_EQ(tandem::protocol::error_frame("boom").at("message"), "boom");

    const json call = tandem::protocol::tool_call_frame("t-1", "read_file", {{"path", "a"}});
    EXPECT_EQ(call.at("type"), "TOOL_CALL");
    EXPECT_EQ(call.at("toolCallId"), "t-1");
    EXPECT_EQ(call.at("params").at("path"), "a");

    EXPECT_EQ(tandem::protocol::pong_frame(42).at("timestamp"), 42);
}

}  // namespace
