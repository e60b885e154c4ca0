#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/frame_codec.hpp"

namespace {

using nlohmann::json;
using terminal::protocol::classify;
using terminal::protocol::encode_sse_comment;
using terminal::protocol::encode_sse_event;
using terminal::protocol::FrameKind;
using terminal::protocol::negotiate_protocol_version;

TEST(FrameCodecTest, ClassifiesToolInvocation) {
    const auto frame = classify(json{{"tool", "run_command"},
                                     {"arguments", {{"command", "ls"}}},
                                     {"id", "abc"}});
    ASSERT_EQ(frame.kind, FrameKind::ToolInvocation);
    EXPECT_EQ(frame.tool_call.name, "run_command");
    EXPECT_EQ(frame.tool_call.arguments.at("command"), "ls");
    ASSERT_TRUE(frame.tool_call.correlation_id.has_value());
    EXPECT_EQ(*frame.tool_call.correlation_id, "abc");
}

TEST(FrameCodecTest, ToolInvocationWithoutArgumentsGetsEmptyObject) {
    const auto frame = classify(json{{"tool", "hello_world"}});
    ASSERT_EQ(frame.kind, FrameKind::ToolInvocation);
    EXPECT_TRUE(frame.tool_call.arguments.is_object());
    EXPECT_TRUE(frame.tool_call.arguments.empty());
    EXPECT_FALSE(frame.tool_call.correlation_id.has_value());
}

TEST(FrameCodecTest, ClassifiesRpcRequestsAndNotifications) {
    const auto request = classify(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    EXPECT_EQ(request.kind, FrameKind::Request);
    EXPECT_EQ(request.method, "tools/list");
    EXPECT_TRUE(request.jsonrpc);

    const auto notification =
        classify(json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    EXPECT_EQ(notification.kind, FrameKind::Notification);
    EXPECT_FALSE(notification.id.has_value());

    const auto response = classify(json{{"jsonrpc", "2.0"}, {"id", 7}, {"result", json::object()}});
    EXPECT_EQ(response.kind, FrameKind::Response);
}

TEST(FrameCodecTest, RejectsMalformedFrames) {
    EXPECT_EQ(classify(json::array({1, 2})).kind, FrameKind::Invalid);
    EXPECT_EQ(classify(json{{"tool", 5}}).kind, FrameKind::Invalid);
    EXPECT_EQ(classify(json{{"hello", "there"}}).kind, FrameKind::Invalid);

    const auto wrong_version = classify(json{{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
    EXPECT_EQ(wrong_version.kind, FrameKind::Invalid);
    EXPECT_TRUE(wrong_version.jsonrpc);
    EXPECT_FALSE(wrong_version.problem.empty());
}

TEST(FrameCodecTest, NegotiatesProtocolVersion) {
    EXPECT_EQ(negotiate_protocol_version("2024-11-05"), "2024-11-05");
    EXPECT_EQ(negotiate_protocol_version("1999-01-01"), "2025-06-18");
    EXPECT_EQ(negotiate_protocol_version(""), "2025-06-18");
}

TEST(FrameCodecTest, EncodesSingleLineEvent) {
    EXPECT_EQ(encode_sse_event("endpoint", "/messages/?session_id=abc"),
              "event: endpoint\r\ndata: /messages/?session_id=abc\r\n\r\n");
}

TEST(FrameCodecTest, SplitsMultiLineDataIntoFields) {
    EXPECT_EQ(encode_sse_event("message", "one\ntwo"),
              "event: message\r\ndata: one\r\ndata: two\r\n\r\n");
    EXPECT_EQ(encode_sse_event("message", ""), "event: message\r\ndata: \r\n\r\n");
}

TEST(FrameCodecTest, EncodesComment) {
    EXPECT_EQ(encode_sse_comment("ping - now"), ": ping - now\r\n\r\n");
}

}  // namespace
