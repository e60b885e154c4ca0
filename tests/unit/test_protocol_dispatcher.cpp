#include <filesystem>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "protocol/frame_codec.hpp"
#include "runtime/protocol_dispatcher.hpp"
#include "tools/command_executor.hpp"
#include "tools/tool_registry.hpp"

namespace {

using nlohmann::json;
using terminal::runtime::ProtocolDispatcher;
using terminal::runtime::ProtocolState;
using terminal::runtime::ServerIdentity;
using terminal::tools::CommandExecutor;
using terminal::tools::make_builtin_registry;

json rpc_request(int id, const std::string& method, json params = json::object()) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

json initialize_request(int id) {
    return rpc_request(id, "initialize",
                       json{{"protocolVersion", "2024-11-05"},
                            {"capabilities", json::object()},
                            {"clientInfo", {{"name", "test-client"}, {"version", "0.1"}}}});
}

class ProtocolDispatcherTest : public ::testing::Test {
protected:
    ProtocolDispatcherTest()
        : executor_(std::filesystem::temp_directory_path()),
          registry_(make_builtin_registry(executor_)),
          dispatcher_(registry_, identity_) {}

    void handshake() {
        ASSERT_TRUE(dispatcher_.handle(initialize_request(0)).has_value());
        EXPECT_FALSE(dispatcher_.handle(json{{"jsonrpc", "2.0"},
                                             {"method", "notifications/initialized"}})
                         .has_value());
        ASSERT_EQ(dispatcher_.state(), ProtocolState::Serving);
    }

    CommandExecutor executor_;
    terminal::tools::ToolRegistry registry_;
    ServerIdentity identity_;
    ProtocolDispatcher dispatcher_;
};

TEST_F(ProtocolDispatcherTest, InitializeAnswersWithServerInfo) {
    EXPECT_EQ(dispatcher_.state(), ProtocolState::Connecting);

    auto reply = dispatcher_.handle(initialize_request(1));
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->at("jsonrpc"), "2.0");
    EXPECT_EQ(reply->at("id"), 1);

    const auto& result = reply->at("result");
    EXPECT_EQ(result.at("protocolVersion"), "2024-11-05");
    EXPECT_EQ(result.at("serverInfo").at("name"), "terminal");
    EXPECT_EQ(result.at("capabilities").at("tools").at("listChanged"), false);
    EXPECT_EQ(dispatcher_.state(), ProtocolState::Initialized);
}

TEST_F(ProtocolDispatcherTest, InitializedNotificationMovesToServing) {
    handshake();
}

TEST_F(ProtocolDispatcherTest, RequestsBeforeInitializeAreRejected) {
    auto reply = dispatcher_.handle(rpc_request(2, "tools/list"));
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->at("error").at("code"), terminal::protocol::kNotInitialized);
    EXPECT_EQ(dispatcher_.state(), ProtocolState::Connecting);
}

TEST_F(ProtocolDispatcherTest, ToolFrameBeforeInitializeIsRejected) {
    auto reply = dispatcher_.handle(json{{"tool", "hello_world"}, {"arguments", json::object()}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->at("error"), "Session is not initialized");
    EXPECT_FALSE(reply->contains("result"));
}

TEST_F(ProtocolDispatcherTest, PingWorksInAnyState) {
    auto reply = dispatcher_.handle(rpc_request(3, "ping"));
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE(reply->at("result").empty());
}

TEST_F(ProtocolDispatcherTest, ToolFrameReturnsResult) {
    handshake();

    auto reply = dispatcher_.handle(json{{"tool", "run_command"},
                                         {"arguments", {{"command", "echo hi"}}}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(*reply, json({{"result", "hi\n"}}));

    auto hello = dispatcher_.handle(json{{"tool", "hello_world"}, {"id", "h1"}});
    ASSERT_TRUE(hello.has_value());
    EXPECT_EQ(hello->at("result"), "Hello World");
    EXPECT_EQ(hello->at("id"), "h1");
}

TEST_F(ProtocolDispatcherTest, UnknownToolKeepsSessionServing) {
    handshake();

    auto reply = dispatcher_.handle(json{{"tool", "rm_everything"}, {"arguments", json::object()}});
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->at("error"), "Unknown tool: rm_everything");
    EXPECT_EQ(dispatcher_.state(), ProtocolState::Serving);

    auto next = dispatcher_.handle(json{{"tool", "hello_world"}});
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(next->at("result"), "Hello World");
}

TEST_F(ProtocolDispatcherTest, ToolsListDescribesBuiltins) {
    handshake();

    auto reply = dispatcher_.handle(rpc_request(4, "tools/list"));
    ASSERT_TRUE(reply.has_value());
    const auto& tools = reply->at("result").at("tools");
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].at("name"), "run_command");
    EXPECT_TRUE(tools[0].contains("inputSchema"));
    EXPECT_EQ(tools[1].at("name"), "hello_world");
}

TEST_F(ProtocolDispatcherTest, ToolsCallWrapsTextContent) {
    handshake();

    auto reply = dispatcher_.handle(rpc_request(
        5, "tools/call", json{{"name", "run_command"}, {"arguments", {{"command", "echo hi"}}}}));
    ASSERT_TRUE(reply.has_value());
    const auto& result = reply->at("result");
    EXPECT_EQ(result.at("isError"), false);
    ASSERT_EQ(result.at("content").size(), 1u);
    EXPECT_EQ(result.at("content")[0].at("type"), "text");
    EXPECT_EQ(result.at("content")[0].at("text"), "hi\n");
}

TEST_F(ProtocolDispatcherTest, ToolsCallReportsToolErrorsInBand) {
    handshake();

    auto reply = dispatcher_.handle(rpc_request(6, "tools/call", json{{"name", "nope"}}));
    ASSERT_TRUE(reply.has_value());
    EXPECT_FALSE(reply->contains("error"));
    EXPECT_EQ(reply->at("result").at("isError"), true);
    EXPECT_EQ(reply->at("result").at("content")[0].at("text"), "Unknown tool: nope");

    auto missing_name = dispatcher_.handle(rpc_request(7, "tools/call", json::object()));
    ASSERT_TRUE(missing_name.has_value());
    EXPECT_EQ(missing_name->at("error").at("code"), terminal::protocol::kInvalidParams);
}

TEST_F(ProtocolDispatcherTest, RequestAfterInitializeReplyIsServed) {
    ASSERT_TRUE(dispatcher_.handle(initialize_request(1)).has_value());

    auto reply = dispatcher_.handle(rpc_request(2, "tools/list"));
    ASSERT_TRUE(reply.has_value());
    EXPECT_TRUE(reply->contains("result"));
    EXPECT_EQ(dispatcher_.state(), ProtocolState::Serving);
}

TEST_F(ProtocolDispatcherTest, UnknownMethodIsReported) {
    handshake();

    auto reply = dispatcher_.handle(rpc_request(8, "resources/list"));
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->at("error").at("code"), terminal::protocol::kMethodNotFound);
    EXPECT_EQ(reply->at("id"), 8);
}

TEST_F(ProtocolDispatcherTest, InvalidFramesGetMatchingErrorShape) {
    handshake();

    auto rpc = dispatcher_.handle(json{{"jsonrpc", "1.0"}, {"id", 9}, {"method", "ping"}});
    ASSERT_TRUE(rpc.has_value());
    EXPECT_EQ(rpc->at("error").at("code"), terminal::protocol::kInvalidRequest);

    auto plain = dispatcher_.handle(json{{"what", "ever"}});
    ASSERT_TRUE(plain.has_value());
    EXPECT_TRUE(plain->at("error").is_string());
}

TEST_F(ProtocolDispatcherTest, ClientResponsesAndClosedStateProduceNothing) {
    handshake();
    EXPECT_FALSE(dispatcher_.handle(json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", json::object()}})
                     .has_value());

    dispatcher_.close();
    EXPECT_FALSE(dispatcher_.handle(json{{"tool", "hello_world"}}).has_value());
}

}  // namespace
