#include <set>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/session_id.hpp"
#include "core/errors/terminal_errors.hpp"
#include "session/session_manager.hpp"

namespace {

using nlohmann::json;
using terminal::core::errors::get_error;
using terminal::core::errors::get_value;
using terminal::core::errors::is_error;
using terminal::session::PopStatus;
using terminal::session::SessionManager;
using terminal::session::SessionState;

TEST(SessionManagerTest, CreatesSessionWithValidId) {
    SessionManager manager;
    auto created = manager.create_session();
    ASSERT_FALSE(is_error(created));

    const auto session = get_value(created);
    EXPECT_EQ(session->id().size(), terminal::core::config::kSessionIdLength);
    EXPECT_TRUE(terminal::core::config::is_valid_session_id(session->id()));
    EXPECT_EQ(session->state(), SessionState::Connecting);
    EXPECT_EQ(manager.session_count(), 1u);

    auto found = manager.find(session->id());
    ASSERT_FALSE(is_error(found));
    EXPECT_EQ(get_value(found).get(), session.get());
}

TEST(SessionManagerTest, IdsAreUnique) {
    SessionManager manager;
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        auto created = manager.create_session();
        ASSERT_FALSE(is_error(created));
        ids.insert(get_value(created)->id());
    }
    EXPECT_EQ(ids.size(), 200u);
}

TEST(SessionManagerTest, DeliverQueuesFrameForSession) {
    SessionManager manager;
    const auto session = get_value(manager.create_session());

    auto delivered = manager.deliver(session->id(), json{{"tool", "hello_world"}});
    ASSERT_FALSE(is_error(delivered));

    json frame;
    ASSERT_EQ(session->inbound().pop(frame, std::chrono::milliseconds(10)), PopStatus::Message);
    EXPECT_EQ(frame.at("tool"), "hello_world");
}

TEST(SessionManagerTest, UnknownSessionIsNotFound) {
    SessionManager manager;
    const std::string id = terminal::core::config::generate_session_id();

    auto found = manager.find(id);
    ASSERT_TRUE(is_error(found));
    EXPECT_EQ(get_error(found).code, "session_not_found");

    auto delivered = manager.deliver(id, json::object());
    ASSERT_TRUE(is_error(delivered));
    EXPECT_EQ(get_error(delivered).code, "session_not_found");
}

TEST(SessionManagerTest, ClosedSessionIsForgotten) {
    SessionManager manager;
    const auto session = get_value(manager.create_session());
    const std::string id = session->id();

    manager.close_session(id);
    manager.close_session(id);

    EXPECT_TRUE(session->is_closed());
    EXPECT_EQ(manager.session_count(), 0u);
    ASSERT_TRUE(is_error(manager.find(id)));
    ASSERT_TRUE(is_error(manager.deliver(id, json::object())));
}

TEST(SessionManagerTest, DeliverToSessionClosedUnderneathReportsClosed) {
    SessionManager manager;
    const auto session = get_value(manager.create_session());
    session->close();

    auto delivered = manager.deliver(session->id(), json::object());
    ASSERT_TRUE(is_error(delivered));
    EXPECT_EQ(get_error(delivered).code, "session_closed");
}

TEST(SessionManagerTest, CloseAllClosesEverySession) {
    SessionManager manager;
    const auto first = get_value(manager.create_session());
    const auto second = get_value(manager.create_session());

    EXPECT_EQ(manager.close_all(), 2u);
    EXPECT_TRUE(first->is_closed());
    EXPECT_TRUE(second->is_closed());
    EXPECT_EQ(manager.session_count(), 0u);
}

TEST(SessionManagerTest, ActivateDoesNotReopenClosedSession) {
    SessionManager manager;
    const auto session = get_value(manager.create_session());

    EXPECT_TRUE(session->activate());
    EXPECT_EQ(session->state(), SessionState::Active);
    EXPECT_TRUE(session->close());
    EXPECT_FALSE(session->close());
    EXPECT_FALSE(session->activate());
    EXPECT_EQ(session->state(), SessionState::Closed);
}

TEST(SessionManagerTest, ConcurrentDeliveriesReachTheirOwnSessions) {
    SessionManager manager;
    const auto alpha = get_value(manager.create_session());
    const auto beta = get_value(manager.create_session());
    constexpr int kFrames = 200;

    std::vector<std::thread> writers;
    for (const auto& session : {alpha, beta}) {
        for (int t = 0; t < 4; ++t) {
            writers.emplace_back([&manager, id = session->id()] {
                for (int i = 0; i < kFrames; ++i) {
                    static_cast<void>(manager.deliver(id, json{{"to", id}}));
                }
            });
        }
    }
    for (auto& writer : writers) {
        writer.join();
    }

    for (const auto& session : {alpha, beta}) {
        EXPECT_EQ(session->inbound().size(), static_cast<std::size_t>(4 * kFrames));
        json frame;
        while (session->inbound().pop(frame, std::chrono::milliseconds(1)) ==
               PopStatus::Message) {
            EXPECT_EQ(frame.at("to"), session->id());
        }
    }
}

}  // namespace
