#include <chrono>
#include <set>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "session/inbound_queue.hpp"

namespace {

using nlohmann::json;
using terminal::session::InboundQueue;
using terminal::session::PopStatus;

constexpr std::chrono::milliseconds kShortWait{20};
constexpr std::chrono::milliseconds kLongWait{2000};

TEST(InboundQueueTest, PopsInPushOrder) {
    InboundQueue queue;
    ASSERT_TRUE(queue.push(json{{"n", 1}}));
    ASSERT_TRUE(queue.push(json{{"n", 2}}));

    json frame;
    ASSERT_EQ(queue.pop(frame, kShortWait), PopStatus::Message);
    EXPECT_EQ(frame.at("n"), 1);
    ASSERT_EQ(queue.pop(frame, kShortWait), PopStatus::Message);
    EXPECT_EQ(frame.at("n"), 2);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(InboundQueueTest, TimesOutWhenEmpty) {
    InboundQueue queue;
    json frame;
    EXPECT_EQ(queue.pop(frame, kShortWait), PopStatus::Timeout);
}

TEST(InboundQueueTest, CloseWakesReaderAndRejectsPushes) {
    InboundQueue queue;
    PopStatus status = PopStatus::Message;
    std::thread reader([&] {
        json frame;
        status = queue.pop(frame, kLongWait);
    });

    std::this_thread::sleep_for(kShortWait);
    queue.close();
    reader.join();

    EXPECT_EQ(status, PopStatus::Closed);
    EXPECT_TRUE(queue.is_closed());
    EXPECT_FALSE(queue.push(json{{"late", true}}));
}

TEST(InboundQueueTest, CloseDropsPendingFrames) {
    InboundQueue queue;
    queue.push(json{{"n", 1}});
    queue.push(json{{"n", 2}});

    EXPECT_EQ(queue.close(), 2u);
    json frame;
    EXPECT_EQ(queue.pop(frame, kShortWait), PopStatus::Closed);
}

TEST(InboundQueueTest, ConcurrentPushesLoseNothing) {
    InboundQueue queue;
    constexpr int kWriters = 8;
    constexpr int kPerWriter = 250;

    std::vector<std::thread> writers;
    for (int w = 0; w < kWriters; ++w) {
        writers.emplace_back([&queue, w] {
            for (int i = 0; i < kPerWriter; ++i) {
                queue.push(json{{"writer", w}, {"seq", i}});
            }
        });
    }

    std::set<std::pair<int, int>> seen;
    std::vector<int> last_seq(kWriters, -1);
    bool per_writer_order = true;
    while (seen.size() < static_cast<std::size_t>(kWriters * kPerWriter)) {
        json frame;
        ASSERT_EQ(queue.pop(frame, kLongWait), PopStatus::Message);
        const int writer = frame.at("writer").get<int>();
        const int seq = frame.at("seq").get<int>();
        if (seq <= last_seq[writer]) {
            per_writer_order = false;
        }
        last_seq[writer] = seq;
        seen.emplace(writer, seq);
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_TRUE(per_writer_order);
    EXPECT_EQ(queue.size(), 0u);
}

}  // namespace
