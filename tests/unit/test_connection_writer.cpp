#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "support/recording_transport.hpp"
#include "transport/connection.hpp"
#include "transport/connection_writer.hpp"

namespace {

using tandem::core::errors::get_error;
using tandem::core::errors::is_error;
using tandem::testing::RecordingTransport;
using tandem::transport::Connection;
using tandem::transport::ConnectionWriter;

TEST(ConnectionWriterTest, WritesInEnqueueOrder) {
    auto transport = std::make_shared<RecordingTransport>();
    ConnectionWriter writer(transport);
    for (int i = 1; i <= 5; ++i) {
        ASSERT_FALSE(is_error(writer.enqueue("part" + std::to_string(i))));
    }
    writer.flush();

    const std::vector<std::string> expected = {"part1", "part2", "part3", "part4", "part5"};
    EXPECT_EQ(transport->frames(), expected);
    EXPECT_EQ(writer.written_count(), 5u);
}

TEST(ConnectionWriterTest, ConcurrentProducersNeverInterleaveFrames) {
    auto transport = std::make_shared<RecordingTransport>();
    ConnectionWriter writer(transport);

    constexpr int kProducers = 6;
    constexpr int kFramesEach = 50;
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&writer, p] {
            for (int i = 0; i < kFramesEach; ++i) {
                EXPECT_FALSE(is_error(writer.enqueue(
                    "p" + std::to_string(p) + "-" + std::to_string(i))));
            }
        });
    }
    for (auto& producer : producers) {
        producer.join();
    }
    writer.flush();

    const auto frames = transport->frames();
    ASSERT_EQ(frames.size(), static_cast<std::size_t>(kProducers * kFramesEach));
    // Per producer, frames arrive whole and in the order that producer enqueued them.
    std::vector<int> next(kProducers, 0);
    for (const auto& frame : frames) {
        const auto dash = frame.find('-');
        ASSERT_NE(dash, std::string::npos) << frame;
        const int producer = std::stoi(frame.substr(1, dash - 1));
        const int index = std::stoi(frame.substr(dash + 1));
        EXPECT_EQ(index, next[producer]) << frame;
        next[producer] = index + 1;
    }
}

TEST(ConnectionWriterTest, CloseDrainsQueuedFramesThenClosesTransport) {
    auto transport = std::make_shared<RecordingTransport>();
    transport->set_stalled(true);
    ConnectionWriter writer(transport);
    ASSERT_FALSE(is_error(writer.enqueue("a")));
    ASSERT_FALSE(is_error(writer.enqueue("b")));

    std::thread closer([&writer] { writer.close(); });
    transport->set_stalled(false);
    closer.join();

    EXPECT_EQ(transport->frames(), (std::vector<std::string>{"a", "b"}));
    EXPECT_FALSE(transport->is_open());
    EXPECT_FALSE(writer.accepting());
}

TEST(ConnectionWriterTest, CloseGivesUpOnStuckWriteAfterDrainTimeout) {
    auto transport = std::make_shared<RecordingTransport>();
    transport->set_stalled(true);
    ConnectionWriter writer(transport, std::chrono::milliseconds(50));
    ASSERT_FALSE(is_error(writer.enqueue("stuck")));
    ASSERT_FALSE(is_error(writer.enqueue("queued")));

    const auto started = std::chrono::steady_clock::now();
    writer.close();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));

    EXPECT_FALSE(transport->is_open());
    EXPECT_EQ(transport->close_count(), 1u);
    EXPECT_TRUE(transport->frames().empty());
    EXPECT_EQ(writer.written_count(), 0u);
    EXPECT_EQ(writer.dropped_count(), 2u);
}

TEST(ConnectionWriterTest, EnqueueAfterCloseFails) {
    auto transport = std::make_shared<RecordingTransport>();
    ConnectionWriter writer(transport);
    writer.close();
    writer.close();

    auto status = writer.enqueue("late");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "connection_closed");
    EXPECT_EQ(writer.dropped_count(), 1u);
    EXPECT_EQ(transport->close_count(), 1u);
}

TEST(ConnectionWriterTest, FailedWriteDropsTheRest) {
    auto transport = std::make_shared<RecordingTransport>();
    transport->set_fail_writes(true);
    ConnectionWriter writer(transport);
    ASSERT_FALSE(is_error(writer.enqueue("lost")));
    writer.flush();

    EXPECT_FALSE(writer.accepting());
    EXPECT_TRUE(is_error(writer.enqueue("after")));
    EXPECT_EQ(writer.written_count(), 0u);
    EXPECT_EQ(writer.dropped_count(), 2u);
}

TEST(ConnectionTest, SendSerializesJson) {
    auto transport = std::make_shared<RecordingTransport>();
    Connection connection("conn-1", transport);
    ASSERT_FALSE(is_error(connection.send({{"type", "ping"}, {"timestamp", 1}})));
    connection.flush();

    const auto pings = transport->frames_of_type("ping");
    ASSERT_EQ(pings.size(), 1u);
    EXPECT_EQ(pings[0].at("timestamp"), 1);
    EXPECT_TRUE(connection.is_open());

    connection.close();
    EXPECT_FALSE(connection.is_open());
}

TEST(ConnectionTest, InvalidUtf8IsReplacedInsteadOfThrowing) {
    auto transport = std::make_shared<RecordingTransport>();
    Connection connection("conn-1", transport);
    ASSERT_FALSE(is_error(connection.send({{"type", "part"}, {"text", std::string("\xff\xfe")}})));
    connection.flush();
    EXPECT_EQ(transport->frames().size(), 1u);
}

}  // namespace
