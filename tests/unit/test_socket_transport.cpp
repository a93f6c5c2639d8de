#include <memory>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <gtest/gtest.h>
#include "transport/socket_transport.hpp"

namespace {

using tandem::core::errors::get_error;
using tandem::core::errors::is_error;
using tandem::transport::SocketTransport;

class SocketTransportTest : public ::testing::Test {
protected:
    void SetUp() override {
        int fds[2] = {-1, -1};
        ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
        left_ = std::make_unique<SocketTransport>(fds[0]);
        right_ = std::make_unique<SocketTransport>(fds[1]);
    }

    std::unique_ptr<SocketTransport> left_;
    std::unique_ptr<SocketTransport> right_;
};

TEST_F(SocketTransportTest, FramesAreNewlineDelimited) {
    ASSERT_FALSE(is_error(left_->write_frame(R"({"type":"ping"})")));
    ASSERT_FALSE(is_error(left_->write_frame(R"({"type":"pong"})")));

    EXPECT_EQ(right_->read_frame().value(), R"({"type":"ping"})");
    EXPECT_EQ(right_->read_frame().value(), R"({"type":"pong"})");
}

TEST_F(SocketTransportTest, LargeFrameArrivesWhole) {
    const std::string big(200000, 'x');
    std::thread writer([&] { EXPECT_FALSE(is_error(left_->write_frame(big))); });
    const auto line = right_->read_frame();
    writer.join();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->size(), big.size());
}

TEST_F(SocketTransportTest, StripsCarriageReturn) {
    ASSERT_FALSE(is_error(left_->write_frame("hello\r")));
    EXPECT_EQ(right_->read_frame().value(), "hello");
}

TEST_F(SocketTransportTest, PeerCloseEndsReading) {
    left_->close();
    EXPECT_FALSE(right_->read_frame().has_value());
}

TEST_F(SocketTransportTest, WriteAfterCloseFails) {
    right_->close();
    EXPECT_FALSE(right_->is_open());
    auto status = right_->write_frame("late");
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "connection_closed");
}

TEST_F(SocketTransportTest, LocalCloseWakesBlockedReader) {
    std::thread reader([&] { EXPECT_FALSE(right_->read_frame().has_value()); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    right_->close();
    reader.join();
}

}  // namespace
