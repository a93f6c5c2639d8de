#include <memory>
#include <string>
#include <gtest/gtest.h>
#include "session/connection_registry.hpp"
#include "support/recording_transport.hpp"

namespace {

using tandem::core::errors::get_error;
using tandem::core::errors::is_error;
using tandem::session::ConnectionRegistry;
using tandem::testing::RecordingTransport;
using tandem::transport::Connection;

struct Client {
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
    std::shared_ptr<Connection> connection;

    explicit Client(const std::string& id)
        : connection(std::make_shared<Connection>(id, transport)) {}
};

TEST(ConnectionRegistryTest, RegisterLookupAndSend) {
    ConnectionRegistry registry;
    Client client("conn-1");
    registry.register_connection("c1", client.connection);

    EXPECT_EQ(registry.lookup("c1"), client.connection);
    EXPECT_EQ(registry.lookup("c2"), nullptr);
    EXPECT_EQ(registry.connection_count(), 1u);

    ASSERT_FALSE(is_error(registry.send_to("c1", {{"type", "complete"}, {"sessionId", "c1"}})));
    client.connection->flush();
    EXPECT_EQ(client.transport->frames_of_type("complete").size(), 1u);
}

TEST(ConnectionRegistryTest, SendWithoutConnectionIsDropped) {
    ConnectionRegistry registry;
    auto sent = registry.send_to("ghost", {{"type", "part"}});
    ASSERT_TRUE(is_error(sent));
    EXPECT_EQ(get_error(sent).code, "connection_closed");
}

TEST(ConnectionRegistryTest, ReconnectReplacesBinding) {
    ConnectionRegistry registry;
    Client first("conn-1");
    Client second("conn-2");
    registry.register_connection("c1", first.connection);
    registry.register_connection("c1", second.connection);

    EXPECT_EQ(registry.lookup("c1"), second.connection);
    EXPECT_EQ(registry.connection_count(), 1u);
}

TEST(ConnectionRegistryTest, StaleUnregisterKeepsNewBinding) {
    ConnectionRegistry registry;
    Client first("conn-1");
    Client second("conn-2");
    registry.register_connection("c1", first.connection);
    registry.register_connection("c1", second.connection);

    EXPECT_FALSE(registry.unregister("c1", "conn-1"));
    EXPECT_EQ(registry.lookup("c1"), second.connection);
    EXPECT_TRUE(registry.unregister("c1", "conn-2"));
    EXPECT_EQ(registry.lookup("c1"), nullptr);
}

TEST(ConnectionRegistryTest, UnregisterConnectionDropsAllItsBindings) {
    ConnectionRegistry registry;
    Client shared("conn-1");
    Client other("conn-2");
    registry.register_connection("c1", shared.connection);
    registry.register_connection("c2", shared.connection);
    registry.register_connection("c3", other.connection);

    auto removed = registry.unregister_connection("conn-1");
    EXPECT_EQ(removed.size(), 2u);
    EXPECT_EQ(registry.connection_count(), 1u);
    EXPECT_EQ(registry.lookup("c3"), other.connection);
}

TEST(ConnectionRegistryTest, CloseUnbindsAndClosesTransport) {
    ConnectionRegistry registry;
    Client client("conn-1");
    registry.register_connection("c1", client.connection);
    registry.close("c1");

    EXPECT_EQ(registry.lookup("c1"), nullptr);
    EXPECT_FALSE(client.transport->is_open());
    registry.close("c1");
}

TEST(ConnectionRegistryTest, CloseAllSendsFinalFrameOncePerConnection) {
    ConnectionRegistry registry;
    Client shared("conn-1");
    registry.register_connection("c1", shared.connection);
    registry.register_connection("c2", shared.connection);

    registry.close_all(nlohmann::json{{"type", "shutdown"}, {"message", "bye"}});

    EXPECT_EQ(shared.transport->frames_of_type("shutdown").size(), 1u);
    EXPECT_FALSE(shared.transport->is_open());
    EXPECT_EQ(registry.connection_count(), 0u);
}

}  // namespace
