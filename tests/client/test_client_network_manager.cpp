/**
 * @file test_client_network_manager.cpp
 * @brief Tests for ClientNetworkManager: link lifecycle and world mirroring
 */

#include <gtest/gtest.h>

#include "ClientNetworkManager.hpp"
#include "world.hpp"
#include "mocks/FakeByteStream.hpp"
#include "utils/TestHelpers.hpp"

using namespace Tether;
using namespace Tether::Test;

// =============================================================================
// Test Fixture
// =============================================================================

class ClientNetworkManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        client.setOnServerMessage([this](const ServerMessage& message) { received.push_back(message); });
        client.setOnDisconnected([this]() { disconnect_count++; });
    }

    void connect() {
        ASSERT_EQ(NetError::None, client.connectToServer(peer.createStream("server:10000")));
    }

    FakePeer peer;
    ClientNetworkManager client;
    std::vector<ServerMessage> received;
    int disconnect_count = 0;
};

// =============================================================================
// Connection Lifecycle
// =============================================================================

TEST_F(ClientNetworkManagerTest, StartsDisconnected) {
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(ClientState::DISCONNECTED, client.getConnectionState());
    EXPECT_EQ(NetError::Transport, client.send(PlayerInputMessage{ true, false }));
    EXPECT_EQ(NetError::Transport, client.readMessages());
}

TEST_F(ClientNetworkManagerTest, ConnectToUnresolvableAddressFails) {
    EXPECT_EQ(NetError::Connect, client.connectToServer("", 10000));
    EXPECT_FALSE(client.isConnected());
    EXPECT_FALSE(client.getLastErrorMessage().empty());
}

TEST_F(ClientNetworkManagerTest, SendReachesServer) {
    connect();
    EXPECT_EQ(NetError::None, client.send(PlayerInputMessage{ true, false }));

    auto messages = peer.takeMessages<ClientMessage>();
    ASSERT_EQ(1u, messages.size());
    EXPECT_EQ(ClientMessage(PlayerInputMessage{ true, false }), messages[0]);
}

TEST_F(ClientNetworkManagerTest, ReadMessagesDispatchesInOrder) {
    connect();
    peer.pushMessage(ServerMessage(LoadLevelMessage{ "one" }));
    peer.pushMessage(ServerMessage(SyncMessage{}));

    EXPECT_EQ(NetError::None, client.readMessages());

    ASSERT_EQ(2u, received.size());
    EXPECT_EQ(ServerMessage(LoadLevelMessage{ "one" }), received[0]);
    EXPECT_EQ(ServerMessage(SyncMessage{}), received[1]);
}

TEST_F(ClientNetworkManagerTest, ServerCloseDisconnectsOnce) {
    connect();
    peer.closeRemote();

    EXPECT_EQ(NetError::Transport, client.readMessages());
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(1, disconnect_count);

    // Polling stops after the failure
    EXPECT_EQ(NetError::Transport, client.readMessages());
    EXPECT_EQ(1, disconnect_count);
}

TEST_F(ClientNetworkManagerTest, MalformedFrameDisconnects) {
    connect();
    peer.pushBytes(rawFrame({ 64, 1, 0 }));  // A client message sent the wrong way

    EXPECT_EQ(NetError::Decode, client.readMessages());
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(1, disconnect_count);
    EXPECT_TRUE(peer.localClosed());
}

TEST_F(ClientNetworkManagerTest, WriteFailureDisconnects) {
    connect();
    peer.getControl().fail_writes = true;

    EXPECT_EQ(NetError::Transport, client.send(PlayerInputMessage{ false, true }));
    EXPECT_FALSE(client.isConnected());
    EXPECT_EQ(1, disconnect_count);
}

TEST_F(ClientNetworkManagerTest, ExplicitDisconnectClosesStreamWithoutCallback) {
    connect();
    client.disconnect();

    EXPECT_FALSE(client.isConnected());
    EXPECT_TRUE(peer.localClosed());
    EXPECT_EQ(0, disconnect_count);
}

TEST_F(ClientNetworkManagerTest, ReconnectFromMessageHandlerIsRefused) {
    connect();
    FakePeer other;
    NetError reconnect_result = NetError::None;
    client.setOnServerMessage([&](const ServerMessage&) {
        client.disconnect();
        reconnect_result = client.connectToServer(other.createStream("other:10000"));
    });
    peer.pushMessage(ServerMessage(SyncMessage{}));

    client.readMessages();

    EXPECT_EQ(NetError::Connect, reconnect_result);
    EXPECT_FALSE(client.isConnected());
    EXPECT_TRUE(peer.localClosed());
}

// =============================================================================
// Mirroring
// =============================================================================

TEST_F(ClientNetworkManagerTest, SyncCreatesThenUpdatesEntities) {
    world mirror;

    SyncMessage first;
    first.entity_states = { makeState(10, 1.0f), makeState(11, 2.0f) };
    client.applyServerMessage(mirror, first);

    EXPECT_EQ(2u, client.getMirroredEntityCount());
    entt::entity e10 = client.getEntityByNetworkId(10);
    ASSERT_NE(entt::entity(entt::null), e10);
    EXPECT_EQ(10u, mirror.registry.get<NetworkedEntity>(e10).network_id);
    EXPECT_EQ(1.0f, mirror.registry.get<TransformComponent>(e10).position.x);

    SyncMessage second;
    second.entity_states = { NodeState(10, glm::vec3(5.0f, 6.0f, 7.0f), glm::quat(0.0f, 1.0f, 0.0f, 0.0f)) };
    client.applyServerMessage(mirror, second);

    EXPECT_EQ(2u, client.getMirroredEntityCount());
    EXPECT_EQ(e10, client.getEntityByNetworkId(10));
    const auto& transform = mirror.registry.get<TransformComponent>(e10);
    EXPECT_EQ(glm::vec3(5.0f, 6.0f, 7.0f), transform.position);
    EXPECT_EQ(glm::quat(0.0f, 1.0f, 0.0f, 0.0f), transform.rotation);

    // Untouched by a delta that does not mention it
    EXPECT_EQ(2.0f, mirror.registry.get<TransformComponent>(client.getEntityByNetworkId(11)).position.x);
}

TEST_F(ClientNetworkManagerTest, EmptySyncChangesNothing) {
    world mirror;
    client.applyServerMessage(mirror, SyncMessage{});
    EXPECT_EQ(0u, client.getMirroredEntityCount());
}

TEST_F(ClientNetworkManagerTest, EntityDestroyedLocallyIsRecreated) {
    world mirror;
    client.applyServerMessage(mirror, SyncMessage{ { makeState(3, 1.0f) } });
    mirror.registry.destroy(client.getEntityByNetworkId(3));

    client.applyServerMessage(mirror, SyncMessage{ { makeState(3, 4.0f) } });

    entt::entity recreated = client.getEntityByNetworkId(3);
    ASSERT_TRUE(mirror.registry.valid(recreated));
    EXPECT_EQ(4.0f, mirror.registry.get<TransformComponent>(recreated).position.x);
}

TEST_F(ClientNetworkManagerTest, LoadLevelGoesToCallback) {
    world mirror;
    std::string loaded;
    client.setOnLoadLevel([&loaded](const std::string& path) { loaded = path; });

    client.applyServerMessage(mirror, LoadLevelMessage{ "data/scenes/scene.rgs" });

    EXPECT_EQ("data/scenes/scene.rgs", loaded);
    EXPECT_EQ(0u, client.getMirroredEntityCount());
}

TEST_F(ClientNetworkManagerTest, NewLinkForgetsMirroredIds) {
    world mirror;
    connect();
    client.applyServerMessage(mirror, SyncMessage{ { makeState(1, 1.0f) } });
    entt::entity old_entity = client.getEntityByNetworkId(1);
    client.disconnect();

    // A restarted server numbers its entities from 1 again
    FakePeer restarted;
    ASSERT_EQ(NetError::None, client.connectToServer(restarted.createStream("server:10000")));
    EXPECT_EQ(0u, client.getMirroredEntityCount());

    client.applyServerMessage(mirror, SyncMessage{ { makeState(1, 9.0f) } });

    entt::entity new_entity = client.getEntityByNetworkId(1);
    EXPECT_NE(old_entity, new_entity);
    EXPECT_EQ(1.0f, mirror.registry.get<TransformComponent>(old_entity).position.x);
    EXPECT_EQ(9.0f, mirror.registry.get<TransformComponent>(new_entity).position.x);
}
