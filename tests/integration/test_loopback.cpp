/**
 * @file test_loopback.cpp
 * @brief End-to-end tests over real ENet hosts on the loopback interface
 */

#include <gtest/gtest.h>

#include "ServerNetworkManager.hpp"
#include "ClientNetworkManager.hpp"
#include "ListenServer.hpp"
#include "EnetTransport.hpp"
#include "utils/TestHelpers.hpp"

#include <chrono>
#include <functional>
#include <thread>

using namespace Tether;
using namespace Tether::Test;

namespace {

// Runs step until done returns true or the deadline passes
bool pollUntil(const std::function<void()>& step, const std::function<bool()>& done,
               std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        step();
        if (done()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return done();
}

// Accepts on the server while the client drives its side of the handshake
bool connectClient(ServerNetworkManager& server, ClientNetworkManager& client) {
    if (client.connectToServer("127.0.0.1", server.getPort()) != NetError::None) {
        return false;
    }
    return pollUntil([&]() {
                         server.acceptConnections();
                         client.readMessages();
                     },
                     [&]() { return server.getClientCount() == 1; });
}

} // namespace

// =============================================================================
// Host Level
// =============================================================================

TEST(LoopbackTest, BindToEphemeralPort) {
    std::string error;
    auto listener = EnetListener::bind("127.0.0.1", 0, 8, error);
    ASSERT_NE(nullptr, listener) << error;
    EXPECT_NE(0, listener->getLocalPort());
}

TEST(LoopbackTest, BindToPortInUseFails) {
    std::string error;
    auto first = EnetListener::bind("127.0.0.1", 0, 8, error);
    ASSERT_NE(nullptr, first) << error;

    ServerNetworkManager server;
    EXPECT_EQ(NetError::Bind, server.startServer("127.0.0.1", first->getLocalPort()));
    EXPECT_FALSE(server.getLastErrorMessage().empty());
    EXPECT_FALSE(server.isRunning());
}

TEST(LoopbackTest, BindToForeignAddressFails) {
    // TEST-NET-3, never assigned to a local interface
    ServerNetworkManager server;
    EXPECT_EQ(NetError::Bind, server.startServer("203.0.113.1", 0));
}

// =============================================================================
// Client / Server Round Trip
// =============================================================================

TEST(LoopbackTest, MessagesFlowBothWays) {
    ServerNetworkManager server;
    ASSERT_EQ(NetError::None, server.startServer("127.0.0.1", 0));

    std::vector<ClientMessage> server_received;
    server.setOnClientMessage([&](ConnectionId, const ClientMessage& message) {
        server_received.push_back(message);
    });

    ClientNetworkManager client;
    std::vector<ServerMessage> client_received;
    client.setOnServerMessage([&](const ServerMessage& message) { client_received.push_back(message); });
    ASSERT_TRUE(connectClient(server, client));

    ASSERT_EQ(NetError::None, client.send(PlayerInputMessage{ true, false }));
    ASSERT_TRUE(pollUntil([&]() { server.update(); },
                          [&]() { return server_received.size() == 1; }));
    EXPECT_EQ(ClientMessage(PlayerInputMessage{ true, false }), server_received[0]);

    SyncMessage sync;
    sync.entity_states = { makeState(1, 1.0f), makeState(2, 2.0f, 3.0f, 4.0f) };
    EXPECT_EQ(0u, server.broadcast(LoadLevelMessage{ "levels/loopback" }));
    EXPECT_EQ(0u, server.broadcast(sync));

    ASSERT_TRUE(pollUntil([&]() { EXPECT_EQ(NetError::None, client.readMessages()); },
                          [&]() { return client_received.size() == 2; }));
    EXPECT_EQ(ServerMessage(LoadLevelMessage{ "levels/loopback" }), client_received[0]);
    EXPECT_EQ(ServerMessage(sync), client_received[1]);
}

TEST(LoopbackTest, LargeSyncArrivesIntact) {
    ServerNetworkManager server;
    ASSERT_EQ(NetError::None, server.startServer("127.0.0.1", 0));

    ClientNetworkManager client;
    std::vector<ServerMessage> client_received;
    client.setOnServerMessage([&](const ServerMessage& message) { client_received.push_back(message); });
    ASSERT_TRUE(connectClient(server, client));

    // Far larger than one datagram, so ENet fragments it
    SyncMessage sync;
    for (NetworkId id = 1; id <= 20000; ++id) {
        sync.entity_states.push_back(makeState(id, static_cast<float>(id)));
    }
    EXPECT_EQ(0u, server.broadcast(sync));

    ASSERT_TRUE(pollUntil([&]() {
                              server.update();
                              EXPECT_EQ(NetError::None, client.readMessages());
                          },
                          [&]() { return client_received.size() == 1; },
                          std::chrono::milliseconds(10000)));
    EXPECT_EQ(ServerMessage(sync), client_received[0]);
}

TEST(LoopbackTest, ServerSeesClientDisconnect) {
    ServerNetworkManager server;
    ASSERT_EQ(NetError::None, server.startServer("127.0.0.1", 0));

    std::vector<ConnectionId> disconnected;
    server.setOnClientDisconnected([&](ConnectionId id) { disconnected.push_back(id); });

    ClientNetworkManager client;
    ASSERT_TRUE(connectClient(server, client));

    client.disconnect();

    ASSERT_TRUE(pollUntil([&]() { server.readMessages(); },
                          [&]() { return disconnected.size() == 1; }));
    EXPECT_EQ(0u, server.getClientCount());
}

TEST(LoopbackTest, ClientSeesServerShutdown) {
    ServerNetworkManager server;
    ASSERT_EQ(NetError::None, server.startServer("127.0.0.1", 0));

    ClientNetworkManager client;
    int disconnects = 0;
    client.setOnDisconnected([&]() { disconnects++; });
    ASSERT_TRUE(connectClient(server, client));

    server.shutdown();

    NetError last_result = NetError::None;
    ASSERT_TRUE(pollUntil([&]() { last_result = client.readMessages(); },
                          [&]() { return !client.isConnected(); }));
    EXPECT_EQ(NetError::Transport, last_result);
    EXPECT_EQ(1, disconnects);
}

TEST(LoopbackTest, HandshakeWithoutServerTimesOut) {
    uint16_t unused_port = 0;
    {
        std::string error;
        auto listener = EnetListener::bind("127.0.0.1", 0, 8, error);
        ASSERT_NE(nullptr, listener) << error;
        unused_port = listener->getLocalPort();
    }

    ClientNetworkManager client;
    int disconnects = 0;
    client.setOnDisconnected([&]() { disconnects++; });
    client.setConnectTimeout(200);

    // Sent bytes are held until the handshake completes
    ASSERT_EQ(NetError::None, client.connectToServer("127.0.0.1", unused_port));
    EXPECT_EQ(NetError::None, client.send(PlayerInputMessage{ true, false }));

    NetError last_result = NetError::None;
    ASSERT_TRUE(pollUntil([&]() { last_result = client.readMessages(); },
                          [&]() { return !client.isConnected(); }));
    EXPECT_EQ(NetError::Transport, last_result);
    EXPECT_EQ(1, disconnects);
}

// =============================================================================
// Listen Server
// =============================================================================

TEST(LoopbackTest, ListenServerMirrorsItsOwnWorld) {
    ListenServerConfig config;
    config.port = 0;
    config.sync_interval = 1;
    config.run_local_client = true;

    ListenServer listen_server(config);
    ASSERT_TRUE(listen_server.initialize());

    ClientNetworkManager* client = listen_server.getClient();
    ASSERT_NE(nullptr, client);

    ASSERT_TRUE(pollUntil([&]() { listen_server.onTick(); },
                          [&]() { return client->getMirroredEntityCount() == 1; }));

    ASSERT_EQ(NetError::None, listen_server.sendInput(false, true));

    ConnectionId id = listen_server.getServer()->getClientIds().at(0);
    entt::entity server_player = listen_server.getPlayerEntity(id);
    NetworkId network_id = listen_server.getServer()->getNetworkIdByEntity(server_player);

    auto mirrored_x = [&]() {
        entt::entity mirrored = client->getEntityByNetworkId(network_id);
        return listen_server.getClientWorld().registry.get<TransformComponent>(mirrored).position.x;
    };

    ASSERT_TRUE(pollUntil([&]() { listen_server.onTick(); },
                          [&]() { return mirrored_x() > 0.0f; }));

    const float expected = config.player_speed * config.fixed_delta;
    EXPECT_FLOAT_EQ(expected, listen_server.getServerWorld().registry.get<TransformComponent>(server_player).position.x);
    EXPECT_FLOAT_EQ(expected, mirrored_x());
}
