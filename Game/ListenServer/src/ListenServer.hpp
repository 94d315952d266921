#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <functional>
#include "ByteStream.hpp"
#include "EnetTransport.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkTypes.hpp"
#include "ServerNetworkManager.hpp"
#include "ClientNetworkManager.hpp"
#include "world.hpp"

namespace Tether {

struct ListenServerConfig
{
    std::string address = DEFAULT_SERVER_ADDRESS;
    uint16_t port = DEFAULT_SERVER_PORT;
    uint32_t max_clients = 0;
    uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
    uint32_t sync_interval = 3;        // Ticks between syncs
    bool delta_compression = true;
    float player_speed = 5.0f;
    float fixed_delta = 1.0f / 60.0f;
    bool run_local_client = true;
    uint32_t connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;
    std::string level_path;            // Sent to joining clients when not empty

    // Reads sv_*, net_* cvars
    static ListenServerConfig fromCVars();
};

// Hosts the authoritative world and, optionally, a local client mirroring it
class ListenServer
{
private:
    ListenServerConfig config;

    world server_world;   // Authoritative
    world client_world;   // Local client mirror

    std::unique_ptr<ServerNetworkManager> server;
    std::unique_ptr<ClientNetworkManager> client;

    // Player avatar of each connection
    std::unordered_map<ConnectionId, entt::entity> player_entities;

    uint64_t tick_count = 0;

    std::function<void(const std::string&)> on_load_level;

public:
    explicit ListenServer(const ListenServerConfig& server_config = ListenServerConfig());
    ~ListenServer();

    ListenServer(const ListenServer&) = delete;
    ListenServer& operator=(const ListenServer&) = delete;

    // Binds the configured address and connects the local client if enabled
    bool initialize();

    // Starts the server half on a prepared listener
    bool host(std::unique_ptr<IListener> listener);

    // Connects the local client to an already running server
    bool joinLocal(std::unique_ptr<IByteStream> stream);

    void shutdown();

    // One host tick: accept, read both sides, periodic sync, flush
    void onTick();

    // Handlers wired to the network managers
    void onClientMessage(ConnectionId client_id, const ClientMessage& message);
    void onServerMessage(const ServerMessage& message);

    // Broadcasts LoadLevel; returns the number of failed sends
    size_t sendLevel(const std::string& path);

    // Local client input
    NetError sendInput(bool left, bool right);

    void setOnLoadLevel(std::function<void(const std::string&)> callback) {
        on_load_level = std::move(callback);
    }

    world& getServerWorld() { return server_world; }
    world& getClientWorld() { return client_world; }
    ServerNetworkManager* getServer() { return server.get(); }
    ClientNetworkManager* getClient() { return client.get(); }
    entt::entity getPlayerEntity(ConnectionId client_id) const;
    uint64_t getTickCount() const { return tick_count; }
    const ListenServerConfig& getConfig() const { return config; }

private:
    void onClientConnected(ConnectionId client_id);
    void onClientDisconnected(ConnectionId client_id);
    void syncWorld();
};

} // namespace Tether
