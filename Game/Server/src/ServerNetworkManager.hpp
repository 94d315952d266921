#pragma once

#include <cstdint>
#include <vector>
#include <memory>
#include <string>
#include <unordered_map>
#include <functional>
#include "ByteStream.hpp"
#include "Connection.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkTypes.hpp"
#include "SyncEngine.hpp"
#include <entt/entt.hpp>

namespace Tether {

// Client connection tracking (server-side)
struct ClientConnection
{
    std::unique_ptr<ClientLink> link;

    // New connections get one full snapshot before switching to deltas
    bool awaiting_full_snapshot = true;

    ClientConnection() = default;
    explicit ClientConnection(std::unique_ptr<ClientLink> client_link)
        : link(std::move(client_link)) {}
};

// Server Network Manager - listener, live connections and state sync
class ServerNetworkManager
{
private:
    std::unique_ptr<IListener> listener;
    std::vector<ClientConnection> connections;  // In accept order
    SyncEngine sync_engine;

    // Stable id boundary: entt handles never leave this process
    std::unordered_map<entt::entity, NetworkId> entity_to_net_id;
    std::unordered_map<NetworkId, entt::entity> net_id_to_entity;
    NetworkId next_network_id = 1;

    uint32_t max_clients = 0;  // 0 = unlimited
    uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
    std::string last_error;

    // Set while callbacks run or a sync is in flight; removal waits until the pass ends
    bool dispatching = false;

    // shutdown() was called during a pass; links are closed but still owned
    bool shutdown_pending = false;

    // Callbacks
    std::function<void(ConnectionId)> on_client_connected;
    std::function<void(ConnectionId)> on_client_disconnected;
    std::function<void(ConnectionId, const ClientMessage&)> on_client_message;

    // Counters of connections that are gone
    NetworkStats retired_stats;

public:
    ServerNetworkManager();
    ~ServerNetworkManager();

    ServerNetworkManager(const ServerNetworkManager&) = delete;
    ServerNetworkManager& operator=(const ServerNetworkManager&) = delete;

    // Creates an ENet server host. Returns Bind on failure (see getLastErrorMessage).
    NetError startServer(const std::string& address, uint16_t port);

    // Uses an already bound listener
    NetError startServer(std::unique_ptr<IListener> bound_listener);

    void shutdown();
    bool isRunning() const { return listener != nullptr; }
    uint16_t getPort() const { return listener ? listener->getLocalPort() : 0; }

    // Per-tick step: accept, read, flush
    void update();

    // Moves newly accepted streams into the live set; returns how many joined
    size_t acceptConnections();

    // Polls every live connection and dispatches decoded client messages
    void readMessages();

    // Sends to every live connection; returns the number of failed sends
    size_t broadcast(const ServerMessage& message);

    NetError sendToClient(ConnectionId client_id, const ServerMessage& message);

    // Writes queued outbound bytes of every connection
    void flush();

    // Full snapshot of every networked entity to every connection
    void sync(const entt::registry& registry);

    // Changed entities only; connections awaiting a full snapshot get one instead
    void syncWithDeltaCompression(const entt::registry& registry);

    // Makes every live connection receive a full snapshot on the next delta sync
    void requestFullSnapshot();

    // Network entity management
    NetworkId registerEntity(entt::entity entity);
    void unregisterEntity(entt::entity entity);
    entt::entity getEntityByNetworkId(NetworkId net_id) const;
    NetworkId getNetworkIdByEntity(entt::entity entity) const;

    // Callbacks
    void setOnClientConnected(std::function<void(ConnectionId)> callback) {
        on_client_connected = std::move(callback);
    }

    void setOnClientDisconnected(std::function<void(ConnectionId)> callback) {
        on_client_disconnected = std::move(callback);
    }

    void setOnClientMessage(std::function<void(ConnectionId, const ClientMessage&)> callback) {
        on_client_message = std::move(callback);
    }

    // Limits
    void setMaxClients(uint32_t max) { max_clients = max; }
    void setMaxFrameSize(uint32_t size) { max_frame_size = size; }

    // Client management
    size_t getClientCount() const { return connections.size(); }
    std::vector<ConnectionId> getClientIds() const;
    bool isAwaitingFullSnapshot(ConnectionId client_id) const;

    // Stats
    NetworkStats getStats() const;
    const SyncEngine& getSyncEngine() const { return sync_engine; }
    const std::string& getLastErrorMessage() const { return last_error; }

private:
    ClientConnection* findConnection(ConnectionId client_id);
    const ClientConnection* findConnection(ConnectionId client_id) const;

    // Sends a Sync to each connection, picking the full or the delta payload
    void sendSync(const SyncMessage& delta, const SyncMessage* full);

    // Flush failures surface as a failed connection, removed afterwards
    void flushQuietly(ClientConnection& connection);

    // Drops closed or errored connections and fires on_client_disconnected
    // Leaves a dispatch pass; the outermost pass runs deferred work
    void endDispatch(bool was_dispatching);

    void removeFailedConnections();
};

} // namespace Tether
