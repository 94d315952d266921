#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <functional>
#include "ByteStream.hpp"
#include "Connection.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkTypes.hpp"
#include <entt/entt.hpp>

namespace Tether {

class world;

// Client-side view of the link to the server
enum class ClientState : uint8_t
{
    DISCONNECTED = 0,
    CONNECTED = 1
};

// Client Network Manager - link to the server and the mirrored world
class ClientNetworkManager
{
private:
    std::unique_ptr<ServerLink> link;
    ClientState connection_state = ClientState::DISCONNECTED;
    uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE;
    uint32_t connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;
    std::string last_error;

    // Set while on_server_message runs; the link must not be replaced then
    bool dispatching = false;

    // Entity synchronization
    std::unordered_map<NetworkId, entt::entity> network_id_to_entity;

    // Callbacks
    std::function<void(const ServerMessage&)> on_server_message;
    std::function<void()> on_disconnected;
    std::function<void(const std::string&)> on_load_level;

    // Counters of links that are gone
    NetworkStats retired_stats;

public:
    ClientNetworkManager();
    ~ClientNetworkManager();

    ClientNetworkManager(const ClientNetworkManager&) = delete;
    ClientNetworkManager& operator=(const ClientNetworkManager&) = delete;

    // Starts the ENet handshake. Returns Connect if the address cannot be
    // resolved; a handshake that never completes fails a later readMessages.
    NetError connectToServer(const std::string& address, uint16_t port);

    // Uses an already connected stream. Mirrored ids of an earlier link are forgotten.
    NetError connectToServer(std::unique_ptr<IByteStream> stream);

    void disconnect();

    // Dispatches every complete server message to on_server_message.
    // On error the client becomes DISCONNECTED and on_disconnected fires.
    NetError readMessages();

    NetError send(const ClientMessage& message);
    NetError flush();

    // Sync: create-or-update mirrored entities by NetworkId.
    // LoadLevel: forwarded to on_load_level.
    void applyServerMessage(world& mirror, const ServerMessage& message);

    // State queries
    ClientState getConnectionState() const { return connection_state; }
    bool isConnected() const { return connection_state == ClientState::CONNECTED; }
    ConnectionId getConnectionId() const { return link ? link->getId() : INVALID_CONNECTION_ID; }

    // Entity queries
    entt::entity getEntityByNetworkId(NetworkId net_id) const;
    size_t getMirroredEntityCount() const { return network_id_to_entity.size(); }

    // Callbacks
    void setOnServerMessage(std::function<void(const ServerMessage&)> callback) {
        on_server_message = std::move(callback);
    }

    void setOnDisconnected(std::function<void()> callback) {
        on_disconnected = std::move(callback);
    }

    void setOnLoadLevel(std::function<void(const std::string&)> callback) {
        on_load_level = std::move(callback);
    }

    void setMaxFrameSize(uint32_t size) { max_frame_size = size; }
    void setConnectTimeout(uint32_t timeout_ms) { connect_timeout_ms = timeout_ms; }

    // Stats
    NetworkStats getStats() const;
    const std::string& getLastErrorMessage() const { return last_error; }

private:
    void applySync(world& mirror, const SyncMessage& message);

    // Marks the client disconnected after a link failure
    void handleLinkFailure(NetError error);

    void setConnectionState(ClientState new_state);
};

} // namespace Tether
