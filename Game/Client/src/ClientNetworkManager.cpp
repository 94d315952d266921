#include "ClientNetworkManager.hpp"
#include "world.hpp"
#include "Components/Components.hpp"
#include "SharedComponents.hpp"
#include "EnetTransport.hpp"
#include "Utils/Log.hpp"

namespace Tether {

ClientNetworkManager::ClientNetworkManager()
{
}

ClientNetworkManager::~ClientNetworkManager()
{
    disconnect();
}

NetError ClientNetworkManager::connectToServer(const std::string& address, uint16_t port)
{
    if (isConnected()) {
        LOG_TETHER_WARN("Client already connected");
        last_error = "already connected";
        return NetError::Connect;
    }

    std::string error;
    std::unique_ptr<EnetStream> stream = EnetStream::connect(address, port, connect_timeout_ms, error);
    if (stream == nullptr) {
        last_error = error;
        LOG_TETHER_ERROR("Failed to connect to {}:{}: {}", address, port, error);
        return NetError::Connect;
    }

    return connectToServer(std::move(stream));
}

NetError ClientNetworkManager::connectToServer(std::unique_ptr<IByteStream> stream)
{
    if (isConnected()) {
        LOG_TETHER_WARN("Client already connected");
        last_error = "already connected";
        return NetError::Connect;
    }

    if (stream == nullptr) {
        last_error = "no stream";
        return NetError::Connect;
    }

    if (dispatching) {
        LOG_TETHER_WARN("Cannot reconnect from a server message handler");
        last_error = "reconnect during dispatch";
        return NetError::Connect;
    }

    if (link) {
        retired_stats += link->getStats();
    }

    // A new server numbers its entities from scratch
    if (!network_id_to_entity.empty()) {
        LOG_TETHER_TRACE("Forgetting {} mirrored entities of the previous link", network_id_to_entity.size());
        network_id_to_entity.clear();
    }

    link = std::make_unique<ServerLink>(std::move(stream), max_frame_size);
    last_error.clear();

    LOG_TETHER_INFO("Connected to server {}", link->getPeerName());
    setConnectionState(ClientState::CONNECTED);
    return NetError::None;
}

void ClientNetworkManager::disconnect()
{
    if (!isConnected()) {
        return;
    }

    if (link->flush() != NetError::None) {
        LOG_TETHER_TRACE("Pending data to the server was lost on disconnect");
    }
    link->close();
    setConnectionState(ClientState::DISCONNECTED);
}

NetError ClientNetworkManager::readMessages()
{
    if (!isConnected()) {
        return NetError::Transport;
    }

    dispatching = true;
    NetError result = link->pollIncoming([this](const ServerMessage& message) {
        if (on_server_message) {
            on_server_message(message);
        }
    });
    dispatching = false;

    if (result != NetError::None) {
        handleLinkFailure(result);
    }
    return result;
}

NetError ClientNetworkManager::send(const ClientMessage& message)
{
    if (!isConnected()) {
        return NetError::Transport;
    }

    NetError result = link->send(message);
    if (result != NetError::None) {
        handleLinkFailure(result);
    }
    return result;
}

NetError ClientNetworkManager::flush()
{
    if (!isConnected()) {
        return NetError::Transport;
    }

    NetError result = link->flush();
    if (result != NetError::None) {
        handleLinkFailure(result);
    }
    return result;
}

void ClientNetworkManager::applyServerMessage(world& mirror, const ServerMessage& message)
{
    if (const auto* sync = std::get_if<SyncMessage>(&message)) {
        applySync(mirror, *sync);
    } else if (const auto* load_level = std::get_if<LoadLevelMessage>(&message)) {
        LOG_TETHER_INFO("Server requested level '{}'", load_level->path);
        if (on_load_level) {
            on_load_level(load_level->path);
        }
    }
}

void ClientNetworkManager::applySync(world& mirror, const SyncMessage& message)
{
    for (const NodeState& state : message.entity_states) {
        if (state.id == INVALID_NETWORK_ID) {
            continue;
        }

        entt::entity entity = getEntityByNetworkId(state.id);
        if (entity == entt::null || !mirror.registry.valid(entity)) {
            entity = mirror.registry.create();
            mirror.registry.emplace<NetworkedEntity>(entity, state.id);
            mirror.registry.emplace<TransformComponent>(entity, state.position, state.rotation);
            network_id_to_entity[state.id] = entity;
            LOG_TETHER_TRACE("Mirrored entity {} created", state.id);
            continue;
        }

        auto& transform = mirror.registry.get_or_emplace<TransformComponent>(entity);
        transform.position = state.position;
        transform.rotation = state.rotation;
    }
}

entt::entity ClientNetworkManager::getEntityByNetworkId(NetworkId net_id) const
{
    auto it = network_id_to_entity.find(net_id);
    return it != network_id_to_entity.end() ? it->second : entt::null;
}

NetworkStats ClientNetworkManager::getStats() const
{
    NetworkStats total = retired_stats;
    if (link) {
        total += link->getStats();
    }
    return total;
}

void ClientNetworkManager::handleLinkFailure(NetError error)
{
    if (!isConnected()) {
        return;
    }

    last_error = netErrorToString(error);
    LOG_TETHER_WARN("Lost connection to server: {}", last_error);

    link->close();
    setConnectionState(ClientState::DISCONNECTED);

    if (on_disconnected) {
        on_disconnected();
    }
}

void ClientNetworkManager::setConnectionState(ClientState new_state)
{
    if (connection_state != new_state) {
        connection_state = new_state;

        const char* state_names[] = { "DISCONNECTED", "CONNECTED" };
        LOG_TETHER_INFO("Connection state changed: {}", state_names[static_cast<int>(new_state)]);
    }
}

} // namespace Tether
