#include "ServerNetworkManager.hpp"
#include "EnetTransport.hpp"
#include "Utils/Log.hpp"
#include <algorithm>

namespace Tether {

ServerNetworkManager::ServerNetworkManager()
{
}

ServerNetworkManager::~ServerNetworkManager()
{
    shutdown();
}

NetError ServerNetworkManager::startServer(const std::string& address, uint16_t port)
{
    if (listener != nullptr) {
        LOG_TETHER_WARN("Server already started");
        last_error = "server already started";
        return NetError::Bind;
    }

    std::string error;
    size_t max_peers = max_clients > 0 ? max_clients : MAX_ENET_PEERS;
    std::unique_ptr<EnetListener> enet_listener = EnetListener::bind(address, port, max_peers, error);
    if (enet_listener == nullptr) {
        last_error = error;
        LOG_TETHER_ERROR("Failed to bind {}:{}: {}", address, port, error);
        return NetError::Bind;
    }

    return startServer(std::move(enet_listener));
}

NetError ServerNetworkManager::startServer(std::unique_ptr<IListener> bound_listener)
{
    if (listener != nullptr) {
        LOG_TETHER_WARN("Server already started");
        last_error = "server already started";
        return NetError::Bind;
    }

    if (shutdown_pending) {
        last_error = "shutdown in progress";
        LOG_TETHER_WARN("Cannot start server while a shutdown is pending");
        return NetError::Bind;
    }

    if (bound_listener == nullptr) {
        last_error = "no listener";
        LOG_TETHER_ERROR("Cannot start server without a listener");
        return NetError::Bind;
    }

    listener = std::move(bound_listener);
    last_error.clear();

    LOG_TETHER_INFO("Server started on port {}, max clients: {}", listener->getLocalPort(),
        max_clients == 0 ? std::string("unlimited") : std::to_string(max_clients));
    return NetError::None;
}

void ServerNetworkManager::shutdown()
{
    if (listener == nullptr && connections.empty()) {
        return;
    }

    if (dispatching) {
        // A link may be polling further up the stack; release it when the pass ends
        for (auto& connection : connections) {
            flushQuietly(connection);
            connection.link->close();
        }
        if (listener != nullptr) {
            listener->close();
            listener.reset();
        }
        shutdown_pending = true;
        return;
    }

    for (auto& connection : connections) {
        flushQuietly(connection);
        retired_stats += connection.link->getStats();
        connection.link->close();
    }
    connections.clear();

    if (listener != nullptr) {
        listener->close();
        listener.reset();
    }

    entity_to_net_id.clear();
    net_id_to_entity.clear();
    sync_engine.clear();

    LOG_TETHER_INFO("Server shutdown complete");
}

void ServerNetworkManager::update()
{
    if (listener == nullptr) {
        return;
    }

    acceptConnections();
    readMessages();
    flush();
}

size_t ServerNetworkManager::acceptConnections()
{
    if (listener == nullptr) {
        return 0;
    }

    size_t accepted = 0;
    for (auto& stream : listener->acceptConnections()) {
        if (max_clients > 0 && connections.size() >= max_clients) {
            LOG_TETHER_WARN("Rejecting {}: server full ({} clients)", stream->getPeerName(), max_clients);
            stream->close();
            continue;
        }

        auto link = std::make_unique<ClientLink>(std::move(stream), max_frame_size);
        ConnectionId client_id = link->getId();
        LOG_TETHER_INFO("Client {} connected from {}", client_id, link->getPeerName());

        connections.emplace_back(std::move(link));
        accepted++;

        if (on_client_connected) {
            on_client_connected(client_id);
        }
        if (listener == nullptr) {
            break;  // Shut down from the callback
        }
    }

    return accepted;
}

void ServerNetworkManager::readMessages()
{
    bool was_dispatching = dispatching;
    dispatching = true;

    // Index loop: callbacks may accept or send, which can grow the vector
    for (size_t i = 0; i < connections.size(); ++i) {
        ClientLink* link = connections[i].link.get();
        if (!link->isOpen()) {
            continue;
        }

        ConnectionId client_id = link->getId();
        NetError result = link->pollIncoming([this, client_id](const ClientMessage& message) {
            if (on_client_message) {
                on_client_message(client_id, message);
            }
        });

        if (result == NetError::Decode) {
            LOG_TETHER_WARN("Client {} sent a malformed frame, dropping it", client_id);
        }
    }

    endDispatch(was_dispatching);
}

size_t ServerNetworkManager::broadcast(const ServerMessage& message)
{
    size_t failures = 0;
    for (size_t i = 0; i < connections.size(); ++i) {
        ClientLink* link = connections[i].link.get();
        if (link->send(message) != NetError::None) {
            LOG_TETHER_TRACE("Failed to send {} to client {}", messageName(message), link->getId());
            failures++;
        }
    }

    removeFailedConnections();
    return failures;
}

NetError ServerNetworkManager::sendToClient(ConnectionId client_id, const ServerMessage& message)
{
    ClientConnection* connection = findConnection(client_id);
    if (connection == nullptr) {
        LOG_TETHER_WARN("sendToClient: no client with id {}", client_id);
        return NetError::Transport;
    }

    NetError result = connection->link->send(message);
    removeFailedConnections();
    return result;
}

void ServerNetworkManager::flush()
{
    for (auto& connection : connections) {
        if (connection.link->isOpen()) {
            flushQuietly(connection);
        }
    }
    removeFailedConnections();
}

void ServerNetworkManager::sync(const entt::registry& registry)
{
    SyncMessage full = sync_engine.buildFullSync(registry);
    sendSync(full, &full);
}

void ServerNetworkManager::syncWithDeltaCompression(const entt::registry& registry)
{
    DeltaSync delta = sync_engine.computeDelta(registry);

    // Disconnect callbacks may unregister entities; they run after the commit
    bool was_dispatching = dispatching;
    dispatching = true;

    bool any_awaiting = std::any_of(connections.begin(), connections.end(),
        [](const ClientConnection& connection) { return connection.awaiting_full_snapshot; });

    if (any_awaiting) {
        SyncMessage full = sync_engine.buildFullSync(registry);
        sendSync(delta.message, &full);
    } else {
        sendSync(delta.message, nullptr);
    }

    sync_engine.commit(delta);
    endDispatch(was_dispatching);
}

void ServerNetworkManager::requestFullSnapshot()
{
    for (auto& connection : connections) {
        connection.awaiting_full_snapshot = true;
    }
}

void ServerNetworkManager::sendSync(const SyncMessage& delta, const SyncMessage* full)
{
    size_t failures = 0;
    for (size_t i = 0; i < connections.size(); ++i) {
        ClientConnection& connection = connections[i];
        bool send_full = full != nullptr && (connection.awaiting_full_snapshot || full == &delta);
        const SyncMessage& message = send_full ? *full : delta;

        if (connection.link->send(ServerMessage(message)) == NetError::None) {
            if (send_full) {
                connection.awaiting_full_snapshot = false;
            }
        } else {
            failures++;
        }
    }

    if (failures > 0) {
        LOG_TETHER_TRACE("Sync failed for {} of {} clients", failures, connections.size());
    }
    removeFailedConnections();
}

NetworkId ServerNetworkManager::registerEntity(entt::entity entity)
{
    auto it = entity_to_net_id.find(entity);
    if (it != entity_to_net_id.end()) {
        return it->second;
    }

    NetworkId net_id = next_network_id++;
    entity_to_net_id[entity] = net_id;
    net_id_to_entity[net_id] = entity;
    return net_id;
}

void ServerNetworkManager::unregisterEntity(entt::entity entity)
{
    auto it = entity_to_net_id.find(entity);
    if (it != entity_to_net_id.end()) {
        NetworkId net_id = it->second;
        net_id_to_entity.erase(net_id);
        entity_to_net_id.erase(it);
        sync_engine.forget(net_id);
    }
}

entt::entity ServerNetworkManager::getEntityByNetworkId(NetworkId net_id) const
{
    auto it = net_id_to_entity.find(net_id);
    return it != net_id_to_entity.end() ? it->second : entt::null;
}

NetworkId ServerNetworkManager::getNetworkIdByEntity(entt::entity entity) const
{
    auto it = entity_to_net_id.find(entity);
    return it != entity_to_net_id.end() ? it->second : INVALID_NETWORK_ID;
}

std::vector<ConnectionId> ServerNetworkManager::getClientIds() const
{
    std::vector<ConnectionId> ids;
    ids.reserve(connections.size());
    for (const auto& connection : connections) {
        ids.push_back(connection.link->getId());
    }
    return ids;
}

bool ServerNetworkManager::isAwaitingFullSnapshot(ConnectionId client_id) const
{
    const ClientConnection* connection = findConnection(client_id);
    return connection != nullptr && connection->awaiting_full_snapshot;
}

NetworkStats ServerNetworkManager::getStats() const
{
    NetworkStats total = retired_stats;
    for (const auto& connection : connections) {
        total += connection.link->getStats();
    }
    return total;
}

ClientConnection* ServerNetworkManager::findConnection(ConnectionId client_id)
{
    for (auto& connection : connections) {
        if (connection.link->getId() == client_id) {
            return &connection;
        }
    }
    return nullptr;
}

const ClientConnection* ServerNetworkManager::findConnection(ConnectionId client_id) const
{
    for (const auto& connection : connections) {
        if (connection.link->getId() == client_id) {
            return &connection;
        }
    }
    return nullptr;
}

void ServerNetworkManager::flushQuietly(ClientConnection& connection)
{
    if (connection.link->flush() != NetError::None) {
        LOG_TETHER_TRACE("Flush failed for client {}", connection.link->getId());
    }
}

void ServerNetworkManager::endDispatch(bool was_dispatching)
{
    dispatching = was_dispatching;
    if (dispatching) {
        return;
    }

    if (shutdown_pending) {
        shutdown_pending = false;
        shutdown();
        return;
    }
    removeFailedConnections();
}

void ServerNetworkManager::removeFailedConnections()
{
    if (dispatching) {
        return;
    }

    std::vector<ConnectionId> removed;
    auto first_failed = std::stable_partition(connections.begin(), connections.end(),
        [](const ClientConnection& connection) { return connection.link->isOpen(); });

    for (auto it = first_failed; it != connections.end(); ++it) {
        removed.push_back(it->link->getId());
        retired_stats += it->link->getStats();
    }
    connections.erase(first_failed, connections.end());

    for (ConnectionId client_id : removed) {
        LOG_TETHER_INFO("Client {} disconnected", client_id);
        if (on_client_disconnected) {
            on_client_disconnected(client_id);
        }
    }
}

} // namespace Tether
