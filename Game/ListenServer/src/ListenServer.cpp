#include "ListenServer.hpp"
#include "Console/ConVar.hpp"
#include "Components/Components.hpp"
#include "SharedComponents.hpp"
#include "EnetTransport.hpp"
#include "Utils/Log.hpp"

namespace Tether {

namespace {

constexpr float PLAYER_SPAWN_SPACING = 2.0f;

} // namespace

ListenServerConfig ListenServerConfig::fromCVars()
{
    ListenServerConfig config;
    config.address = CVAR_STRING(sv_address);
    config.port = static_cast<uint16_t>(CVAR_INT(sv_port));
    config.max_clients = static_cast<uint32_t>(CVAR_INT(sv_maxclients));
    config.max_frame_size = static_cast<uint32_t>(CVAR_INT(net_maxframesize));
    config.sync_interval = static_cast<uint32_t>(CVAR_INT(sv_syncinterval));
    config.delta_compression = CVAR_BOOL(sv_deltacompression);
    config.player_speed = CVAR_FLOAT(sv_playerspeed);
    config.run_local_client = CVAR_BOOL(sv_listen);
    config.connect_timeout_ms = static_cast<uint32_t>(CVAR_INT(net_connecttimeout));
    config.level_path = CVAR_STRING(sv_level);

    int tickrate = CVAR_INT(sv_tickrate);
    config.fixed_delta = 1.0f / static_cast<float>(tickrate > 0 ? tickrate : 60);

    if (config.sync_interval == 0) {
        config.sync_interval = 1;
    }
    return config;
}

ListenServer::ListenServer(const ListenServerConfig& server_config)
    : config(server_config)
{
    if (config.sync_interval == 0) {
        config.sync_interval = 1;
    }
    server_world.setFixedDelta(config.fixed_delta);
    client_world.setFixedDelta(config.fixed_delta);
}

ListenServer::~ListenServer()
{
    shutdown();
}

bool ListenServer::initialize()
{
    std::string error;
    size_t max_peers = config.max_clients > 0 ? config.max_clients : MAX_ENET_PEERS;
    std::unique_ptr<EnetListener> listener = EnetListener::bind(config.address, config.port, max_peers, error);
    if (listener == nullptr) {
        LOG_APP_ERROR("Failed to bind {}:{}: {}", config.address, config.port, error);
        return false;
    }

    uint16_t bound_port = listener->getLocalPort();
    if (!host(std::move(listener))) {
        return false;
    }

    if (!config.run_local_client) {
        LOG_APP_INFO("Dedicated mode, no local client");
        return true;
    }

    // A wildcard bind is reachable through loopback
    std::string local_address = config.address;
    if (local_address == "0.0.0.0" || local_address.empty()) {
        local_address = DEFAULT_SERVER_ADDRESS;
    }

    std::unique_ptr<EnetStream> stream =
        EnetStream::connect(local_address, bound_port, config.connect_timeout_ms, error);
    if (stream == nullptr) {
        LOG_APP_ERROR("Local client failed to connect to {}:{}: {}", local_address, bound_port, error);
        return false;
    }

    return joinLocal(std::move(stream));
}

bool ListenServer::host(std::unique_ptr<IListener> listener)
{
    if (server != nullptr) {
        LOG_APP_WARN("Listen server already hosting");
        return false;
    }

    server = std::make_unique<ServerNetworkManager>();
    server->setMaxClients(config.max_clients);
    server->setMaxFrameSize(config.max_frame_size);

    server->setOnClientConnected([this](ConnectionId client_id) {
        onClientConnected(client_id);
    });
    server->setOnClientDisconnected([this](ConnectionId client_id) {
        onClientDisconnected(client_id);
    });
    server->setOnClientMessage([this](ConnectionId client_id, const ClientMessage& message) {
        onClientMessage(client_id, message);
    });

    if (server->startServer(std::move(listener)) != NetError::None) {
        LOG_APP_ERROR("Failed to start server: {}", server->getLastErrorMessage());
        server.reset();
        return false;
    }

    return true;
}

bool ListenServer::joinLocal(std::unique_ptr<IByteStream> stream)
{
    if (client != nullptr && client->isConnected()) {
        LOG_APP_WARN("Local client already connected");
        return false;
    }

    client = std::make_unique<ClientNetworkManager>();
    client->setMaxFrameSize(config.max_frame_size);

    client->setOnServerMessage([this](const ServerMessage& message) {
        onServerMessage(message);
    });
    client->setOnLoadLevel([this](const std::string& path) {
        if (on_load_level) {
            on_load_level(path);
        }
    });
    client->setOnDisconnected([]() {
        LOG_APP_WARN("Local client lost its connection");
    });

    if (client->connectToServer(std::move(stream)) != NetError::None) {
        LOG_APP_ERROR("Local client failed to start: {}", client->getLastErrorMessage());
        client.reset();
        return false;
    }

    return true;
}

void ListenServer::shutdown()
{
    if (client != nullptr) {
        client->disconnect();
        client.reset();
    }

    if (server != nullptr) {
        server->shutdown();
        server.reset();
    }

    for (auto& [client_id, entity] : player_entities) {
        if (server_world.registry.valid(entity)) {
            server_world.registry.destroy(entity);
        }
    }
    player_entities.clear();
}

void ListenServer::onTick()
{
    tick_count++;

    if (server != nullptr) {
        server->acceptConnections();
        server->readMessages();
    }

    if (client != nullptr && client->isConnected()) {
        if (client->readMessages() != NetError::None) {
            LOG_APP_TRACE("Local client read failed on tick {}", tick_count);
        }
    }

    if (server != nullptr && tick_count % config.sync_interval == 0) {
        syncWorld();
    }

    if (server != nullptr) {
        server->flush();
    }

    if (client != nullptr && client->isConnected()) {
        if (client->flush() != NetError::None) {
            LOG_APP_TRACE("Local client flush failed on tick {}", tick_count);
        }
    }
}

void ListenServer::onClientMessage(ConnectionId client_id, const ClientMessage& message)
{
    const auto* input = std::get_if<PlayerInputMessage>(&message);
    if (input == nullptr) {
        return;
    }

    LOG_APP_TRACE("Client {} input: left={} right={}", client_id, input->left, input->right);

    entt::entity player_entity = getPlayerEntity(client_id);
    if (player_entity == entt::null || !server_world.registry.valid(player_entity)) {
        LOG_APP_WARN("Input from client {} without a player", client_id);
        return;
    }

    auto& registry = server_world.registry;
    if (!registry.all_of<PlayerComponent, TransformComponent>(player_entity)) {
        return;
    }

    auto& player = registry.get<PlayerComponent>(player_entity);
    auto& transform = registry.get<TransformComponent>(player_entity);

    player.moving_left = input->left;
    player.moving_right = input->right;

    float direction = 0.0f;
    if (input->left) direction -= 1.0f;
    if (input->right) direction += 1.0f;

    transform.position.x += direction * player.speed * server_world.fixed_delta;
}

void ListenServer::onServerMessage(const ServerMessage& message)
{
    LOG_APP_TRACE("Received server message: {}", messageName(message));

    if (client != nullptr) {
        client->applyServerMessage(client_world, message);
        return;
    }

    // No local mirror; only level changes are of interest
    if (const auto* load_level = std::get_if<LoadLevelMessage>(&message)) {
        if (on_load_level) {
            on_load_level(load_level->path);
        }
    }
}

size_t ListenServer::sendLevel(const std::string& path)
{
    if (server == nullptr) {
        LOG_APP_WARN("Cannot send level '{}': not hosting", path);
        return 0;
    }

    LOG_APP_INFO("Sending level '{}' to {} clients", path, server->getClientCount());
    return server->broadcast(ServerMessage(LoadLevelMessage{ path }));
}

NetError ListenServer::sendInput(bool left, bool right)
{
    if (client == nullptr) {
        return NetError::Transport;
    }
    return client->send(ClientMessage(PlayerInputMessage{ left, right }));
}

entt::entity ListenServer::getPlayerEntity(ConnectionId client_id) const
{
    auto it = player_entities.find(client_id);
    return it != player_entities.end() ? it->second : entt::null;
}

void ListenServer::onClientConnected(ConnectionId client_id)
{
    glm::vec3 spawn_pos(0.0f, 0.0f, static_cast<float>(player_entities.size()) * PLAYER_SPAWN_SPACING);

    entt::entity player_entity = server_world.spawn("player_" + std::to_string(client_id), spawn_pos);
    NetworkId network_id = server->registerEntity(player_entity);

    server_world.registry.emplace<NetworkedEntity>(player_entity, network_id, client_id, true);

    PlayerComponent player;
    player.owner_connection = client_id;
    player.speed = config.player_speed;
    server_world.registry.emplace<PlayerComponent>(player_entity, player);

    player_entities[client_id] = player_entity;

    LOG_APP_INFO("Spawned player entity (network_id={}) for client {} at position {},{},{}",
        network_id, client_id, spawn_pos.x, spawn_pos.y, spawn_pos.z);

    // Everyone learns about the new player on the next sync
    server->requestFullSnapshot();

    if (!config.level_path.empty()) {
        if (server->sendToClient(client_id, ServerMessage(LoadLevelMessage{ config.level_path })) != NetError::None) {
            LOG_APP_WARN("Failed to send level to client {}", client_id);
        }
    }
}

void ListenServer::onClientDisconnected(ConnectionId client_id)
{
    auto it = player_entities.find(client_id);
    if (it == player_entities.end()) {
        return;
    }

    entt::entity player_entity = it->second;
    player_entities.erase(it);

    if (server != nullptr) {
        server->unregisterEntity(player_entity);
    }
    if (server_world.registry.valid(player_entity)) {
        server_world.registry.destroy(player_entity);
    }

    LOG_APP_INFO("Despawned player entity for client {}", client_id);
}

void ListenServer::syncWorld()
{
    if (config.delta_compression) {
        server->syncWithDeltaCompression(server_world.registry);
    } else {
        server->sync(server_world.registry);
    }
}

} // namespace Tether
