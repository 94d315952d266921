#define ENET_IMPLEMENTATION
#include <enet.h>

#include "EnetTransport.hpp"
#include "Utils/Log.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <mutex>
#include <vector>

namespace Tether {

namespace {

enum class NetworkChannel : uint8_t
{
    RELIABLE_ORDERED = 0
};

constexpr size_t CHANNEL_COUNT = 1;

std::mutex s_enet_mutex;
int s_enet_users = 0;

bool acquireEnet()
{
    std::lock_guard<std::mutex> lock(s_enet_mutex);
    if (s_enet_users == 0 && enet_initialize() != 0) {
        LOG_TETHER_ERROR("Failed to initialize ENet");
        return false;
    }
    s_enet_users++;
    return true;
}

void releaseEnet()
{
    std::lock_guard<std::mutex> lock(s_enet_mutex);
    if (s_enet_users > 0 && --s_enet_users == 0) {
        enet_deinitialize();
    }
}

std::string formatAddress(const ENetAddress& address)
{
    char host[64] = {0};
    if (enet_address_get_host_ip(&address, host, sizeof(host)) != 0) {
        return "unknown:" + std::to_string(address.port);
    }

    // IPv4 peers show up as v4-mapped IPv6 addresses
    std::string text = host;
    const std::string mapped_prefix = "::ffff:";
    if (text.compare(0, mapped_prefix.size(), mapped_prefix) == 0) {
        text = text.substr(mapped_prefix.size());
    }
    return text + ":" + std::to_string(address.port);
}

// passive accepts the wildcard forms, which bind every interface
bool resolveAddress(const std::string& address, uint16_t port, bool passive,
                    ENetAddress& out, std::string& error)
{
    std::memset(&out, 0, sizeof(out));

    if (passive && (address.empty() || address == "0.0.0.0" || address == "::")) {
        out.host = ENET_HOST_ANY;
    } else if (address.empty() || enet_address_set_host(&out, address.c_str()) != 0) {
        error = "cannot resolve '" + address + "'";
        return false;
    }

    out.port = port;
    return true;
}

} // namespace

// =============================================================================
// Host and peer state
// =============================================================================

struct EnetPeerChannel
{
    ENetPeer* peer = nullptr;
    std::string peer_name;

    // Bytes received but not read yet
    std::vector<uint8_t> inbound;
    size_t inbound_offset = 0;

    // Bytes written while the handshake was still running
    std::vector<uint8_t> held_outbound;

    bool connected = false;
    bool remote_closed = false;
    bool closed_locally = false;
    bool failed = false;
    std::string last_error;
    std::chrono::steady_clock::time_point connect_deadline;

    void fail(const std::string& reason)
    {
        failed = true;
        last_error = reason;
    }

    // Drops the link to the ENet peer; the peer no longer reports events here
    void detach()
    {
        if (peer != nullptr) {
            peer->data = nullptr;
            peer = nullptr;
        }
    }
};

struct EnetHostContext
{
    ENetHost* host = nullptr;
    bool initialized = false;
    bool accepting = false;

    // Peers that completed their handshake and wait for acceptConnections
    std::vector<std::shared_ptr<EnetPeerChannel>> pending;

    EnetHostContext()
        : initialized(acquireEnet())
    {
    }

    ~EnetHostContext()
    {
        if (host != nullptr) {
            for (size_t i = 0; i < host->peerCount; ++i) {
                ENetPeer* peer = &host->peers[i];
                peer->data = nullptr;
                if (peer->state == ENET_PEER_STATE_CONNECTED) {
                    enet_peer_disconnect_now(peer, 0);
                }
            }
            enet_host_flush(host);
            enet_host_destroy(host);
        }

        if (initialized) {
            releaseEnet();
        }
    }

    EnetHostContext(const EnetHostContext&) = delete;
    EnetHostContext& operator=(const EnetHostContext&) = delete;

    // Drains every pending ENet event without blocking
    void service();

    bool sendPacket(EnetPeerChannel& channel, const uint8_t* data, size_t size);

private:
    void handleConnect(ENetEvent& event);
    void handleDisconnect(ENetEvent& event);
};

void EnetHostContext::service()
{
    if (host == nullptr) {
        return;
    }

    ENetEvent event;
    int result = 0;
    while ((result = enet_host_service(host, &event, 0)) > 0) {
        switch (event.type) {
            case ENET_EVENT_TYPE_CONNECT:
                handleConnect(event);
                break;

            case ENET_EVENT_TYPE_RECEIVE: {
                auto* channel = static_cast<EnetPeerChannel*>(event.peer->data);
                if (channel != nullptr) {
                    channel->inbound.insert(channel->inbound.end(), event.packet->data,
                                            event.packet->data + event.packet->dataLength);
                }
                enet_packet_destroy(event.packet);
                break;
            }

            case ENET_EVENT_TYPE_DISCONNECT:
            case ENET_EVENT_TYPE_DISCONNECT_TIMEOUT:
                handleDisconnect(event);
                break;

            case ENET_EVENT_TYPE_NONE:
                break;
        }
    }

    if (result < 0) {
        LOG_TETHER_WARN("ENet host service failed");
    }
}

void EnetHostContext::handleConnect(ENetEvent& event)
{
    auto* channel = static_cast<EnetPeerChannel*>(event.peer->data);

    // Our own outgoing handshake finished
    if (channel != nullptr) {
        channel->connected = true;
        if (!channel->held_outbound.empty()) {
            if (!sendPacket(*channel, channel->held_outbound.data(), channel->held_outbound.size())) {
                channel->fail("send after handshake failed");
            }
            channel->held_outbound.clear();
        }
        return;
    }

    if (!accepting) {
        enet_peer_disconnect_now(event.peer, 0);
        return;
    }

    auto accepted = std::make_shared<EnetPeerChannel>();
    accepted->peer = event.peer;
    accepted->peer_name = formatAddress(event.peer->address);
    accepted->connected = true;
    event.peer->data = accepted.get();
    pending.push_back(std::move(accepted));
}

void EnetHostContext::handleDisconnect(ENetEvent& event)
{
    auto* channel = static_cast<EnetPeerChannel*>(event.peer->data);
    if (channel == nullptr) {
        return;
    }

    if (!channel->connected) {
        channel->fail("handshake with " + channel->peer_name + " failed");
    } else if (event.type == ENET_EVENT_TYPE_DISCONNECT_TIMEOUT) {
        channel->fail("peer timed out");
    } else {
        channel->remote_closed = true;
    }
    channel->detach();
}

bool EnetHostContext::sendPacket(EnetPeerChannel& channel, const uint8_t* data, size_t size)
{
    ENetPacket* packet = enet_packet_create(data, size, ENET_PACKET_FLAG_RELIABLE);
    if (packet == nullptr) {
        channel.last_error = "enet_packet_create failed";
        return false;
    }

    if (enet_peer_send(channel.peer, static_cast<uint8_t>(NetworkChannel::RELIABLE_ORDERED), packet) != 0) {
        enet_packet_destroy(packet);
        channel.last_error = "enet_peer_send failed";
        return false;
    }

    enet_host_flush(host);
    return true;
}

// =============================================================================
// EnetStream
// =============================================================================

EnetStream::EnetStream(std::shared_ptr<EnetHostContext> host_context, std::shared_ptr<EnetPeerChannel> peer_channel)
    : context(std::move(host_context))
    , channel(std::move(peer_channel))
{
}

EnetStream::~EnetStream()
{
    close();
}

std::unique_ptr<EnetStream> EnetStream::connect(const std::string& address, uint16_t port,
                                                uint32_t timeout_ms, std::string& error)
{
    auto context = std::make_shared<EnetHostContext>();
    if (!context->initialized) {
        error = "failed to initialize ENet";
        return nullptr;
    }

    ENetAddress server_address;
    if (!resolveAddress(address, port, false, server_address, error)) {
        return nullptr;
    }

    context->host = enet_host_create(nullptr, 1, CHANNEL_COUNT, 0, 0);
    if (context->host == nullptr) {
        error = "failed to create ENet client host";
        return nullptr;
    }

    ENetPeer* peer = enet_host_connect(context->host, &server_address, CHANNEL_COUNT, 0);
    if (peer == nullptr) {
        error = "no free ENet peer for the connection";
        return nullptr;
    }

    auto channel = std::make_shared<EnetPeerChannel>();
    channel->peer = peer;
    channel->peer_name = address + ":" + std::to_string(port);
    channel->connect_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    peer->data = channel.get();

    enet_host_flush(context->host);
    return std::make_unique<EnetStream>(std::move(context), std::move(channel));
}

IoStatus EnetStream::write(const uint8_t* data, size_t size, size_t& bytes_written)
{
    bytes_written = 0;

    if (channel->failed || channel->closed_locally) {
        return IoStatus::Error;
    }
    if (channel->peer == nullptr) {
        return IoStatus::Closed;
    }

    if (!channel->connected) {
        channel->held_outbound.insert(channel->held_outbound.end(), data, data + size);
        bytes_written = size;
        return IoStatus::Ok;
    }

    if (!context->sendPacket(*channel, data, size)) {
        channel->failed = true;
        return IoStatus::Error;
    }

    bytes_written = size;
    return IoStatus::Ok;
}

IoStatus EnetStream::read(uint8_t* out, size_t max, size_t& bytes_read)
{
    bytes_read = 0;

    if (channel->closed_locally) {
        return IoStatus::Error;
    }

    context->service();

    size_t available = channel->inbound.size() - channel->inbound_offset;
    if (available > 0) {
        bytes_read = std::min(available, max);
        std::memcpy(out, channel->inbound.data() + channel->inbound_offset, bytes_read);
        channel->inbound_offset += bytes_read;
        if (channel->inbound_offset == channel->inbound.size()) {
            channel->inbound.clear();
            channel->inbound_offset = 0;
        }
        return IoStatus::Ok;
    }

    if (channel->failed) {
        return IoStatus::Error;
    }
    if (channel->remote_closed) {
        return IoStatus::Closed;
    }

    if (!channel->connected && std::chrono::steady_clock::now() >= channel->connect_deadline) {
        channel->fail("handshake with " + channel->peer_name + " timed out");
        if (channel->peer != nullptr) {
            ENetPeer* peer = channel->peer;
            channel->detach();
            enet_peer_reset(peer);
        }
        return IoStatus::Error;
    }

    return IoStatus::WouldBlock;
}

void EnetStream::close()
{
    if (channel->closed_locally) {
        return;
    }
    channel->closed_locally = true;

    ENetPeer* peer = channel->peer;
    if (peer == nullptr) {
        return;
    }
    channel->detach();

    if (channel->connected) {
        enet_peer_disconnect(peer, 0);
    } else {
        enet_peer_reset(peer);
    }
    enet_host_flush(context->host);
}

std::string EnetStream::getPeerName() const
{
    return channel->peer_name;
}

std::string EnetStream::getLastErrorMessage() const
{
    return channel->last_error;
}

// =============================================================================
// EnetListener
// =============================================================================

EnetListener::EnetListener(std::shared_ptr<EnetHostContext> host_context, uint16_t port)
    : context(std::move(host_context))
    , local_port(port)
{
}

EnetListener::~EnetListener()
{
    close();
}

std::unique_ptr<EnetListener> EnetListener::bind(const std::string& address, uint16_t port,
                                                 size_t max_peers, std::string& error)
{
    auto context = std::make_shared<EnetHostContext>();
    if (!context->initialized) {
        error = "failed to initialize ENet";
        return nullptr;
    }

    ENetAddress bind_address;
    if (!resolveAddress(address, port, true, bind_address, error)) {
        return nullptr;
    }

    size_t peer_count = std::min(std::max<size_t>(max_peers, 1), MAX_ENET_PEERS);
    context->host = enet_host_create(&bind_address, peer_count, CHANNEL_COUNT, 0, 0);
    if (context->host == nullptr) {
        error = "cannot bind " + address + ":" + std::to_string(port);
        return nullptr;
    }

    uint16_t bound_port = port;
    ENetAddress bound;
    if (enet_socket_get_address(context->host->socket, &bound) == 0) {
        bound_port = bound.port;
    }

    context->accepting = true;
    return std::make_unique<EnetListener>(std::move(context), bound_port);
}

std::vector<std::unique_ptr<IByteStream>> EnetListener::acceptConnections()
{
    std::vector<std::unique_ptr<IByteStream>> accepted;
    if (context == nullptr) {
        return accepted;
    }

    context->service();

    for (auto& channel : context->pending) {
        accepted.push_back(std::make_unique<EnetStream>(context, std::move(channel)));
    }
    context->pending.clear();
    return accepted;
}

void EnetListener::close()
{
    if (context == nullptr) {
        return;
    }

    context->accepting = false;
    for (auto& channel : context->pending) {
        if (channel->peer != nullptr) {
            ENetPeer* peer = channel->peer;
            channel->detach();
            enet_peer_disconnect_now(peer, 0);
        }
    }
    context->pending.clear();
    context.reset();
}

} // namespace Tether
