#pragma once

#include "ByteStream.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace Tether {

// ENet host shared by a listener and the streams it produced (defined in EnetTransport.cpp)
struct EnetHostContext;

// Receive queue and handshake state of one ENet peer
struct EnetPeerChannel;

constexpr size_t MAX_ENET_PEERS = 4095;

// Byte stream over the reliable, ordered channel of one ENet peer.
// Every write becomes one reliable packet; packet boundaries carry no meaning.
class EnetStream : public IByteStream
{
private:
    std::shared_ptr<EnetHostContext> context;
    std::shared_ptr<EnetPeerChannel> channel;

public:
    EnetStream(std::shared_ptr<EnetHostContext> host_context, std::shared_ptr<EnetPeerChannel> peer_channel);
    ~EnetStream() override;

    EnetStream(const EnetStream&) = delete;
    EnetStream& operator=(const EnetStream&) = delete;

    // Starts the ENet handshake and returns at once. Bytes written before the
    // handshake completes are held and sent when it does; a handshake that
    // takes longer than timeout_ms fails the next read or write.
    // Returns nullptr and fills error if the address cannot be resolved.
    static std::unique_ptr<EnetStream> connect(const std::string& address, uint16_t port,
                                               uint32_t timeout_ms, std::string& error);

    IoStatus write(const uint8_t* data, size_t size, size_t& bytes_written) override;
    IoStatus read(uint8_t* out, size_t max, size_t& bytes_read) override;
    void close() override;

    std::string getPeerName() const override;
    std::string getLastErrorMessage() const override;
};

// ENet server host accepting peers without blocking
class EnetListener : public IListener
{
private:
    std::shared_ptr<EnetHostContext> context;
    uint16_t local_port = 0;

public:
    EnetListener(std::shared_ptr<EnetHostContext> host_context, uint16_t port);
    ~EnetListener() override;

    EnetListener(const EnetListener&) = delete;
    EnetListener& operator=(const EnetListener&) = delete;

    // Port 0 binds an ephemeral port. An empty address binds every interface.
    // Returns nullptr and fills error on failure.
    static std::unique_ptr<EnetListener> bind(const std::string& address, uint16_t port,
                                              size_t max_peers, std::string& error);

    std::vector<std::unique_ptr<IByteStream>> acceptConnections() override;
    uint16_t getLocalPort() const override { return local_port; }
    void close() override;
};

} // namespace Tether
