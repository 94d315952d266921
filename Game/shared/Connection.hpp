#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "ByteStream.hpp"
#include "MessageDecoder.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkSerializer.hpp"
#include "NetworkTypes.hpp"

namespace Tether {

// Byte-level half of a connection: owns the stream, the outbound queue,
// the lifecycle state and the counters
class ConnectionBase
{
protected:
    std::unique_ptr<IByteStream> stream;
    ConnectionId connection_id;
    ConnectionState state = ConnectionState::CONNECTED;
    bool closed_by_owner = false;
    std::string peer_name;

    // Frames the stream has not accepted yet
    std::vector<uint8_t> outbound;
    size_t outbound_offset = 0;

    // Scratch space for reads
    std::vector<uint8_t> inbound_chunk;

    NetworkStats stats;

public:
    explicit ConnectionBase(std::unique_ptr<IByteStream> byte_stream);
    virtual ~ConnectionBase();

    ConnectionBase(const ConnectionBase&) = delete;
    ConnectionBase& operator=(const ConnectionBase&) = delete;

    // Writes pending outbound bytes without blocking
    NetError flush();

    // Closes the stream; later operations fail with Transport
    void close();

    ConnectionId getId() const { return connection_id; }
    ConnectionState getState() const { return state; }
    bool isOpen() const { return state == ConnectionState::CONNECTED; }
    const std::string& getPeerName() const { return peer_name; }
    const NetworkStats& getStats() const { return stats; }
    size_t getPendingOutboundBytes() const { return outbound.size() - outbound_offset; }

protected:
    // Queues a complete frame and writes as much as the stream accepts
    NetError queueFrame(const std::vector<uint8_t>& frame);

    // Appends every byte currently readable to received
    NetError readAvailable(std::vector<uint8_t>& received);

    void markFailed(ConnectionState new_state, const std::string& reason);
};

// Framed, typed channel: sends Outgoing messages and decodes Incoming ones
template<typename Outgoing, typename Incoming>
class Connection : public ConnectionBase
{
private:
    MessageDecoder<Incoming> decoder;

public:
    explicit Connection(std::unique_ptr<IByteStream> byte_stream, uint32_t max_frame_size = DEFAULT_MAX_FRAME_SIZE)
        : ConnectionBase(std::move(byte_stream))
        , decoder(max_frame_size)
    {
    }

    NetError send(const Outgoing& message) {
        if (!isOpen()) {
            stats.send_failures++;
            return NetError::Transport;
        }

        NetError result = queueFrame(NetworkSerializer::encodeFrame(message));
        if (result == NetError::None) {
            stats.messages_sent++;
        } else {
            stats.send_failures++;
        }
        return result;
    }

    // Reads what is available and hands every complete message to on_message
    // in arrival order. Messages decoded before a failure are still delivered.
    template<typename Handler>
    NetError pollIncoming(Handler&& on_message) {
        if (!isOpen()) {
            return NetError::Transport;
        }

        std::vector<uint8_t> received;
        NetError read_result = readAvailable(received);
        if (!received.empty()) {
            decoder.feed(received.data(), received.size());
        }

        NetError decode_result = decoder.drain([this, &on_message](const Incoming& message) {
            if (closed_by_owner) {
                return;  // Closed from a handler; drop what is left
            }
            stats.messages_received++;
            on_message(message);
        });

        if (decode_result != NetError::None) {
            if (isOpen()) {
                markFailed(ConnectionState::ERRORED, "malformed frame");
            }
            return decode_result;
        }

        return read_result;
    }

    size_t getBufferedInboundBytes() const { return decoder.getBufferedBytes(); }
};

// Server's connection to one client
using ClientLink = Connection<ServerMessage, ClientMessage>;

// Client's connection to the server
using ServerLink = Connection<ClientMessage, ServerMessage>;

} // namespace Tether
