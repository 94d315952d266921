#pragma once

#include <cstdint>
#include <string>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Tether {

// Process-independent entity identifier. Assigned by the server, 0 = invalid.
using NetworkId = uint32_t;
constexpr NetworkId INVALID_NETWORK_ID = 0;

// Process-unique identifier of a live connection, 0 = invalid
using ConnectionId = uint32_t;
constexpr ConnectionId INVALID_CONNECTION_ID = 0;

// Replication unit: one entity's transform as seen on the wire
struct NodeState
{
    NetworkId id = INVALID_NETWORK_ID;
    glm::vec3 position = glm::vec3(0.0f);
    glm::quat rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f);

    NodeState() = default;
    NodeState(NetworkId node_id, const glm::vec3& pos, const glm::quat& rot)
        : id(node_id), position(pos), rotation(rot) {}

    // Exact component-wise comparison; no epsilon, a change of one ulp is a change
    bool operator==(const NodeState& other) const {
        return id == other.id &&
               position == other.position &&
               rotation == other.rotation;
    }

    bool operator!=(const NodeState& other) const {
        return !(*this == other);
    }
};

// Failure categories of the network layer
enum class NetError : uint8_t
{
    None = 0,
    Bind,       // Listener could not bind its address
    Connect,    // Client could not reach the server
    Transport,  // Read or write failed, or the peer closed the stream
    Decode      // Malformed frame or unknown message on a healthy stream
};

inline const char* netErrorToString(NetError error)
{
    switch (error) {
        case NetError::None:      return "none";
        case NetError::Bind:      return "bind error";
        case NetError::Connect:   return "connect error";
        case NetError::Transport: return "transport error";
        case NetError::Decode:    return "decode error";
    }
    return "unknown error";
}

// Connection lifecycle
enum class ConnectionState : uint8_t
{
    CONNECTED = 0,
    CLOSED = 1,    // Peer closed the stream
    ERRORED = 2    // Read/write failure or decode error
};

// Network statistics
struct NetworkStats
{
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t send_failures = 0;

    void reset() {
        messages_sent = 0;
        messages_received = 0;
        bytes_sent = 0;
        bytes_received = 0;
        send_failures = 0;
    }

    NetworkStats& operator+=(const NetworkStats& other) {
        messages_sent += other.messages_sent;
        messages_received += other.messages_received;
        bytes_sent += other.bytes_sent;
        bytes_received += other.bytes_received;
        send_failures += other.send_failures;
        return *this;
    }
};

} // namespace Tether
