#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "NetworkTypes.hpp"

namespace Tether {

// Default endpoint of a listen server
constexpr const char* DEFAULT_SERVER_ADDRESS = "127.0.0.1";
constexpr uint32_t DEFAULT_CONNECT_TIMEOUT_MS = 5000;
constexpr uint16_t DEFAULT_SERVER_PORT = 10000;

// Frame layout: u32 little-endian payload length, then the payload
constexpr size_t FRAME_HEADER_SIZE = 4;
constexpr uint32_t DEFAULT_MAX_FRAME_SIZE = 16u * 1024u * 1024u;

// First payload byte. Server and client messages use disjoint ranges so a
// message sent in the wrong direction fails to decode.
enum class MessageType : uint8_t
{
    // Server -> Client
    LOAD_LEVEL = 1,
    SYNC = 2,

    // Client -> Server
    PLAYER_INPUT = 64
};

// Command to load a named level
struct LoadLevelMessage
{
    std::string path;

    bool operator==(const LoadLevelMessage& other) const { return path == other.path; }
    bool operator!=(const LoadLevelMessage& other) const { return !(*this == other); }
};

// Full or partial snapshot of entity transforms
struct SyncMessage
{
    std::vector<NodeState> entity_states;

    bool operator==(const SyncMessage& other) const { return entity_states == other.entity_states; }
    bool operator!=(const SyncMessage& other) const { return !(*this == other); }
};

struct PlayerInputMessage
{
    bool left = false;
    bool right = false;

    bool operator==(const PlayerInputMessage& other) const {
        return left == other.left && right == other.right;
    }
    bool operator!=(const PlayerInputMessage& other) const { return !(*this == other); }
};

// Messages sent to clients
using ServerMessage = std::variant<LoadLevelMessage, SyncMessage>;

// Messages sent to a server
using ClientMessage = std::variant<PlayerInputMessage>;

inline const char* messageName(const ServerMessage& message)
{
    return std::holds_alternative<LoadLevelMessage>(message) ? "LoadLevel" : "Sync";
}

inline const char* messageName(const ClientMessage&)
{
    return "PlayerInput";
}

} // namespace Tether
