#pragma once

#include "WireFormat.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkTypes.hpp"
#include <vector>
#include <type_traits>
#include <variant>

namespace Tether {

// Namespace for all serialization functions
namespace NetworkSerializer
{
    // Bytes of one NodeState on the wire: id + 3 position floats + 4 rotation floats
    constexpr size_t NODE_STATE_WIRE_SIZE = 4 + 3 * 4 + 4 * 4;

    // Serialize NodeState (used within SyncMessage)
    inline void serialize(WireWriter& writer, const NodeState& state) {
        writer.writeUInt32(state.id);
        writer.writeVector3f(state.position);
        writer.writeQuaternion(state.rotation);
    }

    inline bool deserialize(WireReader& reader, NodeState& state) {
        if (!reader.canRead(NODE_STATE_WIRE_SIZE)) {
            reader.setError();
            return false;
        }
        state.id = reader.readUInt32();
        state.position = reader.readVector3f();
        state.rotation = reader.readQuaternion();
        return !reader.hasError();
    }

    // Serialize LoadLevelMessage
    inline void serialize(WireWriter& writer, const LoadLevelMessage& msg) {
        writer.writeByte(static_cast<uint8_t>(MessageType::LOAD_LEVEL));
        writer.writeString(msg.path);
    }

    // Body only; the tag has already been consumed
    inline bool deserializeBody(WireReader& reader, LoadLevelMessage& msg) {
        return reader.readString(msg.path);
    }

    // Serialize SyncMessage
    inline void serialize(WireWriter& writer, const SyncMessage& msg) {
        writer.writeByte(static_cast<uint8_t>(MessageType::SYNC));
        writer.writeUInt32(static_cast<uint32_t>(msg.entity_states.size()));

        for (const auto& state : msg.entity_states) {
            serialize(writer, state);
        }
    }

    inline bool deserializeBody(WireReader& reader, SyncMessage& msg) {
        uint32_t count = reader.readUInt32();
        if (reader.hasError()) {
            return false;
        }

        // Reject counts the payload cannot hold before allocating for them
        if (static_cast<uint64_t>(count) * NODE_STATE_WIRE_SIZE > reader.getRemainingBytes()) {
            reader.setError();
            return false;
        }

        msg.entity_states.clear();
        msg.entity_states.reserve(count);

        for (uint32_t i = 0; i < count; i++) {
            NodeState state;
            if (!deserialize(reader, state)) {
                return false;  // Stop on first error
            }
            msg.entity_states.push_back(state);
        }

        return !reader.hasError();
    }

    // Serialize PlayerInputMessage
    inline void serialize(WireWriter& writer, const PlayerInputMessage& msg) {
        writer.writeByte(static_cast<uint8_t>(MessageType::PLAYER_INPUT));
        writer.writeBool(msg.left);
        writer.writeBool(msg.right);
    }

    inline bool deserializeBody(WireReader& reader, PlayerInputMessage& msg) {
        msg.left = reader.readBool();
        msg.right = reader.readBool();
        return !reader.hasError();
    }

    // Serialize any message of either family
    inline void serialize(WireWriter& writer, const ServerMessage& message) {
        std::visit([&writer](const auto& msg) { serialize(writer, msg); }, message);
    }

    inline void serialize(WireWriter& writer, const ClientMessage& message) {
        std::visit([&writer](const auto& msg) { serialize(writer, msg); }, message);
    }

    // Decode one ServerMessage. Unknown tags are rejected.
    inline bool deserialize(WireReader& reader, ServerMessage& message) {
        if (!reader.canRead(1)) return false;
        MessageType type = static_cast<MessageType>(reader.readByte());

        switch (type) {
            case MessageType::LOAD_LEVEL: {
                LoadLevelMessage msg;
                if (!deserializeBody(reader, msg)) return false;
                message = std::move(msg);
                return true;
            }
            case MessageType::SYNC: {
                SyncMessage msg;
                if (!deserializeBody(reader, msg)) return false;
                message = std::move(msg);
                return true;
            }
            default:
                return false;
        }
    }

    // Decode one ClientMessage. Unknown tags are rejected.
    inline bool deserialize(WireReader& reader, ClientMessage& message) {
        if (!reader.canRead(1)) return false;
        MessageType type = static_cast<MessageType>(reader.readByte());

        switch (type) {
            case MessageType::PLAYER_INPUT: {
                PlayerInputMessage msg;
                if (!deserializeBody(reader, msg)) return false;
                message = msg;
                return true;
            }
            default:
                return false;
        }
    }

    // Serialize a message into a complete frame (length header + payload)
    template<typename Message>
    std::vector<uint8_t> encodeFrame(const Message& message) {
        WireWriter payload;
        serialize(payload, message);

        WireWriter frame;
        frame.writeUInt32(static_cast<uint32_t>(payload.getSize()));
        frame.writeBytes(payload.getData(), payload.getSize());
        return frame.getBuffer();
    }

    // Decode exactly one message from a frame payload. Trailing bytes are an error.
    template<typename Message>
    bool decodePayload(const uint8_t* data, size_t size, Message& message) {
        WireReader reader(data, size);
        if (!deserialize(reader, message)) {
            return false;
        }
        return !reader.hasError() && reader.isAtEnd();
    }
}

} // namespace Tether
