#pragma once

#include "WireFormat.hpp"
#include "NetworkProtocol.hpp"
#include "NetworkSerializer.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Tether {

// Reassembles length-prefixed frames from an arbitrarily chunked byte stream.
// Bytes of an incomplete frame stay buffered until the rest arrives.
template<typename Message>
class MessageDecoder
{
private:
    std::vector<uint8_t> buffer;
    size_t read_offset = 0;
    uint32_t max_frame_size;
    bool failed = false;

public:
    explicit MessageDecoder(uint32_t max_frame = DEFAULT_MAX_FRAME_SIZE)
        : max_frame_size(max_frame) {}

    void feed(const uint8_t* data, size_t size) {
        buffer.insert(buffer.end(), data, data + size);
    }

    // Dispatches every complete message in arrival order. Returns Decode on the
    // first malformed frame; messages before it have already been dispatched
    // and the decoder refuses further input afterwards.
    template<typename Handler>
    NetError drain(Handler&& on_message) {
        if (failed) {
            return NetError::Decode;
        }

        while (buffer.size() - read_offset >= FRAME_HEADER_SIZE) {
            WireReader header(buffer.data() + read_offset, FRAME_HEADER_SIZE);
            uint32_t payload_size = header.readUInt32();

            if (payload_size == 0 || payload_size > max_frame_size) {
                failed = true;
                return NetError::Decode;
            }

            if (buffer.size() - read_offset - FRAME_HEADER_SIZE < payload_size) {
                break;  // Partial frame, wait for more bytes
            }

            Message message;
            const uint8_t* payload = buffer.data() + read_offset + FRAME_HEADER_SIZE;
            if (!NetworkSerializer::decodePayload(payload, payload_size, message)) {
                failed = true;
                return NetError::Decode;
            }

            read_offset += FRAME_HEADER_SIZE + payload_size;
            on_message(message);
        }

        compact();
        return NetError::None;
    }

    size_t getBufferedBytes() const {
        return buffer.size() - read_offset;
    }

    bool hasFailed() const {
        return failed;
    }

    void setMaxFrameSize(uint32_t size) {
        max_frame_size = size;
    }

    void reset() {
        buffer.clear();
        read_offset = 0;
        failed = false;
    }

private:
    void compact() {
        if (read_offset == 0) {
            return;
        }
        buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(read_offset));
        read_offset = 0;
    }
};

} // namespace Tether
