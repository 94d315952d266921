#pragma once

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

namespace Tether {

// Byte-aligned writer for network serialization. Integers are little-endian,
// floats keep their IEEE-754 bit pattern.
class WireWriter
{
private:
    std::vector<uint8_t> buffer;

public:
    WireWriter() {
        buffer.reserve(256);
    }

    void writeByte(uint8_t value) {
        buffer.push_back(value);
    }

    void writeUInt32(uint32_t value) {
        for (int shift = 0; shift < 32; shift += 8) {
            buffer.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
        }
    }

    void writeFloat(float value) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(float));
        writeUInt32(bits);
    }

    void writeVector3f(const glm::vec3& v) {
        writeFloat(v.x);
        writeFloat(v.y);
        writeFloat(v.z);
    }

    // x, y, z, w order on the wire
    void writeQuaternion(const glm::quat& q) {
        writeFloat(q.x);
        writeFloat(q.y);
        writeFloat(q.z);
        writeFloat(q.w);
    }

    void writeBool(bool value) {
        writeByte(value ? 1 : 0);
    }

    void writeBytes(const uint8_t* data, size_t size) {
        buffer.insert(buffer.end(), data, data + size);
    }

    // u32 byte length followed by the raw bytes
    void writeString(const std::string& str) {
        writeUInt32(static_cast<uint32_t>(str.size()));
        writeBytes(reinterpret_cast<const uint8_t*>(str.data()), str.size());
    }

    const uint8_t* getData() const { return buffer.data(); }
    const std::vector<uint8_t>& getBuffer() const { return buffer; }
    size_t getSize() const { return buffer.size(); }
};

// Reader for WireWriter output. A read past the end returns zero and sets the
// error flag, which stays set.
class WireReader
{
private:
    const uint8_t* buffer;
    size_t buffer_size;
    size_t position = 0;
    bool error_state = false;

public:
    WireReader(const uint8_t* data, size_t size)
        : buffer(data), buffer_size(size) {}

    bool hasError() const { return error_state; }
    void setError() { error_state = true; }

    uint8_t readByte() {
        if (!canRead(1)) {
            error_state = true;
            return 0;
        }
        return buffer[position++];
    }

    uint32_t readUInt32() {
        if (!canRead(4)) {
            error_state = true;
            position = buffer_size;
            return 0;
        }
        uint32_t value = 0;
        for (int shift = 0; shift < 32; shift += 8) {
            value |= static_cast<uint32_t>(buffer[position++]) << shift;
        }
        return value;
    }

    float readFloat() {
        uint32_t bits = readUInt32();
        float result;
        std::memcpy(&result, &bits, sizeof(float));
        return result;
    }

    glm::vec3 readVector3f() {
        glm::vec3 result;
        result.x = readFloat();
        result.y = readFloat();
        result.z = readFloat();
        return result;
    }

    glm::quat readQuaternion() {
        glm::quat result;
        result.x = readFloat();
        result.y = readFloat();
        result.z = readFloat();
        result.w = readFloat();
        return result;
    }

    // Only 0 and 1 are valid; anything else flags an error
    bool readBool() {
        uint8_t value = readByte();
        if (value > 1) {
            error_state = true;
        }
        return value == 1;
    }

    bool readString(std::string& output) {
        uint32_t length = readUInt32();
        if (error_state || !canRead(length)) {
            error_state = true;
            return false;
        }
        output.assign(reinterpret_cast<const char*>(buffer + position), length);
        position += length;
        return true;
    }

    bool canRead(size_t num_bytes) const {
        return num_bytes <= buffer_size - position;
    }

    size_t getRemainingBytes() const {
        return buffer_size - position;
    }

    bool isAtEnd() const {
        return position == buffer_size;
    }
};

} // namespace Tether
