#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace Tether {

// Outcome of a single non-blocking stream operation
enum class IoStatus : uint8_t
{
    Ok = 0,
    WouldBlock,   // Nothing can be transferred right now
    Closed,       // Peer performed an orderly shutdown
    Error         // The stream is unusable
};

// An ordered, reliable, non-blocking byte stream to one peer
class IByteStream
{
public:
    virtual ~IByteStream() = default;

    // Writes up to size bytes; bytes_written is valid when Ok is returned
    virtual IoStatus write(const uint8_t* data, size_t size, size_t& bytes_written) = 0;

    // Reads up to max bytes; bytes_read is valid when Ok is returned
    virtual IoStatus read(uint8_t* out, size_t max, size_t& bytes_read) = 0;

    virtual void close() = 0;

    // "host:port" of the remote end, for logs
    virtual std::string getPeerName() const = 0;

    // Description of the last Error status
    virtual std::string getLastErrorMessage() const = 0;
};

// Produces inbound streams without blocking
class IListener
{
public:
    virtual ~IListener() = default;

    // Streams accepted since the previous call (possibly none)
    virtual std::vector<std::unique_ptr<IByteStream>> acceptConnections() = 0;

    virtual uint16_t getLocalPort() const = 0;

    virtual void close() = 0;
};

} // namespace Tether
