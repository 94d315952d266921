#include "Connection.hpp"
#include "Utils/Log.hpp"
#include <atomic>

namespace Tether {

namespace {

constexpr size_t READ_CHUNK_SIZE = 16 * 1024;

std::atomic<ConnectionId> s_next_connection_id{1};

} // namespace

ConnectionBase::ConnectionBase(std::unique_ptr<IByteStream> byte_stream)
    : stream(std::move(byte_stream))
    , connection_id(s_next_connection_id.fetch_add(1))
    , inbound_chunk(READ_CHUNK_SIZE)
{
    if (stream) {
        peer_name = stream->getPeerName();
    } else {
        state = ConnectionState::ERRORED;
    }
}

ConnectionBase::~ConnectionBase()
{
    close();
}

NetError ConnectionBase::flush()
{
    if (!isOpen()) {
        return NetError::Transport;
    }

    while (outbound_offset < outbound.size()) {
        size_t written = 0;
        IoStatus status = stream->write(outbound.data() + outbound_offset,
                                        outbound.size() - outbound_offset, written);

        if (status == IoStatus::WouldBlock) {
            break;  // Stream is full, keep the rest for the next flush
        }
        if (status != IoStatus::Ok) {
            markFailed(status == IoStatus::Closed ? ConnectionState::CLOSED : ConnectionState::ERRORED,
                       "write failed: " + stream->getLastErrorMessage());
            return NetError::Transport;
        }

        outbound_offset += written;
        stats.bytes_sent += written;
    }

    if (outbound_offset == outbound.size()) {
        outbound.clear();
        outbound_offset = 0;
    }
    return NetError::None;
}

void ConnectionBase::close()
{
    closed_by_owner = true;
    if (stream) {
        stream->close();
    }
    if (state == ConnectionState::CONNECTED) {
        state = ConnectionState::CLOSED;
    }
}

NetError ConnectionBase::queueFrame(const std::vector<uint8_t>& frame)
{
    outbound.insert(outbound.end(), frame.begin(), frame.end());
    return flush();
}

NetError ConnectionBase::readAvailable(std::vector<uint8_t>& received)
{
    if (!isOpen()) {
        return NetError::Transport;
    }

    while (true) {
        size_t bytes_read = 0;
        IoStatus status = stream->read(inbound_chunk.data(), inbound_chunk.size(), bytes_read);

        switch (status) {
            case IoStatus::Ok:
                received.insert(received.end(), inbound_chunk.begin(),
                                inbound_chunk.begin() + static_cast<std::ptrdiff_t>(bytes_read));
                stats.bytes_received += bytes_read;
                break;

            case IoStatus::WouldBlock:
                return NetError::None;

            case IoStatus::Closed:
                markFailed(ConnectionState::CLOSED, "closed by peer");
                return NetError::Transport;

            case IoStatus::Error:
                markFailed(ConnectionState::ERRORED, "read failed: " + stream->getLastErrorMessage());
                return NetError::Transport;
        }
    }
}

void ConnectionBase::markFailed(ConnectionState new_state, const std::string& reason)
{
    if (state != ConnectionState::CONNECTED) {
        return;
    }

    state = new_state;
    LOG_TETHER_INFO("Connection {} ({}) {}: {}", connection_id, peer_name,
        new_state == ConnectionState::CLOSED ? "closed" : "errored", reason);

    if (stream) {
        stream->close();
    }
}

} // namespace Tether
