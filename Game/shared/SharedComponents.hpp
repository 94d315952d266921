#pragma once

#include <cstdint>
#include "NetworkTypes.hpp"

namespace Tether {

// Network component for entity replication
// Marks an entity as networked and carries its process-independent id
struct NetworkedEntity
{
    NetworkId network_id = INVALID_NETWORK_ID;   // Assigned by the server
    ConnectionId owner_connection = INVALID_CONNECTION_ID;  // 0 = server owned
    bool is_player = false;

    NetworkedEntity() = default;
    NetworkedEntity(NetworkId net_id, ConnectionId owner = INVALID_CONNECTION_ID, bool player = false)
        : network_id(net_id), owner_connection(owner), is_player(player) {}
};

} // namespace Tether
