#pragma once

#include <cstddef>
#include <unordered_map>
#include <vector>
#include <entt/entt.hpp>
#include "NetworkProtocol.hpp"
#include "NetworkTypes.hpp"
#include "Components/Components.hpp"

namespace Tether {

// Result of a delta pass before it is committed to the cache
struct DeltaSync
{
    SyncMessage message;                 // Entities that changed since they were last sent
    std::vector<NodeState> baselines;    // Entities seen for the first time (not sent)
};

// Builds Sync messages from the entity store.
// The cache maps a NetworkId to the state most recently sent for it.
class SyncEngine
{
private:
    std::unordered_map<NetworkId, NodeState> prev_node_states;

public:
    static NodeState captureState(NetworkId id, const TransformComponent& transform);

    // Every networked entity, in registry iteration order
    SyncMessage buildFullSync(const entt::registry& registry) const;

    // Compares the store against the cache without modifying it
    DeltaSync computeDelta(const entt::registry& registry) const;

    // Records a delta pass as sent: changed states and first-seen baselines
    void commit(const DeltaSync& delta);

    // computeDelta + commit
    SyncMessage buildDeltaSync(const entt::registry& registry);

    // Drops the cache entry of an entity that left the store
    void forget(NetworkId id);
    void clear();

    const NodeState* getCachedState(NetworkId id) const;
    size_t getCacheSize() const { return prev_node_states.size(); }
};

} // namespace Tether
