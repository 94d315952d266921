#include "SyncEngine.hpp"
#include "SharedComponents.hpp"

namespace Tether {

NodeState SyncEngine::captureState(NetworkId id, const TransformComponent& transform)
{
    return NodeState(id, transform.position, transform.rotation);
}

SyncMessage SyncEngine::buildFullSync(const entt::registry& registry) const
{
    SyncMessage sync;
    auto view = registry.view<const NetworkedEntity, const TransformComponent>();
    sync.entity_states.reserve(view.size_hint());

    for (auto entity : view) {
        const auto& networked = view.get<const NetworkedEntity>(entity);
        if (networked.network_id == INVALID_NETWORK_ID) {
            continue;
        }
        sync.entity_states.push_back(captureState(networked.network_id, view.get<const TransformComponent>(entity)));
    }

    return sync;
}

DeltaSync SyncEngine::computeDelta(const entt::registry& registry) const
{
    DeltaSync delta;
    auto view = registry.view<const NetworkedEntity, const TransformComponent>();

    for (auto entity : view) {
        const auto& networked = view.get<const NetworkedEntity>(entity);
        if (networked.network_id == INVALID_NETWORK_ID) {
            continue;
        }

        NodeState current_state = captureState(networked.network_id, view.get<const TransformComponent>(entity));

        auto it = prev_node_states.find(current_state.id);
        if (it == prev_node_states.end()) {
            // First observation only establishes the baseline
            delta.baselines.push_back(current_state);
        } else if (it->second != current_state) {
            delta.message.entity_states.push_back(current_state);
        }
    }

    return delta;
}

void SyncEngine::commit(const DeltaSync& delta)
{
    for (const auto& state : delta.baselines) {
        prev_node_states[state.id] = state;
    }
    for (const auto& state : delta.message.entity_states) {
        prev_node_states[state.id] = state;
    }
}

SyncMessage SyncEngine::buildDeltaSync(const entt::registry& registry)
{
    DeltaSync delta = computeDelta(registry);
    commit(delta);
    return delta.message;
}

void SyncEngine::forget(NetworkId id)
{
    prev_node_states.erase(id);
}

void SyncEngine::clear()
{
    prev_node_states.clear();
}

const NodeState* SyncEngine::getCachedState(NetworkId id) const
{
    auto it = prev_node_states.find(id);
    if (it != prev_node_states.end()) {
        return &it->second;
    }
    return nullptr;
}

} // namespace Tether
