#pragma once

#include "Components/Components.hpp"
#include <string>
#include <entt/entt.hpp>

namespace Tether {

// Entity store shared by the host loop and the network layer
class world
{
public:
    entt::registry registry;
    float fixed_delta;

    world() : fixed_delta(1.0f / 60.0f) {}

    entt::entity spawn(const std::string& name, const glm::vec3& position,
                       const glm::quat& rotation = glm::quat(1.0f, 0.0f, 0.0f, 0.0f))
    {
        entt::entity entity = registry.create();
        registry.emplace<TagComponent>(entity, TagComponent{ name });
        registry.emplace<TransformComponent>(entity, position, rotation);
        return entity;
    }

    void setFixedDelta(float delta)
    {
        fixed_delta = delta;
    }
};

} // namespace Tether
