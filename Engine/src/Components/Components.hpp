#pragma once
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <string>
#include <entt/entt.hpp>

namespace Tether {

struct TransformComponent {
    glm::vec3 position;
    glm::quat rotation;
    glm::vec3 scale;

    TransformComponent(float x=0, float y=0, float z=0)
        : position(x,y,z), rotation(1.0f, 0.0f, 0.0f, 0.0f), scale(1,1,1) {}

    TransformComponent(const glm::vec3& pos, const glm::quat& rot)
        : position(pos), rotation(rot), scale(1,1,1) {}
};

struct TagComponent {
    std::string name;
};

// Server-side player avatar driven by PlayerInput
struct PlayerComponent {
    uint32_t owner_connection = 0;
    float speed = 5.0f;
    bool moving_left = false;
    bool moving_right = false;
};

} // namespace Tether
