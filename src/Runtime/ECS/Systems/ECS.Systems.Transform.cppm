module;
#include <cstdint>
#include <entt/fwd.hpp>

export module ECS:Systems.Transform;

export namespace ECS::Systems::Transform
{
    // Recomputes WorldMatrix for every entity tagged IsDirtyTag, then clears the tag.
    // Returns the number of matrices written.
    uint32_t OnUpdate(entt::registry& registry);
}
