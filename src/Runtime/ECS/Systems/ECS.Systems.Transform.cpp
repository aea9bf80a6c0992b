module;
#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.Transform.Impl;
import :Systems.Transform;
import :Components.Transform;

namespace ECS::Systems::Transform
{
    uint32_t OnUpdate(entt::registry& registry)
    {
        using namespace Components::Transform;

        auto view = registry.view<Component, IsDirtyTag>();

        // Collect first; removing IsDirtyTag while iterating its own storage invalidates the view.
        std::vector<entt::entity> dirty;
        for (auto entity : view)
            dirty.push_back(entity);

        for (entt::entity entity : dirty)
        {
            const auto& local = registry.get<Component>(entity);
            registry.emplace_or_replace<WorldMatrix>(entity).Matrix = GetMatrix(local);
            registry.remove<IsDirtyTag>(entity);
        }

        return static_cast<uint32_t>(dirty.size());
    }
}
