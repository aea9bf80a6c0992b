module;
#include <cstdint>
#include <optional>
#include <entt/entity/registry.hpp>

module Graphics:RenderMeshes.Impl;
import :RenderMeshes;
import :Components;
import Core;
import ECS;

namespace Graphics
{
    uint32_t ExtractMesh2DInstances(const entt::registry& registry, RenderMesh2DInstances& instances)
    {
        instances.Clear();

        uint32_t count = 0;
        auto view = registry.view<const ECS::Mesh2D::Component,
                                  const ECS::Components::Transform::WorldMatrix,
                                  const ECS::Components::Visibility::ViewVisibility>();
        for (auto [entity, mesh, world, visibility] : view.each())
        {
            if (!visibility.Get())
                continue;

            instances.Insert(entity, RenderMesh2DInstance{
                                 .WorldFromLocal = world.Matrix,
                                 .MeshAssetId = mesh.Mesh,
                                 .AutomaticBatching = mesh.AutomaticBatching,
                                 .MaterialBindGroupId = std::nullopt,
                             });
            ++count;
        }

        Core::Log::Debug("[Mesh2D] Extracted {} mesh instances", count);
        return count;
    }
}
