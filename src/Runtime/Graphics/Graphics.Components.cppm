module;
#include <cstdint>
#include <optional>
#include <vector>
#include <entt/entity/entity.hpp>

export module Graphics:Components;

import Core;
import :Mesh2D;

export namespace ECS::Mesh2D
{
    struct Component
    {
        Graphics::MeshHandle Mesh{};
        // Unbatchable meshes are drawn one at a time even when they share a bin.
        bool AutomaticBatching = true;
    };
}

export namespace ECS::MaterialMesh2D
{
    // Binds a material asset of type M to a 2D mesh entity.
    template <typename M>
    struct Component
    {
        Core::Assets::AssetId<M> Material{};
    };
}

export namespace ECS::Camera2D
{
    struct Component
    {
        bool IsActive = true;
        bool Hdr = false;
        uint32_t MsaaSamples = 4;
        std::optional<Graphics::Tonemapping> Tonemapping;
        Graphics::DebandDither Dither = Graphics::DebandDither::Disabled;
    };
}

export namespace ECS::VisibleEntities
{
    // Written by culling. Lists the entities a view can see this frame.
    struct Component
    {
        std::vector<entt::entity> Entities;
    };
}
