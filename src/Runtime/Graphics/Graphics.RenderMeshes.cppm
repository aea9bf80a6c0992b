module;
#include "RHI.Vulkan.hpp"
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <utility>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

export module Graphics:RenderMeshes;

import Core;
import RHI;
import :Mesh2D;

export namespace Graphics
{
    // Render-side view of an uploaded mesh. Only what pipeline selection needs.
    struct GpuMesh2D
    {
        VkPrimitiveTopology Topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        RHI::VertexBufferLayout Layout;
        uint32_t VertexCount = 0;
        RHI::BufferHandle VertexBuffer{};
    };

    class RenderMeshes
    {
    public:
        void Insert(MeshHandle mesh, GpuMesh2D gpuMesh) { m_Meshes.insert_or_assign(mesh, std::move(gpuMesh)); }
        void Remove(MeshHandle mesh) { m_Meshes.erase(mesh); }

        [[nodiscard]] const GpuMesh2D* Get(MeshHandle mesh) const
        {
            auto it = m_Meshes.find(mesh);
            return it != m_Meshes.end() ? &it->second : nullptr;
        }

        [[nodiscard]] size_t Size() const { return m_Meshes.size(); }

    private:
        std::unordered_map<MeshHandle, GpuMesh2D> m_Meshes;
    };

    // Per-entity mesh data extracted for the current frame.
    struct RenderMesh2DInstance
    {
        glm::mat4 WorldFromLocal{1.0f};
        MeshHandle MeshAssetId{};
        bool AutomaticBatching = true;
        // Filled in by material queuing; identifies the bind group the entity draws with.
        std::optional<RHI::BindGroupHandle> MaterialBindGroupId;

        [[nodiscard]] float GetSortDepth() const { return WorldFromLocal[3][2]; }
    };

    class RenderMesh2DInstances
    {
    public:
        void Insert(entt::entity entity, const RenderMesh2DInstance& instance)
        {
            m_Instances.insert_or_assign(entity, instance);
        }

        [[nodiscard]] RenderMesh2DInstance* GetMut(entt::entity entity)
        {
            auto it = m_Instances.find(entity);
            return it != m_Instances.end() ? &it->second : nullptr;
        }

        [[nodiscard]] const RenderMesh2DInstance* Get(entt::entity entity) const
        {
            auto it = m_Instances.find(entity);
            return it != m_Instances.end() ? &it->second : nullptr;
        }

        void Clear() { m_Instances.clear(); }
        [[nodiscard]] size_t Size() const { return m_Instances.size(); }

    private:
        std::unordered_map<entt::entity, RenderMesh2DInstance> m_Instances;
    };

    // Rebuilds `instances` from every visible entity carrying a 2D mesh.
    // Returns the number of instances extracted.
    uint32_t ExtractMesh2DInstances(const entt::registry& registry, RenderMesh2DInstances& instances);
}
