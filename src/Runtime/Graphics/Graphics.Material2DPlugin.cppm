module;
#include <cstddef>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>
#include <entt/entity/registry.hpp>

export module Graphics:Material2DPlugin;

import Core;
import ECS;
import RHI;
import :Components;
import :Material2D;
import :Material2DPipeline;
import :Mesh2D;
import :PipelineCache;
import :Render2DWorld;
import :RenderAssets;
import :RenderMeshes;
import :RenderPhase;
import :View2D;

export namespace Graphics
{
    struct Material2DConfig
    {
        // 0 prepares every queued material each frame.
        uint32_t MaxPreparationsPerFrame = 0;
    };

    // Entity -> material asset, rebuilt from scratch every frame.
    template <Material2D M>
    class RenderMaterial2DInstances
    {
    public:
        using Id = Core::Assets::AssetId<M>;

        void Insert(entt::entity entity, Id material) { m_Instances.insert_or_assign(entity, material); }

        [[nodiscard]] const Id* Get(entt::entity entity) const
        {
            auto it = m_Instances.find(entity);
            return it != m_Instances.end() ? &it->second : nullptr;
        }

        [[nodiscard]] bool Contains(entt::entity entity) const { return m_Instances.contains(entity); }
        [[nodiscard]] size_t Size() const { return m_Instances.size(); }
        [[nodiscard]] bool IsEmpty() const { return m_Instances.empty(); }
        void Clear() { m_Instances.clear(); }

    private:
        std::unordered_map<entt::entity, Id> m_Instances;
    };

    // Clears `instances` and records every visible entity carrying an M material.
    template <Material2D M>
    uint32_t ExtractMaterialMeshes2D(const entt::registry& registry, RenderMaterial2DInstances<M>& instances)
    {
        instances.Clear();

        uint32_t count = 0;
        auto view = registry.view<const ECS::MaterialMesh2D::Component<M>,
                                  const ECS::Components::Visibility::ViewVisibility>();
        for (auto [entity, material, visibility] : view.each())
        {
            if (!visibility.Get())
                continue;
            instances.Insert(entity, material.Material);
            ++count;
        }
        return count;
    }

    // -------------------------------------------------------------------------
    // Render commands
    // -------------------------------------------------------------------------
    // Each command binds or draws one part of an item and returns Skip when
    // the data it needs is missing. DrawMaterial2D<M> runs them in order:
    //
    //   SetItemPipeline, SetMaterial2DBindGroup<M, 2>, DrawMesh2D
    //
    // Bind groups 0 (view) and 1 (mesh) are owned by the view and mesh passes.
    // -------------------------------------------------------------------------

    // Binds the item's pipeline. Skips while it is still compiling.
    struct SetItemPipeline
    {
        static RenderCommandResult Render(const DrawItem& item, const PipelineCache& cache, TrackedRenderPass& pass)
        {
            auto pipeline = cache.GetRenderPipeline(item.Pipeline);
            if (!pipeline)
                return RenderCommandResult::Skip;
            pass.SetRenderPipeline(*pipeline);
            return RenderCommandResult::Success;
        }
    };

    // Binds the entity's prepared M material at bind group index I.
    template <Material2D M, uint32_t I>
    struct SetMaterial2DBindGroup
    {
        static RenderCommandResult Render(const DrawItem& item,
                                          const RenderMaterial2DInstances<M>& materialInstances,
                                          const RenderMaterials2D<M>& renderMaterials,
                                          TrackedRenderPass& pass)
        {
            const auto* materialId = materialInstances.Get(item.Entity);
            if (!materialId)
                return RenderCommandResult::Skip;

            const PreparedMaterial2D<M>* material = renderMaterials.Get(*materialId);
            if (!material)
                return RenderCommandResult::Skip;

            auto bindGroup = material->GetBindGroupId();
            if (!bindGroup)
                return RenderCommandResult::Skip;

            pass.SetBindGroup(I, *bindGroup);
            return RenderCommandResult::Success;
        }
    };

    struct DrawMesh2D
    {
        static RenderCommandResult Render(const DrawItem& item,
                                          const RenderMesh2DInstances& meshInstances,
                                          const RenderMeshes& renderMeshes,
                                          TrackedRenderPass& pass)
        {
            const RenderMesh2DInstance* instance = meshInstances.Get(item.Entity);
            const GpuMesh2D* mesh = instance ? renderMeshes.Get(instance->MeshAssetId) : nullptr;
            if (!mesh)
                return RenderCommandResult::Skip;
            pass.Draw(mesh->VertexBuffer, mesh->VertexCount, item.Batch);
            return RenderCommandResult::Success;
        }
    };

    // The draw function material type M registers in both 2D phases.
    template <Material2D M>
    struct DrawMaterial2D
    {
        static constexpr uint32_t MaterialBindGroupIndex = 2;

        static RenderCommandResult Render(const DrawItem& item,
                                          const PipelineCache& pipelineCache,
                                          const RenderMeshes& renderMeshes,
                                          const RenderMesh2DInstances& meshInstances,
                                          const RenderMaterial2DInstances<M>& materialInstances,
                                          const RenderMaterials2D<M>& renderMaterials,
                                          TrackedRenderPass& pass)
        {
            if (SetItemPipeline::Render(item, pipelineCache, pass) == RenderCommandResult::Skip)
                return RenderCommandResult::Skip;
            if (SetMaterial2DBindGroup<M, MaterialBindGroupIndex>::Render(item, materialInstances, renderMaterials, pass)
                == RenderCommandResult::Skip)
                return RenderCommandResult::Skip;
            return DrawMesh2D::Render(item, meshInstances, renderMeshes, pass);
        }
    };

    struct QueueStats
    {
        uint32_t Opaque = 0;
        uint32_t Transparent = 0;
        uint32_t Skipped = 0;
        uint32_t SpecializationFailures = 0;
    };

    // -------------------------------------------------------------------------
    // QueueMaterial2DMeshes
    // -------------------------------------------------------------------------
    // For every view and every visible entity with a prepared M material:
    // resolves the pipeline for (view key | topology | material bits), records
    // the material bind group on the mesh instance and adds the entity to the
    // view's opaque bins or transparent list.
    //
    // Entities whose mesh, instance or material is not ready are skipped
    // without a message; they show up once their data arrives. Specialization
    // errors are logged and the entity is skipped for this frame.
    // -------------------------------------------------------------------------
    template <Material2D M>
    QueueStats QueueMaterial2DMeshes(
        const std::vector<ExtractedView2D>& views,
        DrawFunctionId drawOpaque,
        DrawFunctionId drawTransparent,
        const Material2DPipeline<M>& materialPipeline,
        SpecializedMeshPipelines<Material2DPipeline<M>>& pipelines,
        PipelineCache& pipelineCache,
        const RenderMeshes& renderMeshes,
        const RenderMaterials2D<M>& renderMaterials,
        RenderMesh2DInstances& renderMeshInstances,
        const RenderMaterial2DInstances<M>& materialInstances,
        ViewSortedRenderPhases& transparentPhases,
        ViewBinnedRenderPhases& opaquePhases)
    {
        QueueStats stats;
        if (materialInstances.IsEmpty())
            return stats;

        for (const ExtractedView2D& view : views)
        {
            SortedRenderPhase<Transparent2D>* transparentPhase = transparentPhases.Get(view.View);
            BinnedRenderPhase<Opaque2DBinKey>* opaquePhase = opaquePhases.Get(view.View);
            if (!transparentPhase || !opaquePhase)
                continue;

            const Mesh2DPipelineKey viewKey = MakeViewKey(view);

            for (entt::entity entity : view.VisibleEntities)
            {
                const auto* materialId = materialInstances.Get(entity);
                RenderMesh2DInstance* meshInstance = renderMeshInstances.GetMut(entity);
                const PreparedMaterial2D<M>* material = materialId ? renderMaterials.Get(*materialId) : nullptr;
                const GpuMesh2D* mesh = meshInstance ? renderMeshes.Get(meshInstance->MeshAssetId) : nullptr;
                if (!materialId || !meshInstance || !material || !mesh)
                {
                    ++stats.Skipped;
                    continue;
                }

                const Mesh2DPipelineKey meshKey = viewKey
                                                | Mesh2DPipelineKey::FromPrimitiveTopology(mesh->Topology)
                                                | material->Properties.MeshPipelineKeyBits;

                auto pipelineId = pipelines.Specialize(pipelineCache, materialPipeline,
                                                       Material2DKey<M>{meshKey, material->Key}, mesh->Layout);
                if (!pipelineId)
                {
                    Core::Log::Error("[Material2D] Failed to specialize pipeline for entity {}: {} ({})",
                                     static_cast<uint32_t>(entity), pipelineId.error().Detail,
                                     Core::ErrorCodeToString(pipelineId.error().Code));
                    ++stats.SpecializationFailures;
                    continue;
                }

                meshInstance->MaterialBindGroupId = material->GetBindGroupId();

                switch (material->Properties.AlphaMode)
                {
                case AlphaMode2D::Opaque:
                    opaquePhase->Add(Opaque2DBinKey{
                                         .Pipeline = *pipelineId,
                                         .DrawFunction = drawOpaque,
                                         .AssetId = meshInstance->MeshAssetId,
                                         .MaterialBindGroupId = meshInstance->MaterialBindGroupId,
                                     },
                                     entity,
                                     MeshPhaseType(meshInstance->AutomaticBatching));
                    ++stats.Opaque;
                    break;

                case AlphaMode2D::Blend:
                    transparentPhase->Add(Transparent2D{
                        .SortKey = meshInstance->GetSortDepth() + material->Properties.DepthBias,
                        .Entity = entity,
                        .Pipeline = *pipelineId,
                        .DrawFunction = drawTransparent,
                        .Batch = {0, 1},
                        .ExtraIndex = std::nullopt,
                    });
                    ++stats.Transparent;
                    break;
                }
            }
        }

        return stats;
    }

    // -------------------------------------------------------------------------
    // Material2DPlugin<M>
    // -------------------------------------------------------------------------
    // Owns everything specific to material type M and runs its three frame
    // stages against a shared Render2DWorld.
    // -------------------------------------------------------------------------
    template <Material2D M>
    class Material2DPlugin
    {
    public:
        Material2DPlugin(Render2DWorld& world, Core::Assets::AssetStore<M>& materials, Material2DConfig config = {})
            : m_World(world)
            , m_Materials(materials)
            , m_Config(config)
            , m_Pipeline(world.GetMesh2DPipeline(), world.GetDevice(), world.GetShaders())
            , m_RenderMaterials(config.MaxPreparationsPerFrame)
            , m_DrawOpaque(world.GetOpaqueDrawFunctions().template Register<DrawMaterial2D<M>>(MakeDrawFunction()))
            , m_DrawTransparent(
                  world.GetTransparentDrawFunctions().template Register<DrawMaterial2D<M>>(MakeDrawFunction()))
        {
        }

        ~Material2DPlugin()
        {
            m_World.GetOpaqueDrawFunctions().Unbind(m_DrawOpaque);
            m_World.GetTransparentDrawFunctions().Unbind(m_DrawTransparent);
        }

        Material2DPlugin(const Material2DPlugin&) = delete;
        Material2DPlugin& operator=(const Material2DPlugin&) = delete;

        void Extract(const entt::registry& registry)
        {
            ExtractMaterialMeshes2D(registry, m_Instances);
            m_RenderMaterials.Extract(m_Materials);
        }

        PrepareStats Prepare()
        {
            Material2DPrepareParam<M> param{
                .Device = m_World.GetDevice(),
                .Images = m_World.GetRenderImages(),
                .Fallback = m_World.GetFallbackImage(),
                .Pipeline = m_Pipeline,
            };
            return m_RenderMaterials.Prepare(param);
        }

        QueueStats Queue()
        {
            return QueueMaterial2DMeshes<M>(m_World.GetViews(),
                                            m_DrawOpaque,
                                            m_DrawTransparent,
                                            m_Pipeline,
                                            m_SpecializedPipelines,
                                            m_World.GetPipelineCache(),
                                            m_World.GetRenderMeshes(),
                                            m_RenderMaterials,
                                            m_World.GetMeshInstances(),
                                            m_Instances,
                                            m_World.GetTransparentPhases(),
                                            m_World.GetOpaquePhases());
        }

        // Runs DrawMaterial2D<M> for one item against this frame's render state.
        RenderCommandResult Draw(const DrawItem& item, TrackedRenderPass& pass) const
        {
            const Render2DWorld& world = m_World;
            return DrawMaterial2D<M>::Render(item,
                                             world.GetPipelineCache(),
                                             world.GetRenderMeshes(),
                                             world.GetMeshInstances(),
                                             m_Instances,
                                             m_RenderMaterials,
                                             pass);
        }

        [[nodiscard]] const RenderMaterial2DInstances<M>& GetInstances() const { return m_Instances; }
        [[nodiscard]] const RenderMaterials2D<M>& GetRenderMaterials() const { return m_RenderMaterials; }
        [[nodiscard]] const Material2DPipeline<M>& GetPipeline() const { return m_Pipeline; }
        [[nodiscard]] const SpecializedMeshPipelines<Material2DPipeline<M>>& GetSpecializedPipelines() const
        {
            return m_SpecializedPipelines;
        }
        [[nodiscard]] DrawFunctionId GetOpaqueDrawFunction() const { return m_DrawOpaque; }
        [[nodiscard]] DrawFunctionId GetTransparentDrawFunction() const { return m_DrawTransparent; }
        [[nodiscard]] const Material2DConfig& GetConfig() const { return m_Config; }

    private:
        DrawFunctions::Function MakeDrawFunction() const
        {
            return [this](const DrawItem& item, TrackedRenderPass& pass) { return Draw(item, pass); };
        }

        Render2DWorld& m_World;
        Core::Assets::AssetStore<M>& m_Materials;
        Material2DConfig m_Config;

        Material2DPipeline<M> m_Pipeline;
        SpecializedMeshPipelines<Material2DPipeline<M>> m_SpecializedPipelines;
        RenderMaterials2D<M> m_RenderMaterials;
        RenderMaterial2DInstances<M> m_Instances;

        DrawFunctionId m_DrawOpaque;
        DrawFunctionId m_DrawTransparent;
    };
}
