module;
#include <cstdint>
#include <utility>
#include <vector>
#include <entt/entity/registry.hpp>

module Graphics:Render2DWorld.Impl;
import :Render2DWorld;
import :Images;
import :Mesh2DPipeline;
import :PipelineCache;
import :RenderMeshes;
import :RenderPhase;
import :View2D;
import Core;
import RHI;

namespace Graphics
{
    Render2DWorld::Render2DWorld(RHI::IRenderDevice& device, Render2DConfig config)
        : m_Device(device)
        , m_FallbackImage(FallbackImage::Create(device))
        , m_PipelineCache(device)
        , m_Mesh2DPipeline(device, m_Shaders, std::move(config.Pipeline))
    {
        Core::Log::Info("[Render2DWorld] Initialized");
    }

    void Render2DWorld::BeginFrame(const entt::registry& registry)
    {
        m_Views = ExtractViews2D(registry);
        ExtractMesh2DInstances(registry, m_MeshInstances);

        std::vector<entt::entity> viewEntities;
        viewEntities.reserve(m_Views.size());
        for (const ExtractedView2D& view : m_Views)
            viewEntities.push_back(view.View);

        m_OpaquePhases.PrepareForViews(viewEntities);
        m_TransparentPhases.PrepareForViews(viewEntities);
    }

    FrameStats Render2DWorld::EndFrame()
    {
        FrameStats stats;
        stats.Views = static_cast<uint32_t>(m_Views.size());
        stats.MeshInstances = static_cast<uint32_t>(m_MeshInstances.Size());
        stats.PipelinesCompiled = m_PipelineCache.ProcessQueue();

        SortPhases(m_TransparentPhases);

        m_OpaquePhases.ForEach([&](entt::entity, BinnedRenderPhase<Opaque2DBinKey>& phase) {
            stats.OpaqueItems += static_cast<uint32_t>(phase.ItemCount());
        });
        m_TransparentPhases.ForEach([&](entt::entity, SortedRenderPhase<Transparent2D>& phase) {
            stats.TransparentItems += static_cast<uint32_t>(phase.Size());
        });

        Core::Log::Debug("[Render2DWorld] Frame: {} views, {} instances, {} opaque, {} transparent",
                         stats.Views, stats.MeshInstances, stats.OpaqueItems, stats.TransparentItems);
        return stats;
    }

    PhaseRenderStats Render2DWorld::RenderView(entt::entity view, TrackedRenderPass& pass) const
    {
        PhaseRenderStats stats;
        if (const auto* opaque = m_OpaquePhases.Get(view))
        {
            const PhaseRenderStats opaqueStats = opaque->Render(pass, m_OpaqueDrawFunctions);
            stats.Drawn += opaqueStats.Drawn;
            stats.Skipped += opaqueStats.Skipped;
        }
        if (const auto* transparent = m_TransparentPhases.Get(view))
        {
            const PhaseRenderStats transparentStats = transparent->Render(pass, m_TransparentDrawFunctions);
            stats.Drawn += transparentStats.Drawn;
            stats.Skipped += transparentStats.Skipped;
        }

        if (stats.Skipped > 0)
            Core::Log::Debug("[Render2DWorld] View {}: {} drawn, {} skipped",
                             static_cast<uint32_t>(view), stats.Drawn, stats.Skipped);
        return stats;
    }
}
