module;
#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>

export module Graphics:Render2DWorld;

import Core;
import RHI;
import :Images;
import :Mesh2DPipeline;
import :PipelineCache;
import :RenderMeshes;
import :RenderPhase;
import :ShaderLibrary;
import :View2D;

export namespace Graphics
{
    struct Render2DConfig
    {
        Mesh2DPipelineConfig Pipeline;
    };

    struct FrameStats
    {
        uint32_t Views = 0;
        uint32_t MeshInstances = 0;
        uint32_t PipelinesCompiled = 0;
        uint32_t OpaqueItems = 0;
        uint32_t TransparentItems = 0;
    };

    // -------------------------------------------------------------------------
    // Render2DWorld
    // -------------------------------------------------------------------------
    // Render-side state shared by every 2D material type: views, mesh
    // instances, the pipeline cache and the per-view phases. A frame runs as
    //
    //   world.BeginFrame(registry);      // extract views + mesh instances
    //   plugin.Extract(registry);        // for every material plugin
    //   plugin.Prepare();
    //   plugin.Queue();
    //   world.EndFrame();                // compile pipelines, sort phases
    //   world.RenderView(view, pass);    // record draws per view
    //
    // GPU meshes and images are registered by their loaders through
    // GetRenderMeshes() / GetRenderImages().
    // -------------------------------------------------------------------------
    class Render2DWorld
    {
    public:
        explicit Render2DWorld(RHI::IRenderDevice& device, Render2DConfig config = {});

        Render2DWorld(const Render2DWorld&) = delete;
        Render2DWorld& operator=(const Render2DWorld&) = delete;

        void BeginFrame(const entt::registry& registry);
        FrameStats EndFrame();

        // Records the view's opaque phase, then its sorted transparent phase,
        // through the registered draw functions. Call after EndFrame().
        PhaseRenderStats RenderView(entt::entity view, TrackedRenderPass& pass) const;

        [[nodiscard]] RHI::IRenderDevice& GetDevice() { return m_Device; }
        [[nodiscard]] ShaderLibrary& GetShaders() { return m_Shaders; }
        [[nodiscard]] RenderImages& GetRenderImages() { return m_Images; }
        [[nodiscard]] const RenderImages& GetRenderImages() const { return m_Images; }
        [[nodiscard]] const FallbackImage& GetFallbackImage() const { return m_FallbackImage; }
        [[nodiscard]] RenderMeshes& GetRenderMeshes() { return m_Meshes; }
        [[nodiscard]] const RenderMeshes& GetRenderMeshes() const { return m_Meshes; }
        [[nodiscard]] RenderMesh2DInstances& GetMeshInstances() { return m_MeshInstances; }
        [[nodiscard]] const RenderMesh2DInstances& GetMeshInstances() const { return m_MeshInstances; }
        [[nodiscard]] PipelineCache& GetPipelineCache() { return m_PipelineCache; }
        [[nodiscard]] const PipelineCache& GetPipelineCache() const { return m_PipelineCache; }
        [[nodiscard]] const Mesh2DPipeline& GetMesh2DPipeline() const { return m_Mesh2DPipeline; }
        [[nodiscard]] const std::vector<ExtractedView2D>& GetViews() const { return m_Views; }

        [[nodiscard]] DrawFunctions& GetOpaqueDrawFunctions() { return m_OpaqueDrawFunctions; }
        [[nodiscard]] DrawFunctions& GetTransparentDrawFunctions() { return m_TransparentDrawFunctions; }

        [[nodiscard]] ViewBinnedRenderPhases& GetOpaquePhases() { return m_OpaquePhases; }
        [[nodiscard]] const ViewBinnedRenderPhases& GetOpaquePhases() const { return m_OpaquePhases; }
        [[nodiscard]] ViewSortedRenderPhases& GetTransparentPhases() { return m_TransparentPhases; }
        [[nodiscard]] const ViewSortedRenderPhases& GetTransparentPhases() const { return m_TransparentPhases; }

    private:
        RHI::IRenderDevice& m_Device;
        ShaderLibrary m_Shaders;
        RenderImages m_Images;
        FallbackImage m_FallbackImage;
        RenderMeshes m_Meshes;
        RenderMesh2DInstances m_MeshInstances;
        PipelineCache m_PipelineCache;
        Mesh2DPipeline m_Mesh2DPipeline;

        std::vector<ExtractedView2D> m_Views;

        DrawFunctions m_OpaqueDrawFunctions;
        DrawFunctions m_TransparentDrawFunctions;
        ViewBinnedRenderPhases m_OpaquePhases;
        ViewSortedRenderPhases m_TransparentPhases;
    };
}
