#include <cstdint>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>
#include "RHI.Vulkan.hpp"

import Core;
import RHI;
import ECS;
import Graphics;

using namespace Core;

// Headless 2D sandbox: a camera, a few quads with color materials and a
// texture that only becomes resident on the second frame.
class SandboxApp
{
public:
    SandboxApp()
        : m_World(m_Device)
        , m_ColorMaterials(m_World, m_Materials)
    {
    }

    void OnStart()
    {
        Log::Info("Sandbox Started!");

        RHI::VertexBufferLayout quadLayout;
        quadLayout.ArrayStride = 20;
        quadLayout.Attributes = {
            {Graphics::VertexAttributes::Position, 0, VK_FORMAT_R32G32B32_SFLOAT, 0},
            {Graphics::VertexAttributes::Uv, 1, VK_FORMAT_R32G32_SFLOAT, 12},
        };
        m_World.GetRenderMeshes().Insert(m_Quad, Graphics::GpuMesh2D{
                                                     .Topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP,
                                                     .Layout = quadLayout,
                                                     .VertexCount = 4,
                                                 });

        auto& registry = m_Scene.GetRegistry();
        m_Camera = registry.create();
        registry.emplace<ECS::Camera2D::Component>(m_Camera, ECS::Camera2D::Component{
                                                                 .Tonemapping = Graphics::Tonemapping::TonyMcMapface,
                                                                 .Dither = Graphics::DebandDither::Enabled,
                                                             });
        registry.emplace<ECS::VisibleEntities::Component>(m_Camera);

        Graphics::ColorMaterial2D red;
        red.Color = glm::vec4(1.0f, 0.1f, 0.1f, 1.0f);

        Graphics::ColorMaterial2D glass;
        glass.Color = glm::vec4(0.4f, 0.7f, 1.0f, 0.5f);
        glass.Alpha = Graphics::AlphaMode2D::Blend;

        Graphics::ColorMaterial2D checker;
        checker.Texture = m_Checker;

        auto redId = m_Materials.Add(red);
        auto glassId = m_Materials.Add(glass);
        auto checkerId = m_Materials.Add(checker);

        SpawnQuad("Red", {-1.0f, 0.0f, 0.0f}, redId);
        SpawnQuad("Glass A", {0.0f, 0.0f, 1.0f}, glassId);
        SpawnQuad("Glass B", {0.5f, 0.0f, 0.5f}, glassId);
        SpawnQuad("Checker", {1.0f, 0.0f, 0.0f}, checkerId);
    }

    void OnUpdate(uint32_t frame)
    {
        if (frame == 1)
        {
            // Upload of the checker texture finished.
            Graphics::GpuImage image;
            image.View = m_Device.CreateTextureView(VK_FORMAT_R8G8B8A8_SRGB, 64, 64, "Checker");
            image.Sampler = m_Device.CreateSampler("Checker.Sampler");
            image.Size = {64u, 64u};
            m_World.GetRenderImages().Insert(m_Checker, image);
        }

        auto& registry = m_Scene.GetRegistry();
        ECS::Systems::Transform::OnUpdate(registry);

        m_World.BeginFrame(registry);
        m_ColorMaterials.Extract(registry);
        const Graphics::PrepareStats prepared = m_ColorMaterials.Prepare();
        const Graphics::QueueStats queued = m_ColorMaterials.Queue();
        const Graphics::FrameStats stats = m_World.EndFrame();

        Log::Info("Frame {}: {} materials prepared ({} retrying), {} pipelines compiled, {} opaque, {} transparent, {} skipped",
                  frame, prepared.Prepared, prepared.Retried, stats.PipelinesCompiled,
                  queued.Opaque, queued.Transparent, queued.Skipped);

        if (const auto* transparent = m_World.GetTransparentPhases().Get(m_Camera))
        {
            for (const Graphics::Transparent2D& item : transparent->GetItems())
                Log::Info("  transparent entity {} at depth {}", static_cast<uint32_t>(item.Entity), item.SortKey);
        }

        Graphics::TrackedRenderPass pass;
        const Graphics::PhaseRenderStats rendered = m_World.RenderView(m_Camera, pass);
        Log::Info("  recorded {} draws ({} skipped), {} commands",
                  rendered.Drawn, rendered.Skipped, pass.GetCommands().size());
    }

private:
    void SpawnQuad(const char* name, glm::vec3 position, Assets::AssetId<Graphics::ColorMaterial2D> material)
    {
        auto& registry = m_Scene.GetRegistry();
        entt::entity e = m_Scene.CreateEntity(name);
        registry.get<ECS::Components::Transform::Component>(e).Position = position;
        registry.emplace<ECS::Mesh2D::Component>(e, m_Quad);
        registry.emplace<ECS::MaterialMesh2D::Component<Graphics::ColorMaterial2D>>(e, material);

        // No culling in the sandbox: everything is visible from the one camera.
        registry.emplace<ECS::Components::Visibility::ViewVisibility>(e, true);
        registry.get<ECS::VisibleEntities::Component>(m_Camera).Entities.push_back(e);
    }

    RHI::HeadlessDevice m_Device;
    Graphics::Render2DWorld m_World;
    Assets::AssetStore<Graphics::ColorMaterial2D> m_Materials;
    Graphics::Material2DPlugin<Graphics::ColorMaterial2D> m_ColorMaterials;
    ECS::Scene m_Scene;

    entt::entity m_Camera = entt::null;
    Graphics::MeshHandle m_Quad{0, 1};
    Graphics::ImageHandle m_Checker{0, 1};
};

int main()
{
    SandboxApp app;
    app.OnStart();
    for (uint32_t frame = 0; frame < 3; ++frame)
        app.OnUpdate(frame);
    return 0;
}
