#include <gtest/gtest.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include "RHI.Vulkan.hpp"

import Core;
import RHI;
import ECS;
import Graphics;

using namespace Graphics;
using MaterialId = Core::Assets::AssetId<ColorMaterial2D>;

namespace
{
    constexpr MeshHandle kQuadWithUv{0, 1};
    constexpr MeshHandle kQuadPlain{1, 1};

    RHI::VertexBufferLayout MakeLayout(bool withUv)
    {
        RHI::VertexBufferLayout layout;
        layout.Attributes.push_back({VertexAttributes::Position, 0, VK_FORMAT_R32G32B32_SFLOAT, 0});
        layout.ArrayStride = 12;
        if (withUv)
        {
            layout.Attributes.push_back({VertexAttributes::Uv, 1, VK_FORMAT_R32G32_SFLOAT, 12});
            layout.ArrayStride = 20;
        }
        return layout;
    }

    // One 2D world, one color material plugin and one camera that sees
    // everything spawned through Spawn().
    class Material2DQueueTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            World.GetRenderMeshes().Insert(kQuadWithUv, GpuMesh2D{
                                                            .Topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST,
                                                            .Layout = MakeLayout(true),
                                                            .VertexCount = 6,
                                                        });
            World.GetRenderMeshes().Insert(kQuadPlain, GpuMesh2D{
                                                           .Topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP,
                                                           .Layout = MakeLayout(false),
                                                           .VertexCount = 4,
                                                       });

            auto& registry = SceneData.GetRegistry();
            Camera = registry.create();
            registry.emplace<ECS::Camera2D::Component>(Camera);
            registry.emplace<ECS::VisibleEntities::Component>(Camera);

            Core::Log::SetSink([this](Core::Log::Level level, std::string_view msg) {
                if (level == Core::Log::Level::Error)
                    Errors.emplace_back(msg);
            });
        }

        void TearDown() override
        {
            Core::Log::SetSink({});
        }

        entt::entity Spawn(MaterialId material, float depth, MeshHandle mesh = kQuadWithUv, bool batching = true)
        {
            auto& registry = SceneData.GetRegistry();
            entt::entity e = SceneData.CreateEntity("sprite");
            registry.get<ECS::Components::Transform::Component>(e).Position = {0.0f, 0.0f, depth};
            registry.emplace<ECS::Mesh2D::Component>(e, mesh, batching);
            registry.emplace<ECS::MaterialMesh2D::Component<ColorMaterial2D>>(e, material);
            registry.emplace<ECS::Components::Visibility::ViewVisibility>(e, true);
            registry.get<ECS::VisibleEntities::Component>(Camera).Entities.push_back(e);
            return e;
        }

        MaterialId AddMaterial(AlphaMode2D alpha, std::optional<ImageHandle> texture = std::nullopt)
        {
            ColorMaterial2D material;
            material.Alpha = alpha;
            material.Texture = texture;
            return Materials.Add(material);
        }

        void MakeImageResident(ImageHandle image)
        {
            GpuImage gpuImage;
            gpuImage.View = Device.CreateTextureView(VK_FORMAT_R8G8B8A8_SRGB, 32, 32, "Test.Image");
            gpuImage.Sampler = Device.CreateSampler("Test.Sampler");
            World.GetRenderImages().Insert(image, gpuImage);
        }

        FrameStats RunFrame()
        {
            auto& registry = SceneData.GetRegistry();
            ECS::Systems::Transform::OnUpdate(registry);
            World.BeginFrame(registry);
            Plugin.Extract(registry);
            LastPrepare = Plugin.Prepare();
            LastQueue = Plugin.Queue();
            return World.EndFrame();
        }

        BinnedRenderPhase<Opaque2DBinKey>& Opaque() { return *World.GetOpaquePhases().Get(Camera); }
        SortedRenderPhase<Transparent2D>& Transparent() { return *World.GetTransparentPhases().Get(Camera); }

        RHI::HeadlessDevice Device;
        Render2DWorld World{Device};
        Core::Assets::AssetStore<ColorMaterial2D> Materials;
        Material2DPlugin<ColorMaterial2D> Plugin{World, Materials};
        ECS::Scene SceneData;
        entt::entity Camera = entt::null;

        PrepareStats LastPrepare;
        QueueStats LastQueue;
        std::vector<std::string> Errors;
    };
}

// -----------------------------------------------------------------------------
// Phase assignment
// -----------------------------------------------------------------------------

TEST_F(Material2DQueueTest, AlphaModeSelectsPhase)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    MaterialId blend = AddMaterial(AlphaMode2D::Blend);
    Spawn(opaque, 0.0f);
    Spawn(opaque, 1.0f);
    entt::entity glass = Spawn(blend, 2.0f);

    FrameStats stats = RunFrame();

    EXPECT_EQ(LastQueue.Opaque, 2u);
    EXPECT_EQ(LastQueue.Transparent, 1u);
    EXPECT_EQ(Opaque().ItemCount(), 2u);
    ASSERT_EQ(Transparent().Size(), 1u);
    EXPECT_EQ(Transparent().GetItems()[0].Entity, glass);
    EXPECT_EQ(stats.OpaqueItems, 2u);
    EXPECT_EQ(stats.TransparentItems, 1u);
    EXPECT_TRUE(Errors.empty());
}

TEST_F(Material2DQueueTest, SharedMaterialAndMeshShareABin)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    entt::entity a = Spawn(opaque, 0.0f);
    entt::entity b = Spawn(opaque, 0.0f);

    RunFrame();

    ASSERT_EQ(Opaque().GetBatchableKeys().size(), 1u);
    const Opaque2DBinKey& key = Opaque().GetBatchableKeys()[0];
    const std::vector<entt::entity>* bin = Opaque().GetBatchable(key);
    ASSERT_NE(bin, nullptr);
    ASSERT_EQ(bin->size(), 2u);
    EXPECT_EQ((*bin)[0], a);
    EXPECT_EQ((*bin)[1], b);
    EXPECT_EQ(key.AssetId, kQuadWithUv);
    EXPECT_EQ(key.DrawFunction, Plugin.GetOpaqueDrawFunction());
}

TEST_F(Material2DQueueTest, DisabledBatchingGoesToUnbatchableBins)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    Spawn(opaque, 0.0f, kQuadWithUv, false);

    RunFrame();

    EXPECT_TRUE(Opaque().GetBatchableKeys().empty());
    EXPECT_EQ(Opaque().GetUnbatchableKeys().size(), 1u);
}

TEST_F(Material2DQueueTest, TransparentItemsSortByDepthWithStableTies)
{
    MaterialId blend = AddMaterial(AlphaMode2D::Blend);
    entt::entity e0 = Spawn(blend, 5.0f);
    entt::entity e1 = Spawn(blend, -2.0f);
    entt::entity e2 = Spawn(blend, 0.0f);
    entt::entity e3 = Spawn(blend, -2.0f);

    RunFrame();

    auto items = Transparent().GetItems();
    ASSERT_EQ(items.size(), 4u);
    EXPECT_FLOAT_EQ(items[0].SortKey, -2.0f);
    EXPECT_FLOAT_EQ(items[1].SortKey, -2.0f);
    EXPECT_FLOAT_EQ(items[2].SortKey, 0.0f);
    EXPECT_FLOAT_EQ(items[3].SortKey, 5.0f);
    EXPECT_EQ(items[0].Entity, e1);
    EXPECT_EQ(items[1].Entity, e3);
    EXPECT_EQ(items[2].Entity, e2);
    EXPECT_EQ(items[3].Entity, e0);
    EXPECT_EQ(items[0].DrawFunction, Plugin.GetTransparentDrawFunction());
    EXPECT_EQ(items[0].Batch, (BatchRange{0, 1}));
}

// -----------------------------------------------------------------------------
// Skips and errors
// -----------------------------------------------------------------------------

TEST_F(Material2DQueueTest, NotReadyEntitiesAreSkippedSilently)
{
    MaterialId waiting = AddMaterial(AlphaMode2D::Opaque, ImageHandle{3, 1});
    MaterialId ready = AddMaterial(AlphaMode2D::Opaque);
    Spawn(waiting, 0.0f);
    Spawn(ready, 0.0f, MeshHandle{9, 1});

    RunFrame();

    EXPECT_EQ(LastPrepare.Retried, 1u);
    EXPECT_EQ(LastQueue.Skipped, 2u);
    EXPECT_EQ(LastQueue.Opaque, 0u);
    EXPECT_TRUE(Opaque().IsEmpty());
    EXPECT_TRUE(Errors.empty());
}

TEST_F(Material2DQueueTest, EntityAppearsOnceTextureIsResident)
{
    const ImageHandle image{3, 1};
    MaterialId textured = AddMaterial(AlphaMode2D::Opaque, image);
    Spawn(textured, 0.0f);

    RunFrame();
    EXPECT_EQ(LastQueue.Opaque, 0u);

    MakeImageResident(image);
    RunFrame();
    EXPECT_EQ(LastPrepare.Prepared, 1u);
    EXPECT_EQ(LastQueue.Opaque, 1u);
}

TEST_F(Material2DQueueTest, SpecializationErrorIsLoggedAndSkipped)
{
    const ImageHandle image{1, 1};
    MakeImageResident(image);
    MaterialId textured = AddMaterial(AlphaMode2D::Opaque, image);
    MaterialId plain = AddMaterial(AlphaMode2D::Opaque);
    Spawn(textured, 0.0f, kQuadPlain);
    Spawn(plain, 0.0f, kQuadPlain);

    RunFrame();

    EXPECT_EQ(LastQueue.SpecializationFailures, 1u);
    EXPECT_EQ(LastQueue.Opaque, 1u);
    ASSERT_EQ(Errors.size(), 1u);
    EXPECT_NE(Errors[0].find("Failed to specialize"), std::string::npos);
    EXPECT_NE(Errors[0].find("Vertex_Uv"), std::string::npos);
}

TEST_F(Material2DQueueTest, NoViewsMeansNothingQueued)
{
    SceneData.GetRegistry().get<ECS::Camera2D::Component>(Camera).IsActive = false;
    Spawn(AddMaterial(AlphaMode2D::Opaque), 0.0f);

    FrameStats stats = RunFrame();

    EXPECT_EQ(stats.Views, 0u);
    EXPECT_EQ(LastQueue.Opaque, 0u);
    EXPECT_EQ(World.GetOpaquePhases().Get(Camera), nullptr);
}

// -----------------------------------------------------------------------------
// Side effects and pipelines
// -----------------------------------------------------------------------------

TEST_F(Material2DQueueTest, MeshInstanceRecordsMaterialBindGroup)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    entt::entity e = Spawn(opaque, 0.0f);

    RunFrame();

    const RenderMesh2DInstance* instance = World.GetMeshInstances().Get(e);
    const PreparedMaterial2D<ColorMaterial2D>* material = Plugin.GetRenderMaterials().Get(opaque);
    ASSERT_NE(instance, nullptr);
    ASSERT_NE(material, nullptr);
    ASSERT_TRUE(instance->MaterialBindGroupId.has_value());
    EXPECT_EQ(instance->MaterialBindGroupId, material->GetBindGroupId());
    EXPECT_EQ(Opaque().GetBatchableKeys()[0].MaterialBindGroupId, material->GetBindGroupId());
}

TEST_F(Material2DQueueTest, PipelinesCompileOnceAcrossFrames)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    MaterialId blend = AddMaterial(AlphaMode2D::Blend);
    Spawn(opaque, 0.0f);
    Spawn(blend, 1.0f);

    FrameStats first = RunFrame();
    FrameStats second = RunFrame();

    EXPECT_EQ(first.PipelinesCompiled, 2u);
    EXPECT_EQ(second.PipelinesCompiled, 0u);
    EXPECT_EQ(Plugin.GetSpecializedPipelines().Size(), 2u);
    EXPECT_EQ(second.OpaqueItems, 1u);
    EXPECT_EQ(second.TransparentItems, 1u);

    const Opaque2DBinKey& key = Opaque().GetBatchableKeys()[0];
    EXPECT_TRUE(World.GetPipelineCache().GetRenderPipeline(key.Pipeline).has_value());
}

TEST_F(Material2DQueueTest, PipelinesRecompileAfterCacheClear)
{
    Spawn(AddMaterial(AlphaMode2D::Opaque), 0.0f);
    Spawn(AddMaterial(AlphaMode2D::Blend), 1.0f);
    ASSERT_EQ(RunFrame().PipelinesCompiled, 2u);

    World.GetPipelineCache().Clear();
    FrameStats stats = RunFrame();

    EXPECT_EQ(stats.PipelinesCompiled, 2u);
    ASSERT_EQ(Opaque().GetBatchableKeys().size(), 1u);
    ASSERT_EQ(Transparent().Size(), 1u);
    EXPECT_TRUE(World.GetPipelineCache().GetRenderPipeline(Opaque().GetBatchableKeys()[0].Pipeline).has_value());
    EXPECT_TRUE(World.GetPipelineCache().GetRenderPipeline(Transparent().GetItems()[0].Pipeline).has_value());
}

TEST_F(Material2DQueueTest, PipelineMatchesViewAndMaterial)
{
    auto& camera = SceneData.GetRegistry().get<ECS::Camera2D::Component>(Camera);
    camera.Hdr = true;
    camera.Tonemapping = Tonemapping::AgX;
    Spawn(AddMaterial(AlphaMode2D::Blend), 0.0f, kQuadPlain);

    RunFrame();

    ASSERT_EQ(Transparent().Size(), 1u);
    auto desc = World.GetPipelineCache().GetDescriptor(Transparent().GetItems()[0].Pipeline);
    ASSERT_TRUE(desc.has_value());

    EXPECT_EQ(desc->Fragment->Targets[0].Format, VK_FORMAT_R16G16B16A16_SFLOAT);
    EXPECT_FALSE(desc->Fragment->Stage.HasDef("TONEMAP_IN_SHADER"));
    EXPECT_EQ(desc->Multisample.Count, 4u);
    EXPECT_EQ(desc->Primitive.Topology, VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP);
    EXPECT_FALSE(desc->DepthStencil->DepthWriteEnabled);
    EXPECT_EQ(desc->Layout.size(), 3u);
}

TEST_F(Material2DQueueTest, SdrViewTonemapsInShader)
{
    SceneData.GetRegistry().get<ECS::Camera2D::Component>(Camera).Tonemapping = Tonemapping::AgX;
    Spawn(AddMaterial(AlphaMode2D::Opaque), 0.0f);

    RunFrame();

    const Opaque2DBinKey& key = Opaque().GetBatchableKeys()[0];
    auto desc = World.GetPipelineCache().GetDescriptor(key.Pipeline);
    ASSERT_TRUE(desc.has_value());
    EXPECT_TRUE(desc->Fragment->Stage.HasDef("TONEMAP_IN_SHADER"));
    EXPECT_TRUE(desc->Fragment->Stage.HasDef("TONEMAP_METHOD_AGX"));
    EXPECT_EQ(desc->Fragment->Targets[0].Format, VK_FORMAT_B8G8R8A8_SRGB);
}

TEST_F(Material2DQueueTest, RemovedMaterialStopsDrawing)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    Spawn(opaque, 0.0f);
    RunFrame();
    ASSERT_EQ(LastQueue.Opaque, 1u);

    ASSERT_TRUE(Materials.Remove(opaque));
    RunFrame();
    EXPECT_EQ(LastQueue.Opaque, 0u);
    EXPECT_EQ(LastQueue.Skipped, 1u);
    EXPECT_TRUE(Opaque().IsEmpty());
}

// -----------------------------------------------------------------------------
// Drawing
// -----------------------------------------------------------------------------

TEST_F(Material2DQueueTest, RenderViewRecordsPipelineMaterialAndMesh)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    MaterialId blend = AddMaterial(AlphaMode2D::Blend);
    Spawn(opaque, 0.0f);
    Spawn(blend, 1.0f, kQuadPlain);
    RunFrame();

    TrackedRenderPass pass;
    const PhaseRenderStats stats = World.RenderView(Camera, pass);

    EXPECT_EQ(stats.Drawn, 2u);
    EXPECT_EQ(stats.Skipped, 0u);
    EXPECT_EQ(pass.GetDrawCount(), 2u);

    // Opaque first, then the transparent item, which leaves its state bound.
    auto commands = pass.GetCommands();
    ASSERT_EQ(commands.size(), 6u);
    ASSERT_TRUE(std::holds_alternative<TrackedRenderPass::SetPipelineCommand>(commands[0]));
    const auto& opaqueGroup = std::get<TrackedRenderPass::SetBindGroupCommand>(commands[1]);
    EXPECT_EQ(opaqueGroup.Index, DrawMaterial2D<ColorMaterial2D>::MaterialBindGroupIndex);
    EXPECT_EQ(opaqueGroup.BindGroup, Plugin.GetRenderMaterials().Get(opaque)->BindGroup);
    EXPECT_EQ(std::get<TrackedRenderPass::DrawCommand>(commands[2]).VertexCount, 6u);
    EXPECT_EQ(std::get<TrackedRenderPass::DrawCommand>(commands[5]).VertexCount, 4u);

    EXPECT_EQ(pass.GetBindGroup(2), Plugin.GetRenderMaterials().Get(blend)->GetBindGroupId());
    EXPECT_EQ(pass.GetPipeline(),
              World.GetPipelineCache().GetRenderPipeline(Transparent().GetItems()[0].Pipeline));
}

TEST_F(Material2DQueueTest, DrawFunctionSucceedsForPreparedMaterial)
{
    entt::entity e = Spawn(AddMaterial(AlphaMode2D::Opaque), 0.0f);
    RunFrame();

    const DrawItem item{e, Opaque().GetBatchableKeys()[0].Pipeline, BatchRange{0, 1}};
    TrackedRenderPass pass;
    EXPECT_EQ(World.GetOpaqueDrawFunctions().Draw(Plugin.GetOpaqueDrawFunction(), item, pass),
              RenderCommandResult::Success);
    EXPECT_EQ(pass.GetDrawCount(), 1u);
    EXPECT_TRUE(pass.GetBindGroup(2).has_value());
}

TEST_F(Material2DQueueTest, DrawSkipsRemovedMaterial)
{
    MaterialId opaque = AddMaterial(AlphaMode2D::Opaque);
    entt::entity e = Spawn(opaque, 0.0f);
    RunFrame();
    const DrawItem item{e, Opaque().GetBatchableKeys()[0].Pipeline, BatchRange{0, 1}};

    // The phase item outlives its material: the prepared entry is gone after extraction.
    ASSERT_TRUE(Materials.Remove(opaque));
    Plugin.Extract(SceneData.GetRegistry());

    TrackedRenderPass pass;
    EXPECT_EQ(Plugin.Draw(item, pass), RenderCommandResult::Skip);
    EXPECT_EQ(pass.GetDrawCount(), 0u);
    EXPECT_FALSE(pass.GetBindGroup(2).has_value());
}

TEST_F(Material2DQueueTest, DrawSkipsPipelineStillCompiling)
{
    entt::entity e = Spawn(AddMaterial(AlphaMode2D::Opaque), 0.0f);
    RunFrame();

    TrackedRenderPass pass;
    EXPECT_EQ(Plugin.Draw(DrawItem{e, CachedRenderPipelineId{}, BatchRange{0, 1}}, pass), RenderCommandResult::Skip);
    EXPECT_TRUE(pass.GetCommands().empty());
}

TEST_F(Material2DQueueTest, DrawSkipsEntityWithoutMaterial)
{
    entt::entity e = Spawn(AddMaterial(AlphaMode2D::Opaque), 0.0f);
    RunFrame();
    const CachedRenderPipelineId pipeline = Opaque().GetBatchableKeys()[0].Pipeline;

    TrackedRenderPass pass;
    EXPECT_EQ(Plugin.Draw(DrawItem{e, pipeline, BatchRange{0, 1}}, pass), RenderCommandResult::Success);
    EXPECT_EQ(Plugin.Draw(DrawItem{SceneData.CreateEntity("bare"), pipeline, BatchRange{0, 1}}, pass),
              RenderCommandResult::Skip);
    EXPECT_EQ(pass.GetDrawCount(), 1u);
}
