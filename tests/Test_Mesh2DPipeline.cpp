#include <gtest/gtest.h>
#include <algorithm>
#include <expected>
#include <string>
#include "RHI.Vulkan.hpp"

import Core;
import RHI;
import Graphics;

using namespace Graphics;

namespace
{
    RHI::VertexBufferLayout MakeLayout(bool position, bool uv, bool color)
    {
        RHI::VertexBufferLayout layout;
        uint32_t offset = 0;
        uint32_t location = 0;
        if (position)
        {
            layout.Attributes.push_back({VertexAttributes::Position, location++, VK_FORMAT_R32G32B32_SFLOAT, offset});
            offset += 12;
        }
        if (uv)
        {
            layout.Attributes.push_back({VertexAttributes::Uv, location++, VK_FORMAT_R32G32_SFLOAT, offset});
            offset += 8;
        }
        if (color)
        {
            layout.Attributes.push_back({VertexAttributes::Color, location++, VK_FORMAT_R32G32B32A32_SFLOAT, offset});
            offset += 16;
        }
        layout.ArrayStride = offset;
        return layout;
    }

    bool HasDef(const RHI::RenderPipelineDescriptor& desc, const std::string& def)
    {
        return desc.Vertex.HasDef(def) && desc.Fragment && desc.Fragment->Stage.HasDef(def);
    }

    class Mesh2DPipelineTest : public ::testing::Test
    {
    protected:
        RHI::HeadlessDevice Device;
        ShaderLibrary Shaders;
        Mesh2DPipeline Pipeline{Device, Shaders};
    };
}

// -----------------------------------------------------------------------------
// Mesh2DPipeline
// -----------------------------------------------------------------------------

TEST_F(Mesh2DPipelineTest, MissingPositionIsAnError)
{
    auto result = Pipeline.Specialize(Mesh2DPipelineKey{}, MakeLayout(false, true, true));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().Code, Core::ErrorCode::MissingVertexAttribute);
    EXPECT_NE(result.error().Detail.find("Vertex_Position"), std::string::npos);
}

TEST_F(Mesh2DPipelineTest, ShaderDefsFollowVertexLayout)
{
    auto plain = Pipeline.Specialize(Mesh2DPipelineKey{}, MakeLayout(true, false, false));
    auto full = Pipeline.Specialize(Mesh2DPipelineKey{}, MakeLayout(true, true, true));
    ASSERT_TRUE(plain.has_value());
    ASSERT_TRUE(full.has_value());

    EXPECT_FALSE(HasDef(*plain, "VERTEX_UVS"));
    EXPECT_FALSE(HasDef(*plain, "VERTEX_COLORS"));
    EXPECT_TRUE(HasDef(*full, "VERTEX_UVS"));
    EXPECT_TRUE(HasDef(*full, "VERTEX_COLORS"));
}

TEST_F(Mesh2DPipelineTest, TonemapDefsOnlyWhenFlagged)
{
    const auto layout = MakeLayout(true, false, false);

    auto without = Pipeline.Specialize(TonemappingPipelineKey(Tonemapping::AgX), layout);
    ASSERT_TRUE(without.has_value());
    EXPECT_FALSE(HasDef(*without, "TONEMAP_IN_SHADER"));

    auto with = Pipeline.Specialize(Mesh2DPipelineKey::TonemapInShaderFlag()
                                        | TonemappingPipelineKey(Tonemapping::AgX)
                                        | Mesh2DPipelineKey::DebandDitherFlag(),
                                    layout);
    ASSERT_TRUE(with.has_value());
    EXPECT_TRUE(HasDef(*with, "TONEMAP_IN_SHADER"));
    EXPECT_TRUE(HasDef(*with, "TONEMAP_METHOD_AGX"));
    EXPECT_TRUE(HasDef(*with, "DEBAND_DITHER"));
}

TEST_F(Mesh2DPipelineTest, OpaqueWritesDepthWithoutBlending)
{
    auto desc = Pipeline.Specialize(Mesh2DPipelineKey{}, MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());

    ASSERT_TRUE(desc->DepthStencil.has_value());
    EXPECT_TRUE(desc->DepthStencil->DepthWriteEnabled);
    EXPECT_EQ(desc->DepthStencil->DepthCompare, VK_COMPARE_OP_GREATER_OR_EQUAL);
    EXPECT_EQ(desc->DepthStencil->Format, VK_FORMAT_D32_SFLOAT);

    ASSERT_TRUE(desc->Fragment.has_value());
    ASSERT_EQ(desc->Fragment->Targets.size(), 1u);
    EXPECT_EQ(desc->Fragment->Targets[0].Blend, RHI::BlendState::Replace());
    EXPECT_EQ(desc->Label, "opaque_mesh2d_pipeline");
}

TEST_F(Mesh2DPipelineTest, BlendAlphaDisablesDepthWrite)
{
    auto desc = Pipeline.Specialize(Mesh2DPipelineKey::BlendAlphaFlag(), MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());

    EXPECT_FALSE(desc->DepthStencil->DepthWriteEnabled);
    EXPECT_EQ(desc->Fragment->Targets[0].Blend, RHI::BlendState::AlphaBlending());
    EXPECT_EQ(desc->Label, "transparent_mesh2d_pipeline");
}

TEST_F(Mesh2DPipelineTest, ColorFormatFollowsHdr)
{
    const auto layout = MakeLayout(true, false, false);
    auto sdr = Pipeline.Specialize(Mesh2DPipelineKey::FromHdr(false), layout);
    auto hdr = Pipeline.Specialize(Mesh2DPipelineKey::FromHdr(true), layout);

    EXPECT_EQ(sdr->Fragment->Targets[0].Format, VK_FORMAT_B8G8R8A8_SRGB);
    EXPECT_EQ(hdr->Fragment->Targets[0].Format, VK_FORMAT_R16G16B16A16_SFLOAT);
}

TEST_F(Mesh2DPipelineTest, SampleCountAndTopologyFromKey)
{
    auto desc = Pipeline.Specialize(Mesh2DPipelineKey::FromMsaaSamples(4)
                                        | Mesh2DPipelineKey::FromPrimitiveTopology(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP),
                                    MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());

    EXPECT_EQ(desc->Multisample.Count, 4u);
    EXPECT_EQ(desc->Primitive.Topology, VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP);
    EXPECT_EQ(desc->Primitive.CullMode, static_cast<VkCullModeFlags>(VK_CULL_MODE_NONE));
}

TEST_F(Mesh2DPipelineTest, LayoutIsViewThenMesh)
{
    auto desc = Pipeline.Specialize(Mesh2DPipelineKey{}, MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());

    ASSERT_EQ(desc->Layout.size(), 2u);
    EXPECT_EQ(desc->Layout[0], Pipeline.GetViewLayout());
    EXPECT_EQ(desc->Layout[1], Pipeline.GetMeshLayout());
    ASSERT_EQ(desc->VertexBuffers.size(), 1u);
    EXPECT_EQ(desc->VertexBuffers[0], MakeLayout(true, false, false));
}

TEST_F(Mesh2DPipelineTest, EqualInputsGiveEqualDescriptors)
{
    const auto key = Mesh2DPipelineKey::FromMsaaSamples(4) | Mesh2DPipelineKey::BlendAlphaFlag();
    const auto layout = MakeLayout(true, true, false);
    EXPECT_EQ(*Pipeline.Specialize(key, layout), *Pipeline.Specialize(key, layout));
}

TEST_F(Mesh2DPipelineTest, ConfiguredFormatsAreUsed)
{
    Mesh2DPipelineConfig config;
    config.SdrColorFormat = VK_FORMAT_R8G8B8A8_UNORM;
    config.DepthFormat = VK_FORMAT_D24_UNORM_S8_UINT;
    Mesh2DPipeline custom(Device, Shaders, config);

    auto desc = custom.Specialize(Mesh2DPipelineKey{}, MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());
    EXPECT_EQ(desc->Fragment->Targets[0].Format, VK_FORMAT_R8G8B8A8_UNORM);
    EXPECT_EQ(desc->DepthStencil->Format, VK_FORMAT_D24_UNORM_S8_UINT);
}

// -----------------------------------------------------------------------------
// Material2DPipeline
// -----------------------------------------------------------------------------

namespace
{
    struct OutlineMaterial
    {
        float Width = 1.0f;

        struct Data
        {
            bool operator==(const Data&) const = default;
        };

        static RHI::BindGroupLayoutDesc BindGroupLayout()
        {
            return {"OutlineMaterial", {{0, RHI::BindingType::UniformBuffer, VK_SHADER_STAGE_FRAGMENT_BIT}}};
        }

        static ShaderRef VertexShader() { return ShaderRef::FromPath("shaders/outline.vert.spv"); }

        static std::expected<void, SpecializeError> Specialize(RHI::RenderPipelineDescriptor& desc,
                                                               const RHI::VertexBufferLayout&,
                                                               const Material2DKey<OutlineMaterial>&)
        {
            desc.Primitive.CullMode = VK_CULL_MODE_BACK_BIT;
            return {};
        }

        std::expected<PreparedBindGroup<Data>, AsBindGroupError> AsBindGroup(const AsBindGroupContext& ctx) const
        {
            return AsBindGroupBuilder(ctx).Uniform(0, Width, "OutlineMaterial").Build(Data{});
        }
    };
}

template <>
struct std::hash<OutlineMaterial::Data>
{
    size_t operator()(const OutlineMaterial::Data&) const noexcept { return 0; }
};

namespace
{
    // Same as OutlineMaterial, but the hook reports errors as Core::Result.
    struct WrongHookMaterial : OutlineMaterial
    {
        static Core::Result Specialize(RHI::RenderPipelineDescriptor&, const RHI::VertexBufferLayout&,
                                       const Material2DKey<WrongHookMaterial>&)
        {
            return Core::Ok();
        }
    };

    struct NoHookMaterial
    {
        using Data = OutlineMaterial::Data;

        static RHI::BindGroupLayoutDesc BindGroupLayout() { return OutlineMaterial::BindGroupLayout(); }

        std::expected<PreparedBindGroup<Data>, AsBindGroupError> AsBindGroup(const AsBindGroupContext& ctx) const
        {
            return AsBindGroupBuilder(ctx).Build(Data{});
        }
    };
}

static_assert(Material2D<OutlineMaterial>);
static_assert(Material2D<ColorMaterial2D>);
static_assert(Material2D<NoHookMaterial>);
static_assert(HasSpecializeHook<OutlineMaterial>);
static_assert(!HasSpecializeHook<NoHookMaterial>);
static_assert(HasSpecializeHook<WrongHookMaterial>);
static_assert(!Material2D<WrongHookMaterial>);

TEST_F(Mesh2DPipelineTest, MaterialLayoutIsThirdGroup)
{
    Material2DPipeline<ColorMaterial2D> material(Pipeline, Device, Shaders);

    auto desc = material.Specialize({Mesh2DPipelineKey{}, ColorMaterial2D::Data{false}}, MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());

    ASSERT_EQ(desc->Layout.size(), 3u);
    EXPECT_EQ(desc->Layout[0], Pipeline.GetViewLayout());
    EXPECT_EQ(desc->Layout[1], Pipeline.GetMeshLayout());
    EXPECT_EQ(desc->Layout[2], material.GetMaterialLayout());
}

TEST_F(Mesh2DPipelineTest, MaterialFragmentShaderOverride)
{
    Material2DPipeline<ColorMaterial2D> material(Pipeline, Device, Shaders);

    auto desc = material.Specialize({Mesh2DPipelineKey{}, ColorMaterial2D::Data{false}}, MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());

    EXPECT_EQ(desc->Vertex.Shader, Pipeline.GetVertexShader());
    EXPECT_NE(desc->Fragment->Stage.Shader, Pipeline.GetFragmentShader());
    EXPECT_EQ(Shaders.GetPath(desc->Fragment->Stage.Shader), "shaders/color_material.frag.spv");
}

TEST_F(Mesh2DPipelineTest, MaterialVertexShaderOverrideAndHook)
{
    Material2DPipeline<OutlineMaterial> material(Pipeline, Device, Shaders);

    auto desc = material.Specialize({Mesh2DPipelineKey{}, OutlineMaterial::Data{}}, MakeLayout(true, false, false));
    ASSERT_TRUE(desc.has_value());

    EXPECT_EQ(Shaders.GetPath(desc->Vertex.Shader), "shaders/outline.vert.spv");
    EXPECT_EQ(desc->Fragment->Stage.Shader, Pipeline.GetFragmentShader());
    EXPECT_EQ(desc->Primitive.CullMode, static_cast<VkCullModeFlags>(VK_CULL_MODE_BACK_BIT));
}

TEST_F(Mesh2DPipelineTest, MaterialHookErrorPropagates)
{
    Material2DPipeline<ColorMaterial2D> material(Pipeline, Device, Shaders);

    // Textured color material on a mesh without UVs.
    auto desc = material.Specialize({Mesh2DPipelineKey{}, ColorMaterial2D::Data{true}}, MakeLayout(true, false, false));
    ASSERT_FALSE(desc.has_value());
    EXPECT_EQ(desc.error().Code, Core::ErrorCode::MissingVertexAttribute);

    auto ok = material.Specialize({Mesh2DPipelineKey{}, ColorMaterial2D::Data{true}}, MakeLayout(true, true, false));
    ASSERT_TRUE(ok.has_value());
    EXPECT_TRUE(ok->Fragment->Stage.HasDef("COLOR_MATERIAL_TEXTURED"));
}

TEST_F(Mesh2DPipelineTest, BaseErrorPropagatesThroughMaterial)
{
    Material2DPipeline<ColorMaterial2D> material(Pipeline, Device, Shaders);

    auto desc = material.Specialize({Mesh2DPipelineKey{}, ColorMaterial2D::Data{false}}, MakeLayout(false, true, false));
    ASSERT_FALSE(desc.has_value());
    EXPECT_EQ(desc.error().Code, Core::ErrorCode::MissingVertexAttribute);
}
