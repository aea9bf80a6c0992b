module;
#include "RHI.Vulkan.hpp"
#include <expected>
#include <optional>
#include <glm/glm.hpp>

module Graphics:ColorMaterial.Impl;
import :ColorMaterial;
import :AsBindGroup;
import :Images;
import :Material2D;
import :Mesh2D;
import :PipelineCache;
import :ShaderLibrary;
import Core;
import RHI;

namespace Graphics
{
    RHI::BindGroupLayoutDesc ColorMaterial2D::BindGroupLayout()
    {
        return {
            .Label = "ColorMaterial2D.Layout",
            .Entries = {
                {0, RHI::BindingType::UniformBuffer, VK_SHADER_STAGE_FRAGMENT_BIT},
                {1, RHI::BindingType::SampledTexture, VK_SHADER_STAGE_FRAGMENT_BIT},
                {2, RHI::BindingType::Sampler, VK_SHADER_STAGE_FRAGMENT_BIT},
            },
        };
    }

    ShaderRef ColorMaterial2D::FragmentShader()
    {
        return ShaderRef::FromPath("shaders/color_material.frag.spv");
    }

    std::expected<void, SpecializeError> ColorMaterial2D::Specialize(RHI::RenderPipelineDescriptor& descriptor,
                                                                     const RHI::VertexBufferLayout& layout,
                                                                     const Material2DKey<ColorMaterial2D>& key)
    {
        if (!key.BindGroupData.Textured)
            return {};

        if (!layout.Contains(VertexAttributes::Uv))
        {
            return std::unexpected(SpecializeError{
                Core::ErrorCode::MissingVertexAttribute,
                "Textured ColorMaterial2D requires vertex attribute Vertex_Uv"});
        }

        if (descriptor.Fragment)
            descriptor.Fragment->Stage.ShaderDefs.emplace_back("COLOR_MATERIAL_TEXTURED");
        return {};
    }

    ColorMaterialUniform ColorMaterial2D::GetUniform() const
    {
        ColorMaterialUniform uniform;
        uniform.Color = Color;
        if (Texture)
            uniform.Flags |= ColorMaterialFlags::Texture;
        if (Alpha == AlphaMode2D::Blend)
            uniform.Flags |= ColorMaterialFlags::AlphaModeBlend;
        return uniform;
    }

    std::expected<PreparedBindGroup<ColorMaterial2D::Data>, AsBindGroupError> ColorMaterial2D::AsBindGroup(
        const AsBindGroupContext& ctx) const
    {
        return AsBindGroupBuilder(ctx)
            .Uniform(0, GetUniform(), "ColorMaterial2D.Uniform")
            .Texture(1, Texture)
            .Sampler(2, Texture)
            .Build(Data{Texture.has_value()});
    }
}
