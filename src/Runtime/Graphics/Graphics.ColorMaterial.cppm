module;
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <optional>
#include <glm/glm.hpp>

export module Graphics:ColorMaterial;

import Core;
import RHI;
import :Images;
import :Material2D;
import :PipelineCache;
import :ShaderLibrary;

export namespace Graphics
{
    // Matches the std140 uniform block of color_material.frag.
    struct ColorMaterialUniform
    {
        glm::vec4 Color{1.0f};
        uint32_t Flags = 0;
        uint32_t Padding[3] = {0, 0, 0};
    };

    namespace ColorMaterialFlags
    {
        inline constexpr uint32_t Texture = 1u << 0;
        inline constexpr uint32_t AlphaModeBlend = 1u << 1;
    }

    // Flat color, optionally multiplied by a texture.
    struct ColorMaterial2D
    {
        glm::vec4 Color{1.0f};
        std::optional<ImageHandle> Texture;
        AlphaMode2D Alpha = AlphaMode2D::Opaque;

        struct Data
        {
            bool Textured = false;

            bool operator==(const Data&) const = default;
        };

        [[nodiscard]] static RHI::BindGroupLayoutDesc BindGroupLayout();
        [[nodiscard]] static ShaderRef FragmentShader();

        // Textured variants need UVs on the mesh.
        [[nodiscard]] static std::expected<void, SpecializeError> Specialize(
            RHI::RenderPipelineDescriptor& descriptor,
            const RHI::VertexBufferLayout& layout,
            const Material2DKey<ColorMaterial2D>& key);

        [[nodiscard]] AlphaMode2D AlphaMode() const { return Alpha; }

        [[nodiscard]] ColorMaterialUniform GetUniform() const;

        [[nodiscard]] std::expected<PreparedBindGroup<Data>, AsBindGroupError> AsBindGroup(
            const AsBindGroupContext& ctx) const;
    };
}

template <>
struct std::hash<Graphics::ColorMaterial2D::Data>
{
    std::size_t operator()(const Graphics::ColorMaterial2D::Data& data) const noexcept
    {
        return std::hash<bool>{}(data.Textured);
    }
};
