module;
#include "RHI.Vulkan.hpp"
#include <expected>
#include <string>

export module Graphics:Mesh2DPipeline;

import Core;
import RHI;
import :Mesh2D;
import :PipelineCache;
import :ShaderLibrary;

export namespace Graphics
{
    struct Mesh2DPipelineConfig
    {
        VkFormat SdrColorFormat = VK_FORMAT_B8G8R8A8_SRGB;
        VkFormat HdrColorFormat = VK_FORMAT_R16G16B16A16_SFLOAT;
        VkFormat DepthFormat = VK_FORMAT_D32_SFLOAT;
        std::string VertexShaderPath = "shaders/mesh2d.vert.spv";
        std::string FragmentShaderPath = "shaders/mesh2d.frag.spv";
    };

    // -------------------------------------------------------------------------
    // Mesh2DPipeline
    // -------------------------------------------------------------------------
    // Base specializer shared by every 2D material. Owns the view (group 0)
    // and mesh (group 1) bind group layouts and the default shaders, and
    // derives shader defs, blending, depth and multisampling from the key.
    // Material pipelines call Specialize() first and then patch the result.
    // -------------------------------------------------------------------------
    class Mesh2DPipeline
    {
    public:
        using Key = Mesh2DPipelineKey;

        Mesh2DPipeline(RHI::IRenderDevice& device, ShaderLibrary& shaders, Mesh2DPipelineConfig config = {});

        // Fails with MissingVertexAttribute when the layout has no position attribute.
        [[nodiscard]] std::expected<RHI::RenderPipelineDescriptor, SpecializeError> Specialize(
            const Mesh2DPipelineKey& key, const RHI::VertexBufferLayout& layout) const;

        [[nodiscard]] RHI::BindGroupLayoutHandle GetViewLayout() const { return m_ViewLayout; }
        [[nodiscard]] RHI::BindGroupLayoutHandle GetMeshLayout() const { return m_MeshLayout; }
        [[nodiscard]] RHI::ShaderHandle GetVertexShader() const { return m_VertexShader; }
        [[nodiscard]] RHI::ShaderHandle GetFragmentShader() const { return m_FragmentShader; }
        [[nodiscard]] const Mesh2DPipelineConfig& GetConfig() const { return m_Config; }

    private:
        Mesh2DPipelineConfig m_Config;
        RHI::BindGroupLayoutHandle m_ViewLayout{};
        RHI::BindGroupLayoutHandle m_MeshLayout{};
        RHI::ShaderHandle m_VertexShader{};
        RHI::ShaderHandle m_FragmentShader{};
    };
}
