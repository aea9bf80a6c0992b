module;
#include "RHI.Vulkan.hpp"
#include <expected>
#include <format>
#include <string>
#include <utility>
#include <vector>

module Graphics:Mesh2DPipeline.Impl;
import :Mesh2DPipeline;
import :Mesh2D;
import :PipelineCache;
import :ShaderLibrary;
import Core;
import RHI;

namespace Graphics
{
    Mesh2DPipeline::Mesh2DPipeline(RHI::IRenderDevice& device, ShaderLibrary& shaders, Mesh2DPipelineConfig config)
        : m_Config(std::move(config))
    {
        constexpr VkShaderStageFlags kAllGraphics = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;

        // Group 0: view uniform + globals uniform
        m_ViewLayout = device.CreateBindGroupLayout({
            .Label = "Mesh2D.ViewLayout",
            .Entries = {
                {0, RHI::BindingType::UniformBuffer, kAllGraphics},
                {1, RHI::BindingType::UniformBuffer, kAllGraphics},
            },
        });

        // Group 1: per-mesh uniform (world_from_local and friends)
        m_MeshLayout = device.CreateBindGroupLayout({
            .Label = "Mesh2D.MeshLayout",
            .Entries = {
                {0, RHI::BindingType::UniformBuffer, kAllGraphics},
            },
        });

        shaders.Register(Core::Hash::StringID("Mesh2D.Vert"), m_Config.VertexShaderPath);
        shaders.Register(Core::Hash::StringID("Mesh2D.Frag"), m_Config.FragmentShaderPath);
        m_VertexShader = shaders.Load(m_Config.VertexShaderPath);
        m_FragmentShader = shaders.Load(m_Config.FragmentShaderPath);
    }

    std::expected<RHI::RenderPipelineDescriptor, SpecializeError> Mesh2DPipeline::Specialize(
        const Mesh2DPipelineKey& key, const RHI::VertexBufferLayout& layout) const
    {
        if (!layout.Contains(VertexAttributes::Position))
        {
            return std::unexpected(SpecializeError{
                Core::ErrorCode::MissingVertexAttribute,
                "Mesh is missing vertex attribute Vertex_Position"});
        }

        std::vector<std::string> defs;
        defs.emplace_back("VERTEX_POSITIONS");
        if (layout.Contains(VertexAttributes::Normal)) defs.emplace_back("VERTEX_NORMALS");
        if (layout.Contains(VertexAttributes::Uv)) defs.emplace_back("VERTEX_UVS");
        if (layout.Contains(VertexAttributes::Tangent)) defs.emplace_back("VERTEX_TANGENTS");
        if (layout.Contains(VertexAttributes::Color)) defs.emplace_back("VERTEX_COLORS");

        if (key.TonemapInShader)
        {
            defs.emplace_back("TONEMAP_IN_SHADER");
            defs.emplace_back(TonemappingShaderDef(key.GetTonemapMethod()));

            if (key.DebandDither)
                defs.emplace_back("DEBAND_DITHER");
        }

        const bool blend = key.BlendAlpha;

        RHI::RenderPipelineDescriptor desc;
        desc.Label = blend ? "transparent_mesh2d_pipeline" : "opaque_mesh2d_pipeline";
        desc.Layout = {m_ViewLayout, m_MeshLayout};

        desc.Vertex.Shader = m_VertexShader;
        desc.Vertex.EntryPoint = "main";
        desc.Vertex.ShaderDefs = defs;
        desc.VertexBuffers = {layout};

        RHI::FragmentState fragment;
        fragment.Stage.Shader = m_FragmentShader;
        fragment.Stage.EntryPoint = "main";
        fragment.Stage.ShaderDefs = std::move(defs);
        fragment.Targets.push_back(RHI::ColorTargetState{
            .Format = key.Hdr ? m_Config.HdrColorFormat : m_Config.SdrColorFormat,
            .Blend = blend ? RHI::BlendState::AlphaBlending() : RHI::BlendState::Replace(),
        });
        desc.Fragment = std::move(fragment);

        desc.Primitive.Topology = key.GetPrimitiveTopology();
        desc.Primitive.FrontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        desc.Primitive.CullMode = VK_CULL_MODE_NONE;
        desc.Primitive.PolygonMode = VK_POLYGON_MODE_FILL;

        desc.DepthStencil = RHI::DepthStencilState{
            .Format = m_Config.DepthFormat,
            .DepthWriteEnabled = !blend,
            .DepthCompare = VK_COMPARE_OP_GREATER_OR_EQUAL,
        };

        desc.Multisample.Count = key.GetMsaaSamples();
        desc.Multisample.Mask = ~0u;
        desc.Multisample.AlphaToCoverageEnabled = false;

        return desc;
    }
}
