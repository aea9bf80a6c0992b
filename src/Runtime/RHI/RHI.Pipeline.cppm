module;
#include "RHI.Vulkan.hpp"
#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

export module RHI:Pipeline;

import :Types;

export namespace RHI
{
    struct ShaderStage
    {
        ShaderHandle Shader{};
        std::string EntryPoint;
        std::vector<std::string> ShaderDefs;

        [[nodiscard]] bool HasDef(std::string_view def) const
        {
            return std::find(ShaderDefs.begin(), ShaderDefs.end(), def) != ShaderDefs.end();
        }

        bool operator==(const ShaderStage&) const = default;
    };

    struct BlendComponent
    {
        VkBlendFactor SrcFactor = VK_BLEND_FACTOR_ONE;
        VkBlendFactor DstFactor = VK_BLEND_FACTOR_ZERO;
        VkBlendOp Operation = VK_BLEND_OP_ADD;

        bool operator==(const BlendComponent&) const = default;
    };

    struct BlendState
    {
        BlendComponent Color;
        BlendComponent Alpha;

        // Straight (non-premultiplied) alpha blending.
        static constexpr BlendState AlphaBlending()
        {
            return {
                {VK_BLEND_FACTOR_SRC_ALPHA, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA, VK_BLEND_OP_ADD},
                {VK_BLEND_FACTOR_ONE, VK_BLEND_FACTOR_ONE_MINUS_SRC_ALPHA, VK_BLEND_OP_ADD}};
        }

        static constexpr BlendState Replace()
        {
            return {};
        }

        bool operator==(const BlendState&) const = default;
    };

    struct ColorTargetState
    {
        VkFormat Format = VK_FORMAT_UNDEFINED;
        std::optional<BlendState> Blend;
        VkColorComponentFlags WriteMask = VK_COLOR_COMPONENT_R_BIT | VK_COLOR_COMPONENT_G_BIT |
                                          VK_COLOR_COMPONENT_B_BIT | VK_COLOR_COMPONENT_A_BIT;

        bool operator==(const ColorTargetState&) const = default;
    };

    struct FragmentState
    {
        ShaderStage Stage;
        std::vector<ColorTargetState> Targets;

        bool operator==(const FragmentState&) const = default;
    };

    struct PrimitiveState
    {
        VkPrimitiveTopology Topology = VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST;
        VkFrontFace FrontFace = VK_FRONT_FACE_COUNTER_CLOCKWISE;
        VkCullModeFlags CullMode = VK_CULL_MODE_NONE;
        VkPolygonMode PolygonMode = VK_POLYGON_MODE_FILL;

        bool operator==(const PrimitiveState&) const = default;
    };

    struct DepthStencilState
    {
        VkFormat Format = VK_FORMAT_D32_SFLOAT;
        bool DepthWriteEnabled = true;
        VkCompareOp DepthCompare = VK_COMPARE_OP_GREATER_OR_EQUAL; // Reverse-Z

        bool operator==(const DepthStencilState&) const = default;
    };

    struct MultisampleState
    {
        uint32_t Count = 1;
        uint32_t Mask = ~0u;
        bool AlphaToCoverageEnabled = false;

        bool operator==(const MultisampleState&) const = default;
    };

    // Everything the device needs to build one graphics pipeline.
    // Produced by specializers, consumed by PipelineCache / IRenderDevice.
    struct RenderPipelineDescriptor
    {
        std::string Label;
        std::vector<BindGroupLayoutHandle> Layout;
        ShaderStage Vertex;
        std::vector<VertexBufferLayout> VertexBuffers;
        std::optional<FragmentState> Fragment;
        PrimitiveState Primitive;
        std::optional<DepthStencilState> DepthStencil;
        MultisampleState Multisample;

        bool operator==(const RenderPipelineDescriptor&) const = default;
    };

    [[nodiscard]] constexpr bool IsValidSampleCount(uint32_t count)
    {
        return count == 1 || count == 2 || count == 4 || count == 8;
    }

    [[nodiscard]] constexpr VkSampleCountFlagBits ToSampleCountFlag(uint32_t count)
    {
        switch (count)
        {
        case 2: return VK_SAMPLE_COUNT_2_BIT;
        case 4: return VK_SAMPLE_COUNT_4_BIT;
        case 8: return VK_SAMPLE_COUNT_8_BIT;
        default: return VK_SAMPLE_COUNT_1_BIT;
        }
    }
}
