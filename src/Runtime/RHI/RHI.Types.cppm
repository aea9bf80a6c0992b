module;
#include "RHI.Vulkan.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

export module RHI:Types;

import Core;

export namespace RHI
{
    // Opaque GPU object handles. The device backend owns the objects; the
    // render core only stores, compares and hashes the handles.
    using BufferHandle = Core::StrongHandle<struct BufferTag>;
    using TextureViewHandle = Core::StrongHandle<struct TextureViewTag>;
    using SamplerHandle = Core::StrongHandle<struct SamplerTag>;
    using ShaderHandle = Core::StrongHandle<struct ShaderTag>;
    using BindGroupLayoutHandle = Core::StrongHandle<struct BindGroupLayoutTag>;
    using BindGroupHandle = Core::StrongHandle<struct BindGroupTag>;
    using RenderPipelineHandle = Core::StrongHandle<struct RenderPipelineTag>;

    struct VertexAttribute
    {
        Core::Hash::StringID Id;
        uint32_t ShaderLocation = 0;
        VkFormat Format = VK_FORMAT_UNDEFINED;
        uint32_t Offset = 0;

        bool operator==(const VertexAttribute&) const = default;
    };

    // Interleaved single-buffer layout of a mesh, as computed by the mesh loader.
    struct VertexBufferLayout
    {
        uint32_t ArrayStride = 0;
        VkVertexInputRate StepMode = VK_VERTEX_INPUT_RATE_VERTEX;
        std::vector<VertexAttribute> Attributes;

        [[nodiscard]] const VertexAttribute* Find(Core::Hash::StringID id) const
        {
            auto it = std::find_if(Attributes.begin(), Attributes.end(),
                                   [id](const VertexAttribute& a) { return a.Id == id; });
            return it != Attributes.end() ? &*it : nullptr;
        }

        [[nodiscard]] bool Contains(Core::Hash::StringID id) const { return Find(id) != nullptr; }

        bool operator==(const VertexBufferLayout&) const = default;
    };
}

template <>
struct std::hash<RHI::VertexBufferLayout>
{
    std::size_t operator()(const RHI::VertexBufferLayout& layout) const noexcept
    {
        size_t seed = 0;
        Core::Hash::HashCombine(seed, layout.ArrayStride);
        Core::Hash::HashCombine(seed, layout.StepMode);
        for (const RHI::VertexAttribute& a : layout.Attributes)
        {
            Core::Hash::HashCombine(seed, a.Id);
            Core::Hash::HashCombine(seed, a.ShaderLocation);
            Core::Hash::HashCombine(seed, a.Format);
            Core::Hash::HashCombine(seed, a.Offset);
        }
        return seed;
    }
};
