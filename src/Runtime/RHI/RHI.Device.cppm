module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

export module RHI:Device;

import Core;
import :Types;
import :Pipeline;

export namespace RHI
{
    enum class BindingType : uint8_t
    {
        UniformBuffer,
        SampledTexture,
        Sampler
    };

    struct BindGroupLayoutEntry
    {
        uint32_t Binding = 0;
        BindingType Type = BindingType::UniformBuffer;
        VkShaderStageFlags Visibility = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;

        bool operator==(const BindGroupLayoutEntry&) const = default;
    };

    struct BindGroupLayoutDesc
    {
        std::string Label;
        std::vector<BindGroupLayoutEntry> Entries;
    };

    using BindingResource = std::variant<BufferHandle, TextureViewHandle, SamplerHandle>;

    struct BindGroupEntry
    {
        uint32_t Binding = 0;
        BindingResource Resource;
    };

    [[nodiscard]] constexpr BindingType GetBindingType(const BindingResource& resource)
    {
        switch (resource.index())
        {
        case 1: return BindingType::SampledTexture;
        case 2: return BindingType::Sampler;
        default: return BindingType::UniformBuffer;
        }
    }

    // -------------------------------------------------------------------------
    // IRenderDevice
    // -------------------------------------------------------------------------
    // The narrow slice of the GPU device the material pipeline needs. A Vulkan
    // backend maps these onto descriptor set layouts, descriptor sets, buffers
    // and graphics pipelines. Implementations must be callable from several
    // threads at once. Buffers and bind groups are released explicitly by
    // their owner; views, samplers and pipelines live as long as the device.
    // -------------------------------------------------------------------------
    class IRenderDevice
    {
    public:
        virtual ~IRenderDevice() = default;

        [[nodiscard]] virtual BindGroupLayoutHandle CreateBindGroupLayout(const BindGroupLayoutDesc& desc) = 0;

        // Fails with InvalidArgument if the entries do not match the layout.
        [[nodiscard]] virtual Core::Expected<BindGroupHandle> CreateBindGroup(
            BindGroupLayoutHandle layout, std::span<const BindGroupEntry> entries) = 0;

        [[nodiscard]] virtual BufferHandle CreateUniformBuffer(std::span<const std::byte> contents,
                                                               std::string_view label) = 0;

        [[nodiscard]] virtual TextureViewHandle CreateTextureView(VkFormat format, uint32_t width, uint32_t height,
                                                                  std::string_view label) = 0;

        [[nodiscard]] virtual SamplerHandle CreateSampler(std::string_view label) = 0;

        [[nodiscard]] virtual Core::Expected<RenderPipelineHandle> CreateRenderPipeline(
            const RenderPipelineDescriptor& descriptor) = 0;

        virtual void DestroyBuffer(BufferHandle buffer) = 0;
        virtual void DestroyBindGroup(BindGroupHandle bindGroup) = 0;
    };
}
