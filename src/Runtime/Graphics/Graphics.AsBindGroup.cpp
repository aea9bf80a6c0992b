module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

module Graphics:AsBindGroup.Impl;
import :AsBindGroup;
import :Images;
import :Material2D;
import Core;
import RHI;

namespace Graphics
{
    AsBindGroupBuilder::AsBindGroupBuilder(const AsBindGroupContext& ctx)
        : m_Context(ctx)
    {
    }

    AsBindGroupBuilder& AsBindGroupBuilder::Uniform(uint32_t binding, std::span<const std::byte> bytes,
                                                    std::string_view label)
    {
        m_Uniforms.push_back({binding, {bytes.begin(), bytes.end()}, std::string(label)});
        return *this;
    }

    const GpuImage* AsBindGroupBuilder::ResolveImage(std::optional<ImageHandle> image)
    {
        if (!image)
            return &m_Context.Fallback.Image;

        const GpuImage* gpuImage = m_Context.Images.Get(*image);
        if (!gpuImage)
            m_Deferred = true;
        return gpuImage;
    }

    AsBindGroupBuilder& AsBindGroupBuilder::Texture(uint32_t binding, std::optional<ImageHandle> image)
    {
        if (const GpuImage* gpuImage = ResolveImage(image))
            m_Resources.push_back({binding, gpuImage->View});
        return *this;
    }

    AsBindGroupBuilder& AsBindGroupBuilder::Sampler(uint32_t binding, std::optional<ImageHandle> image)
    {
        if (const GpuImage* gpuImage = ResolveImage(image))
            m_Resources.push_back({binding, gpuImage->Sampler});
        return *this;
    }

    std::expected<std::vector<OwnedBinding>, AsBindGroupError> AsBindGroupBuilder::BuildBindings()
    {
        if (m_Deferred)
            return std::unexpected(AsBindGroupError::RetryNextUpdate);

        std::vector<OwnedBinding> bindings;
        bindings.reserve(m_Uniforms.size() + m_Resources.size());

        for (const PendingUniform& uniform : m_Uniforms)
        {
            RHI::BufferHandle buffer = m_Context.Device.CreateUniformBuffer(uniform.Bytes, uniform.Label);
            bindings.push_back({uniform.Binding, buffer});
        }
        bindings.insert(bindings.end(), m_Resources.begin(), m_Resources.end());

        std::stable_sort(bindings.begin(), bindings.end(),
                         [](const OwnedBinding& a, const OwnedBinding& b) { return a.Binding < b.Binding; });
        return bindings;
    }

    std::expected<RHI::BindGroupHandle, AsBindGroupError> AsBindGroupBuilder::CreateBindGroup(
        const std::vector<OwnedBinding>& bindings)
    {
        std::vector<RHI::BindGroupEntry> entries;
        entries.reserve(bindings.size());
        for (const OwnedBinding& binding : bindings)
            entries.push_back({binding.Binding, binding.Resource});

        auto bindGroup = m_Context.Device.CreateBindGroup(m_Context.Layout, entries);
        if (!bindGroup)
        {
            Core::Log::Error("[AsBindGroup] Bind group creation failed: {}",
                             Core::ErrorCodeToString(bindGroup.error()));
            return std::unexpected(AsBindGroupError::InvalidBinding);
        }
        return *bindGroup;
    }
}
