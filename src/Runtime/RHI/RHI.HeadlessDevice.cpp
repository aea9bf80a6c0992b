module;
#include "RHI.Vulkan.hpp"
#include <algorithm>
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

module RHI:HeadlessDevice.Impl;
import :HeadlessDevice;
import :Device;
import :Pipeline;
import Core;

namespace RHI
{
    BindGroupLayoutHandle HeadlessDevice::CreateBindGroupLayout(const BindGroupLayoutDesc& desc)
    {
        std::lock_guard lock(m_Mutex);
        m_Layouts.push_back(desc.Entries);
        return {static_cast<uint32_t>(m_Layouts.size() - 1), 1u};
    }

    Core::Expected<BindGroupHandle> HeadlessDevice::CreateBindGroup(BindGroupLayoutHandle layout,
                                                                    std::span<const BindGroupEntry> entries)
    {
        std::lock_guard lock(m_Mutex);

        if (!layout.IsValid() || layout.Index >= m_Layouts.size())
        {
            Core::Log::Error("[HeadlessDevice] CreateBindGroup: unknown layout {}", layout);
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        }

        const auto& layoutEntries = m_Layouts[layout.Index];
        if (layoutEntries.size() != entries.size())
        {
            Core::Log::Error("[HeadlessDevice] CreateBindGroup: layout expects {} bindings, got {}",
                             layoutEntries.size(), entries.size());
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        for (const BindGroupLayoutEntry& expected : layoutEntries)
        {
            auto it = std::find_if(entries.begin(), entries.end(),
                                   [&](const BindGroupEntry& e) { return e.Binding == expected.Binding; });
            if (it == entries.end() || GetBindingType(it->Resource) != expected.Type)
            {
                Core::Log::Error("[HeadlessDevice] CreateBindGroup: binding {} missing or of wrong type",
                                 expected.Binding);
                return std::unexpected(Core::ErrorCode::InvalidArgument);
            }
        }

        m_BindGroups.push_back(true);
        ++m_LiveBindGroups;
        return BindGroupHandle{static_cast<uint32_t>(m_BindGroups.size() - 1), 1u};
    }

    BufferHandle HeadlessDevice::CreateUniformBuffer(std::span<const std::byte> contents, std::string_view label)
    {
        std::lock_guard lock(m_Mutex);
        m_Buffers.push_back({{contents.begin(), contents.end()}, true});
        ++m_LiveBuffers;
        Core::Log::Debug("[HeadlessDevice] Uniform buffer '{}' ({} bytes)", label, contents.size());
        return {static_cast<uint32_t>(m_Buffers.size() - 1), 1u};
    }

    TextureViewHandle HeadlessDevice::CreateTextureView(VkFormat format, uint32_t width, uint32_t height,
                                                        std::string_view label)
    {
        std::lock_guard lock(m_Mutex);
        Core::Log::Debug("[HeadlessDevice] Texture view '{}' {}x{} (format={})",
                         label, width, height, static_cast<int>(format));
        return {m_NextTextureView++, 1u};
    }

    SamplerHandle HeadlessDevice::CreateSampler(std::string_view label)
    {
        std::lock_guard lock(m_Mutex);
        Core::Log::Debug("[HeadlessDevice] Sampler '{}'", label);
        return {m_NextSampler++, 1u};
    }

    Core::Expected<RenderPipelineHandle> HeadlessDevice::CreateRenderPipeline(const RenderPipelineDescriptor& descriptor)
    {
        if (!descriptor.Vertex.Shader.IsValid() ||
            (descriptor.Fragment && !descriptor.Fragment->Stage.Shader.IsValid()))
        {
            Core::Log::Error("[HeadlessDevice] Pipeline '{}' has no shader module bound", descriptor.Label);
            return std::unexpected(Core::ErrorCode::ShaderCompilationFailed);
        }

        if (!IsValidSampleCount(descriptor.Multisample.Count))
        {
            Core::Log::Error("[HeadlessDevice] Pipeline '{}' uses unsupported sample count {}",
                             descriptor.Label, descriptor.Multisample.Count);
            return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
        }

        std::lock_guard lock(m_Mutex);
        for (BindGroupLayoutHandle layout : descriptor.Layout)
        {
            if (!layout.IsValid() || layout.Index >= m_Layouts.size())
            {
                Core::Log::Error("[HeadlessDevice] Pipeline '{}' references unknown bind group layout {}",
                                 descriptor.Label, layout);
                return std::unexpected(Core::ErrorCode::PipelineCreationFailed);
            }
        }

        m_Pipelines.push_back(descriptor);
        return RenderPipelineHandle{static_cast<uint32_t>(m_Pipelines.size() - 1), 1u};
    }

    void HeadlessDevice::DestroyBuffer(BufferHandle buffer)
    {
        std::lock_guard lock(m_Mutex);
        if (!buffer.IsValid() || buffer.Index >= m_Buffers.size() || !m_Buffers[buffer.Index].Alive)
        {
            Core::Log::Error("[HeadlessDevice] DestroyBuffer: unknown or already destroyed buffer {}", buffer);
            return;
        }

        BufferSlot& slot = m_Buffers[buffer.Index];
        slot.Alive = false;
        slot.Contents.clear();
        slot.Contents.shrink_to_fit();
        --m_LiveBuffers;
    }

    void HeadlessDevice::DestroyBindGroup(BindGroupHandle bindGroup)
    {
        std::lock_guard lock(m_Mutex);
        if (!bindGroup.IsValid() || bindGroup.Index >= m_BindGroups.size() || !m_BindGroups[bindGroup.Index])
        {
            Core::Log::Error("[HeadlessDevice] DestroyBindGroup: unknown or already destroyed bind group {}",
                             bindGroup);
            return;
        }

        m_BindGroups[bindGroup.Index] = false;
        --m_LiveBindGroups;
    }

    uint32_t HeadlessDevice::GetBindGroupCount() const
    {
        std::lock_guard lock(m_Mutex);
        return m_LiveBindGroups;
    }

    uint32_t HeadlessDevice::GetPipelineCount() const
    {
        std::lock_guard lock(m_Mutex);
        return static_cast<uint32_t>(m_Pipelines.size());
    }

    uint32_t HeadlessDevice::GetBufferCount() const
    {
        std::lock_guard lock(m_Mutex);
        return m_LiveBuffers;
    }

    std::optional<std::vector<std::byte>> HeadlessDevice::GetBufferContents(BufferHandle buffer) const
    {
        std::lock_guard lock(m_Mutex);
        if (!buffer.IsValid() || buffer.Index >= m_Buffers.size() || !m_Buffers[buffer.Index].Alive)
            return std::nullopt;
        return m_Buffers[buffer.Index].Contents;
    }

    std::optional<RenderPipelineDescriptor> HeadlessDevice::GetPipelineDescriptor(RenderPipelineHandle pipeline) const
    {
        std::lock_guard lock(m_Mutex);
        if (!pipeline.IsValid() || pipeline.Index >= m_Pipelines.size())
            return std::nullopt;
        return m_Pipelines[pipeline.Index];
    }
}
