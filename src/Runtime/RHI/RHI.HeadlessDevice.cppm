module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module RHI:HeadlessDevice;

import Core;
import :Types;
import :Pipeline;
import :Device;

export namespace RHI
{
    // -------------------------------------------------------------------------
    // HeadlessDevice
    // -------------------------------------------------------------------------
    // CPU-only IRenderDevice. Allocates handles, validates inputs the way a
    // real backend would and keeps enough bookkeeping for inspection. Used by
    // the sandbox and by tests; no GPU work is ever issued.
    // -------------------------------------------------------------------------
    class HeadlessDevice final : public IRenderDevice
    {
    public:
        HeadlessDevice() = default;

        HeadlessDevice(const HeadlessDevice&) = delete;
        HeadlessDevice& operator=(const HeadlessDevice&) = delete;

        [[nodiscard]] BindGroupLayoutHandle CreateBindGroupLayout(const BindGroupLayoutDesc& desc) override;

        [[nodiscard]] Core::Expected<BindGroupHandle> CreateBindGroup(
            BindGroupLayoutHandle layout, std::span<const BindGroupEntry> entries) override;

        [[nodiscard]] BufferHandle CreateUniformBuffer(std::span<const std::byte> contents,
                                                       std::string_view label) override;

        [[nodiscard]] TextureViewHandle CreateTextureView(VkFormat format, uint32_t width, uint32_t height,
                                                          std::string_view label) override;

        [[nodiscard]] SamplerHandle CreateSampler(std::string_view label) override;

        [[nodiscard]] Core::Expected<RenderPipelineHandle> CreateRenderPipeline(
            const RenderPipelineDescriptor& descriptor) override;

        void DestroyBuffer(BufferHandle buffer) override;
        void DestroyBindGroup(BindGroupHandle bindGroup) override;

        // --- Inspection ---
        // Buffer and bind group counts only include live (not destroyed) objects.
        [[nodiscard]] uint32_t GetBindGroupCount() const;
        [[nodiscard]] uint32_t GetPipelineCount() const;
        [[nodiscard]] uint32_t GetBufferCount() const;
        // nullopt for unknown or destroyed buffers.
        [[nodiscard]] std::optional<std::vector<std::byte>> GetBufferContents(BufferHandle buffer) const;
        [[nodiscard]] std::optional<RenderPipelineDescriptor> GetPipelineDescriptor(RenderPipelineHandle pipeline) const;

    private:
        struct BufferSlot
        {
            std::vector<std::byte> Contents;
            bool Alive = true;
        };

        mutable std::mutex m_Mutex;

        uint32_t m_NextTextureView = 0;
        uint32_t m_NextSampler = 0;
        uint32_t m_LiveBuffers = 0;
        uint32_t m_LiveBindGroups = 0;

        std::vector<std::vector<BindGroupLayoutEntry>> m_Layouts;
        std::vector<BufferSlot> m_Buffers;
        std::vector<bool> m_BindGroups; // Alive flag per bind group index
        std::vector<RenderPipelineDescriptor> m_Pipelines;
    };
}
