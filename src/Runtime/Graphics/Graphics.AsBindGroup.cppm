module;
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

export module Graphics:AsBindGroup;

import Core;
import RHI;
import :Images;
import :Material2D;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // AsBindGroupBuilder
    // -------------------------------------------------------------------------
    // Turns a material's fields into a bind group:
    //
    //   return AsBindGroupBuilder(ctx)
    //       .Uniform(0, uniformData, "ColorMaterial2D")
    //       .Texture(1, Texture)
    //       .Sampler(2, Texture)
    //       .Build(Data{Texture.has_value()});
    //
    // An image handle that is not GPU-resident yet makes Build() return
    // RetryNextUpdate without touching the device. An empty slot binds the
    // fallback image.
    // -------------------------------------------------------------------------
    class AsBindGroupBuilder
    {
    public:
        explicit AsBindGroupBuilder(const AsBindGroupContext& ctx);

        AsBindGroupBuilder& Uniform(uint32_t binding, std::span<const std::byte> bytes, std::string_view label);

        template <typename T>
            requires std::is_trivially_copyable_v<T>
        AsBindGroupBuilder& Uniform(uint32_t binding, const T& value, std::string_view label)
        {
            return Uniform(binding, std::as_bytes(std::span<const T, 1>(&value, 1)), label);
        }

        AsBindGroupBuilder& Texture(uint32_t binding, std::optional<ImageHandle> image);
        AsBindGroupBuilder& Sampler(uint32_t binding, std::optional<ImageHandle> image);

        // True once any referenced image was found missing.
        [[nodiscard]] bool IsDeferred() const { return m_Deferred; }

        template <typename Data>
        [[nodiscard]] std::expected<PreparedBindGroup<Data>, AsBindGroupError> Build(Data key)
        {
            auto bindings = BuildBindings();
            if (!bindings)
                return std::unexpected(bindings.error());

            // Takes the uniform buffers first so a failed bind group releases them.
            BindGroupAllocation allocation(m_Context.Device);
            for (const OwnedBinding& binding : *bindings)
            {
                if (const auto* buffer = std::get_if<RHI::BufferHandle>(&binding.Resource))
                    allocation.AddBuffer(*buffer);
            }

            auto bindGroup = CreateBindGroup(*bindings);
            if (!bindGroup)
                return std::unexpected(bindGroup.error());

            allocation.SetBindGroup(*bindGroup);
            return PreparedBindGroup<Data>{std::move(*bindings), *bindGroup, std::move(key), std::move(allocation)};
        }

    private:
        struct PendingUniform
        {
            uint32_t Binding = 0;
            std::vector<std::byte> Bytes;
            std::string Label;
        };

        [[nodiscard]] std::expected<std::vector<OwnedBinding>, AsBindGroupError> BuildBindings();
        [[nodiscard]] std::expected<RHI::BindGroupHandle, AsBindGroupError> CreateBindGroup(
            const std::vector<OwnedBinding>& bindings);

        [[nodiscard]] const GpuImage* ResolveImage(std::optional<ImageHandle> image);

        const AsBindGroupContext& m_Context;
        std::vector<PendingUniform> m_Uniforms;
        std::vector<OwnedBinding> m_Resources;
        bool m_Deferred = false;
    };
}
