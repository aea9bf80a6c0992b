module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <glm/glm.hpp>

export module Graphics:Images;

import Core;
import RHI;

export namespace Graphics
{
    using ImageHandle = Core::StrongHandle<struct ImageTag>;

    struct GpuImage
    {
        RHI::TextureViewHandle View{};
        RHI::SamplerHandle Sampler{};
        VkFormat Format = VK_FORMAT_R8G8B8A8_SRGB;
        glm::uvec2 Size{1u, 1u};
    };

    // GPU-resident images keyed by their source handle. The texture uploader
    // inserts an entry once the upload for that image has completed; until
    // then lookups return nullptr and bind group creation is deferred.
    class RenderImages
    {
    public:
        void Insert(ImageHandle image, const GpuImage& gpuImage)
        {
            m_Images.insert_or_assign(image, gpuImage);
        }

        void Remove(ImageHandle image)
        {
            m_Images.erase(image);
        }

        [[nodiscard]] const GpuImage* Get(ImageHandle image) const
        {
            auto it = m_Images.find(image);
            return it != m_Images.end() ? &it->second : nullptr;
        }

        [[nodiscard]] bool Contains(ImageHandle image) const { return m_Images.contains(image); }
        [[nodiscard]] size_t Size() const { return m_Images.size(); }

    private:
        std::unordered_map<ImageHandle, GpuImage> m_Images;
    };

    // 1x1 opaque white image bound wherever a material leaves an optional
    // texture slot empty.
    struct FallbackImage
    {
        GpuImage Image;

        [[nodiscard]] static FallbackImage Create(RHI::IRenderDevice& device)
        {
            FallbackImage fallback;
            fallback.Image.Format = VK_FORMAT_R8G8B8A8_UNORM;
            fallback.Image.Size = {1u, 1u};
            fallback.Image.View = device.CreateTextureView(fallback.Image.Format, 1, 1, "FallbackImage");
            fallback.Image.Sampler = device.CreateSampler("FallbackImage.Sampler");
            return fallback;
        }
    };
}
