module;
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

export module Graphics:Material2D;

import Core;
import RHI;
import :Images;
import :Mesh2D;
import :PipelineCache;
import :ShaderLibrary;

export namespace Graphics
{
    enum class AlphaMode2D : uint8_t
    {
        Opaque,
        Blend
    };

    enum class AsBindGroupError : uint8_t
    {
        // A resource the material references is not on the GPU yet.
        RetryNextUpdate,
        // The bindings do not match the material's layout.
        InvalidBinding
    };

    [[nodiscard]] constexpr std::string_view AsBindGroupErrorToString(AsBindGroupError e) noexcept
    {
        switch (e)
        {
        case AsBindGroupError::RetryNextUpdate: return "RetryNextUpdate";
        case AsBindGroupError::InvalidBinding: return "InvalidBinding";
        }
        return "Unknown";
    }

    struct OwnedBinding
    {
        uint32_t Binding = 0;
        RHI::BindingResource Resource;
    };

    // -------------------------------------------------------------------------
    // BindGroupAllocation
    // -------------------------------------------------------------------------
    // Owns the device objects created for one material bind group: its uniform
    // buffers and the bind group itself. Both are released on destruction or
    // when a new allocation is move-assigned over this one. Texture views and
    // samplers are borrowed from images and are not owned.
    //
    // The device must outlive every allocation made on it.
    // -------------------------------------------------------------------------
    class BindGroupAllocation
    {
    public:
        BindGroupAllocation() = default;
        explicit BindGroupAllocation(RHI::IRenderDevice& device) : m_Device(&device) {}

        ~BindGroupAllocation() { Release(); }

        BindGroupAllocation(const BindGroupAllocation&) = delete;
        BindGroupAllocation& operator=(const BindGroupAllocation&) = delete;

        BindGroupAllocation(BindGroupAllocation&& other) noexcept
            : m_Device(std::exchange(other.m_Device, nullptr))
            , m_BindGroup(std::exchange(other.m_BindGroup, {}))
            , m_Buffers(std::move(other.m_Buffers))
        {
            other.m_Buffers.clear();
        }

        BindGroupAllocation& operator=(BindGroupAllocation&& other) noexcept
        {
            if (this != &other)
            {
                Release();
                m_Device = std::exchange(other.m_Device, nullptr);
                m_BindGroup = std::exchange(other.m_BindGroup, {});
                m_Buffers = std::move(other.m_Buffers);
                other.m_Buffers.clear();
            }
            return *this;
        }

        void AddBuffer(RHI::BufferHandle buffer) { m_Buffers.push_back(buffer); }
        void SetBindGroup(RHI::BindGroupHandle bindGroup) { m_BindGroup = bindGroup; }

        [[nodiscard]] RHI::BindGroupHandle GetBindGroup() const { return m_BindGroup; }
        [[nodiscard]] std::span<const RHI::BufferHandle> GetBuffers() const { return m_Buffers; }

        void Release()
        {
            if (!m_Device)
                return;
            if (m_BindGroup.IsValid())
                m_Device->DestroyBindGroup(m_BindGroup);
            for (RHI::BufferHandle buffer : m_Buffers)
                m_Device->DestroyBuffer(buffer);
            m_BindGroup = {};
            m_Buffers.clear();
        }

    private:
        RHI::IRenderDevice* m_Device = nullptr;
        RHI::BindGroupHandle m_BindGroup{};
        std::vector<RHI::BufferHandle> m_Buffers;
    };

    // Output of Material::AsBindGroup(). Bindings are ordered by binding index.
    // Move-only: Allocation releases the device objects when it goes away.
    template <typename Data>
    struct PreparedBindGroup
    {
        std::vector<OwnedBinding> Bindings;
        RHI::BindGroupHandle BindGroup{};
        Data Key{};
        BindGroupAllocation Allocation;
    };

    // GPU context available while building a material's bind group.
    struct AsBindGroupContext
    {
        RHI::IRenderDevice& Device;
        RHI::BindGroupLayoutHandle Layout;
        const RenderImages& Images;
        const FallbackImage& Fallback;
    };

    // Specialization key of a material pipeline: mesh/view bits plus the
    // material's own bind-group key.
    template <typename M>
    struct Material2DKey
    {
        Mesh2DPipelineKey MeshKey;
        typename M::Data BindGroupData;

        bool operator==(const Material2DKey&) const = default;
    };

    template <typename T>
    concept BindGroupKey = std::copy_constructible<T> && std::equality_comparable<T> &&
        requires(const T& t)
        {
            { std::hash<T>{}(t) } -> std::convertible_to<size_t>;
        };

    // -------------------------------------------------------------------------
    // Material2D
    // -------------------------------------------------------------------------
    // Required:
    //   using Data = ...;                                  // bind-group key
    //   static RHI::BindGroupLayoutDesc BindGroupLayout();
    //   std::expected<PreparedBindGroup<Data>, AsBindGroupError>
    //       AsBindGroup(const AsBindGroupContext&) const;
    //
    // Optional (defaults in brackets):
    //   static ShaderRef VertexShader();                   [engine default]
    //   static ShaderRef FragmentShader();                 [engine default]
    //   AlphaMode2D AlphaMode() const;                     [Opaque]
    //   float DepthBias() const;                           [0]
    //   static std::expected<void, SpecializeError> Specialize(
    //       RHI::RenderPipelineDescriptor&, const RHI::VertexBufferLayout&,
    //       const Material2DKey<M>&);                      [no-op]
    // -------------------------------------------------------------------------
    template <typename M>
    concept HasSpecializeHook = requires(RHI::RenderPipelineDescriptor& descriptor,
                                         const RHI::VertexBufferLayout& layout,
                                         const Material2DKey<M>& key)
    {
        M::Specialize(descriptor, layout, key);
    };

    // A declared hook must return exactly std::expected<void, SpecializeError>.
    template <typename M>
    concept ValidSpecializeHook = !HasSpecializeHook<M> ||
        requires(RHI::RenderPipelineDescriptor& descriptor,
                 const RHI::VertexBufferLayout& layout,
                 const Material2DKey<M>& key)
        {
            { M::Specialize(descriptor, layout, key) } -> std::same_as<std::expected<void, SpecializeError>>;
        };

    template <typename M>
    concept Material2D = std::copy_constructible<M> && BindGroupKey<typename M::Data> &&
        requires(const M& material, const AsBindGroupContext& ctx)
        {
            { M::BindGroupLayout() } -> std::same_as<RHI::BindGroupLayoutDesc>;
            { material.AsBindGroup(ctx) }
                -> std::same_as<std::expected<PreparedBindGroup<typename M::Data>, AsBindGroupError>>;
        } &&
        ValidSpecializeHook<M>;

    template <typename M>
    [[nodiscard]] ShaderRef GetVertexShader()
    {
        if constexpr (requires { { M::VertexShader() } -> std::convertible_to<ShaderRef>; })
            return M::VertexShader();
        else
            return ShaderRef::Default();
    }

    template <typename M>
    [[nodiscard]] ShaderRef GetFragmentShader()
    {
        if constexpr (requires { { M::FragmentShader() } -> std::convertible_to<ShaderRef>; })
            return M::FragmentShader();
        else
            return ShaderRef::Default();
    }

    template <typename M>
    [[nodiscard]] AlphaMode2D GetAlphaMode(const M& material)
    {
        if constexpr (requires { { material.AlphaMode() } -> std::convertible_to<AlphaMode2D>; })
            return material.AlphaMode();
        else
            return AlphaMode2D::Opaque;
    }

    template <typename M>
    [[nodiscard]] float GetDepthBias(const M& material)
    {
        if constexpr (requires { { material.DepthBias() } -> std::convertible_to<float>; })
            return material.DepthBias();
        else
            return 0.0f;
    }

    template <typename M>
    [[nodiscard]] std::expected<void, SpecializeError> SpecializeMaterial(
        RHI::RenderPipelineDescriptor& descriptor, const RHI::VertexBufferLayout& layout, const Material2DKey<M>& key)
    {
        if constexpr (HasSpecializeHook<M>)
            return M::Specialize(descriptor, layout, key);
        else
            return {};
    }

    [[nodiscard]] inline Mesh2DPipelineKey AlphaModePipelineKey(AlphaMode2D mode)
    {
        return mode == AlphaMode2D::Blend ? Mesh2DPipelineKey::BlendAlphaFlag() : Mesh2DPipelineKey{};
    }
}

template <typename M>
struct std::hash<Graphics::Material2DKey<M>>
{
    std::size_t operator()(const Graphics::Material2DKey<M>& key) const noexcept
    {
        return Core::Hash::HashAll(key.MeshKey, key.BindGroupData);
    }
};
