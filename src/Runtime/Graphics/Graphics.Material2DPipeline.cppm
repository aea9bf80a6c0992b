module;
#include <expected>
#include <optional>
#include <utility>
#include <vector>

export module Graphics:Material2DPipeline;

import Core;
import RHI;
import :Images;
import :Material2D;
import :Mesh2D;
import :Mesh2DPipeline;
import :PipelineCache;
import :RenderAssets;
import :ShaderLibrary;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // Material2DPipeline<M>
    // -------------------------------------------------------------------------
    // Specializer for one material type. Builds on the shared Mesh2DPipeline:
    // swaps in the material's shaders, appends the material bind group layout
    // as group 2 and lets the material patch the descriptor.
    // -------------------------------------------------------------------------
    template <Material2D M>
    class Material2DPipeline
    {
    public:
        using Key = Material2DKey<M>;

        Material2DPipeline(const Mesh2DPipeline& meshPipeline, RHI::IRenderDevice& device, ShaderLibrary& shaders)
            : m_Mesh2DPipeline(meshPipeline)
            , m_Material2DLayout(device.CreateBindGroupLayout(M::BindGroupLayout()))
            , m_VertexShader(shaders.Resolve(GetVertexShader<M>()))
            , m_FragmentShader(shaders.Resolve(GetFragmentShader<M>()))
        {
        }

        [[nodiscard]] std::expected<RHI::RenderPipelineDescriptor, SpecializeError> Specialize(
            const Key& key, const RHI::VertexBufferLayout& layout) const
        {
            auto descriptor = m_Mesh2DPipeline.Specialize(key.MeshKey, layout);
            if (!descriptor)
                return std::unexpected(std::move(descriptor.error()));

            if (m_VertexShader)
                descriptor->Vertex.Shader = *m_VertexShader;

            if (m_FragmentShader)
            {
                if (!descriptor->Fragment)
                {
                    return std::unexpected(SpecializeError{
                        Core::ErrorCode::InvalidState, "Material overrides the fragment shader of a pipeline without a fragment stage"});
                }
                descriptor->Fragment->Stage.Shader = *m_FragmentShader;
            }

            descriptor->Layout = {
                m_Mesh2DPipeline.GetViewLayout(),
                m_Mesh2DPipeline.GetMeshLayout(),
                m_Material2DLayout,
            };

            if (auto result = SpecializeMaterial<M>(*descriptor, layout, key); !result)
                return std::unexpected(std::move(result.error()));

            return descriptor;
        }

        [[nodiscard]] RHI::BindGroupLayoutHandle GetMaterialLayout() const { return m_Material2DLayout; }
        [[nodiscard]] const Mesh2DPipeline& GetMeshPipeline() const { return m_Mesh2DPipeline; }

    private:
        const Mesh2DPipeline& m_Mesh2DPipeline;
        RHI::BindGroupLayoutHandle m_Material2DLayout{};
        std::optional<RHI::ShaderHandle> m_VertexShader;
        std::optional<RHI::ShaderHandle> m_FragmentShader;
    };

    // Material-level state that feeds pipeline selection and phase assignment.
    struct Material2DProperties
    {
        AlphaMode2D AlphaMode = AlphaMode2D::Opaque;
        float DepthBias = 0.0f;
        Mesh2DPipelineKey MeshPipelineKeyBits;

        bool operator==(const Material2DProperties&) const = default;
    };

    template <Material2D M>
    struct Material2DPrepareParam
    {
        RHI::IRenderDevice& Device;
        const RenderImages& Images;
        const FallbackImage& Fallback;
        const Material2DPipeline<M>& Pipeline;
    };

    // GPU-ready form of a material asset. Move-only; replacing or erasing an
    // entry releases its uniform buffers and bind group.
    template <Material2D M>
    struct PreparedMaterial2D
    {
        using SourceAsset = M;
        using Param = Material2DPrepareParam<M>;

        std::vector<OwnedBinding> Bindings;
        RHI::BindGroupHandle BindGroup{};
        typename M::Data Key{};
        Material2DProperties Properties;
        BindGroupAllocation Allocation;

        [[nodiscard]] std::optional<RHI::BindGroupHandle> GetBindGroupId() const
        {
            if (!BindGroup.IsValid())
                return std::nullopt;
            return BindGroup;
        }

        static std::expected<PreparedMaterial2D, PrepareAssetError<M>> PrepareAsset(M material, Param& param)
        {
            const AsBindGroupContext ctx{
                .Device = param.Device,
                .Layout = param.Pipeline.GetMaterialLayout(),
                .Images = param.Images,
                .Fallback = param.Fallback,
            };

            auto prepared = material.AsBindGroup(ctx);
            if (!prepared)
            {
                if (prepared.error() == AsBindGroupError::RetryNextUpdate)
                    return std::unexpected(PrepareAssetError<M>::RetryNextUpdate(std::move(material)));
                return std::unexpected(PrepareAssetError<M>::Failed(Core::ErrorCode::BindGroupCreationFailed));
            }

            const AlphaMode2D alphaMode = GetAlphaMode(material);
            return PreparedMaterial2D{
                .Bindings = std::move(prepared->Bindings),
                .BindGroup = prepared->BindGroup,
                .Key = std::move(prepared->Key),
                .Properties = Material2DProperties{
                    .AlphaMode = alphaMode,
                    .DepthBias = GetDepthBias(material),
                    .MeshPipelineKeyBits = AlphaModePipelineKey(alphaMode),
                },
                .Allocation = std::move(prepared->Allocation),
            };
        }
    };

    template <Material2D M>
    using RenderMaterials2D = RenderAssets<PreparedMaterial2D<M>>;

    // Prepares one source material. Retry errors carry the material back.
    template <Material2D M>
    [[nodiscard]] std::expected<PreparedMaterial2D<M>, PrepareAssetError<M>> PrepareMaterial2D(
        M material, Material2DPrepareParam<M>& param)
    {
        return PreparedMaterial2D<M>::PrepareAsset(std::move(material), param);
    }
}
