module;
#include "RHI.Vulkan.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

export module Graphics:Mesh2D;

import Core;

export namespace Graphics
{
    using MeshHandle = Core::StrongHandle<struct MeshTag>;

    namespace VertexAttributes
    {
        using namespace Core::Hash;

        inline constexpr StringID Position = "Vertex_Position"_id;
        inline constexpr StringID Normal = "Vertex_Normal"_id;
        inline constexpr StringID Uv = "Vertex_Uv"_id;
        inline constexpr StringID Tangent = "Vertex_Tangent"_id;
        inline constexpr StringID Color = "Vertex_Color"_id;
    }

    enum class Tonemapping : uint8_t
    {
        None,
        Reinhard,
        ReinhardLuminance,
        AcesFitted,
        AgX,
        SomewhatBoringDisplayTransform,
        TonyMcMapface,
        BlenderFilmic
    };

    [[nodiscard]] constexpr std::string_view TonemappingShaderDef(Tonemapping method) noexcept
    {
        switch (method)
        {
        case Tonemapping::None: return "TONEMAP_METHOD_NONE";
        case Tonemapping::Reinhard: return "TONEMAP_METHOD_REINHARD";
        case Tonemapping::ReinhardLuminance: return "TONEMAP_METHOD_REINHARD_LUMINANCE";
        case Tonemapping::AcesFitted: return "TONEMAP_METHOD_ACES_FITTED";
        case Tonemapping::AgX: return "TONEMAP_METHOD_AGX";
        case Tonemapping::SomewhatBoringDisplayTransform: return "TONEMAP_METHOD_SOMEWHAT_BORING_DISPLAY_TRANSFORM";
        case Tonemapping::TonyMcMapface: return "TONEMAP_METHOD_TONY_MC_MAPFACE";
        case Tonemapping::BlenderFilmic: return "TONEMAP_METHOD_BLENDER_FILMIC";
        }
        return "TONEMAP_METHOD_NONE";
    }

    enum class DebandDither : uint8_t
    {
        Disabled,
        Enabled
    };

    // -------------------------------------------------------------------------
    // Mesh2DPipelineKey
    // -------------------------------------------------------------------------
    // Everything that selects a distinct 2D mesh pipeline variant. Keys are
    // built from small pieces and merged with operator|:
    //
    //   auto key = Mesh2DPipelineKey::FromMsaaSamples(4)
    //            | Mesh2DPipelineKey::FromHdr(false)
    //            | Mesh2DPipelineKey::FromPrimitiveTopology(mesh.Topology);
    //
    // Flags are OR-ed. For valued fields (sample count, topology, tonemap
    // method) the right-hand operand wins when both sides set a value.
    // -------------------------------------------------------------------------
    struct Mesh2DPipelineKey
    {
        std::optional<uint32_t> MsaaSamples;
        std::optional<VkPrimitiveTopology> PrimitiveTopology;
        std::optional<Tonemapping> TonemapMethod;
        bool Hdr = false;
        bool TonemapInShader = false;
        bool DebandDither = false;
        bool BlendAlpha = false;

        [[nodiscard]] static Mesh2DPipelineKey FromMsaaSamples(uint32_t samples)
        {
            Mesh2DPipelineKey key;
            key.MsaaSamples = samples;
            return key;
        }

        [[nodiscard]] static Mesh2DPipelineKey FromHdr(bool hdr)
        {
            Mesh2DPipelineKey key;
            key.Hdr = hdr;
            return key;
        }

        [[nodiscard]] static Mesh2DPipelineKey FromPrimitiveTopology(VkPrimitiveTopology topology)
        {
            Mesh2DPipelineKey key;
            key.PrimitiveTopology = topology;
            return key;
        }

        [[nodiscard]] static Mesh2DPipelineKey FromTonemapping(Tonemapping method)
        {
            Mesh2DPipelineKey key;
            key.TonemapMethod = method;
            return key;
        }

        [[nodiscard]] static Mesh2DPipelineKey TonemapInShaderFlag()
        {
            Mesh2DPipelineKey key;
            key.TonemapInShader = true;
            return key;
        }

        [[nodiscard]] static Mesh2DPipelineKey DebandDitherFlag()
        {
            Mesh2DPipelineKey key;
            key.DebandDither = true;
            return key;
        }

        [[nodiscard]] static Mesh2DPipelineKey BlendAlphaFlag()
        {
            Mesh2DPipelineKey key;
            key.BlendAlpha = true;
            return key;
        }

        [[nodiscard]] uint32_t GetMsaaSamples() const { return MsaaSamples.value_or(1u); }

        [[nodiscard]] VkPrimitiveTopology GetPrimitiveTopology() const
        {
            return PrimitiveTopology.value_or(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST);
        }

        [[nodiscard]] Tonemapping GetTonemapMethod() const { return TonemapMethod.value_or(Tonemapping::None); }

        Mesh2DPipelineKey& operator|=(const Mesh2DPipelineKey& rhs)
        {
            if (rhs.MsaaSamples) MsaaSamples = rhs.MsaaSamples;
            if (rhs.PrimitiveTopology) PrimitiveTopology = rhs.PrimitiveTopology;
            if (rhs.TonemapMethod) TonemapMethod = rhs.TonemapMethod;
            Hdr = Hdr || rhs.Hdr;
            TonemapInShader = TonemapInShader || rhs.TonemapInShader;
            DebandDither = DebandDither || rhs.DebandDither;
            BlendAlpha = BlendAlpha || rhs.BlendAlpha;
            return *this;
        }

        [[nodiscard]] Mesh2DPipelineKey operator|(const Mesh2DPipelineKey& rhs) const
        {
            Mesh2DPipelineKey result = *this;
            result |= rhs;
            return result;
        }

        bool operator==(const Mesh2DPipelineKey&) const = default;
    };

    [[nodiscard]] inline Mesh2DPipelineKey TonemappingPipelineKey(Tonemapping method)
    {
        return Mesh2DPipelineKey::FromTonemapping(method);
    }
}

template <>
struct std::hash<Graphics::Mesh2DPipelineKey>
{
    std::size_t operator()(const Graphics::Mesh2DPipelineKey& key) const noexcept
    {
        return Core::Hash::HashAll(key.MsaaSamples, key.PrimitiveTopology, key.TonemapMethod,
                                   key.Hdr, key.TonemapInShader, key.DebandDither, key.BlendAlpha);
    }
};
