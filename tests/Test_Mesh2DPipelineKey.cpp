#include <gtest/gtest.h>
#include <functional>
#include <optional>
#include <unordered_set>
#include "RHI.Vulkan.hpp"

import Graphics;

using namespace Graphics;

// -----------------------------------------------------------------------------
// Composition
// -----------------------------------------------------------------------------

TEST(Mesh2DPipelineKey, DefaultsWhenUnset)
{
    Mesh2DPipelineKey key;
    EXPECT_EQ(key.GetMsaaSamples(), 1u);
    EXPECT_EQ(key.GetPrimitiveTopology(), VK_PRIMITIVE_TOPOLOGY_TRIANGLE_LIST);
    EXPECT_EQ(key.GetTonemapMethod(), Tonemapping::None);
    EXPECT_FALSE(key.Hdr);
    EXPECT_FALSE(key.BlendAlpha);
}

TEST(Mesh2DPipelineKey, OrCombinesFlagsAndValues)
{
    Mesh2DPipelineKey key = Mesh2DPipelineKey::FromMsaaSamples(4)
                          | Mesh2DPipelineKey::FromHdr(true)
                          | Mesh2DPipelineKey::FromPrimitiveTopology(VK_PRIMITIVE_TOPOLOGY_LINE_LIST)
                          | Mesh2DPipelineKey::BlendAlphaFlag();

    EXPECT_EQ(key.GetMsaaSamples(), 4u);
    EXPECT_TRUE(key.Hdr);
    EXPECT_EQ(key.GetPrimitiveTopology(), VK_PRIMITIVE_TOPOLOGY_LINE_LIST);
    EXPECT_TRUE(key.BlendAlpha);
    EXPECT_FALSE(key.TonemapInShader);
}

TEST(Mesh2DPipelineKey, OrIsCommutativeForDisjointParts)
{
    Mesh2DPipelineKey a = Mesh2DPipelineKey::FromMsaaSamples(4) | Mesh2DPipelineKey::DebandDitherFlag();
    Mesh2DPipelineKey b = Mesh2DPipelineKey::BlendAlphaFlag()
                        | Mesh2DPipelineKey::FromPrimitiveTopology(VK_PRIMITIVE_TOPOLOGY_TRIANGLE_STRIP);

    EXPECT_EQ(a | b, b | a);
}

TEST(Mesh2DPipelineKey, RightHandValueWins)
{
    Mesh2DPipelineKey key = Mesh2DPipelineKey::FromMsaaSamples(4) | Mesh2DPipelineKey::FromMsaaSamples(8);
    EXPECT_EQ(key.GetMsaaSamples(), 8u);
}

TEST(Mesh2DPipelineKey, FlagsNeverClearEachOther)
{
    Mesh2DPipelineKey key = Mesh2DPipelineKey::BlendAlphaFlag() | Mesh2DPipelineKey{};
    EXPECT_TRUE(key.BlendAlpha);
}

TEST(Mesh2DPipelineKey, StructuralEqualityAndHash)
{
    auto build = [] {
        return Mesh2DPipelineKey::FromMsaaSamples(4)
             | Mesh2DPipelineKey::TonemapInShaderFlag()
             | TonemappingPipelineKey(Tonemapping::TonyMcMapface);
    };

    EXPECT_EQ(build(), build());
    EXPECT_EQ(std::hash<Mesh2DPipelineKey>{}(build()), std::hash<Mesh2DPipelineKey>{}(build()));

    std::unordered_set<Mesh2DPipelineKey> keys;
    keys.insert(build());
    keys.insert(build());
    keys.insert(build() | Mesh2DPipelineKey::BlendAlphaFlag());
    EXPECT_EQ(keys.size(), 2u);
}

TEST(Mesh2DPipelineKey, UnsetDiffersFromExplicitDefault)
{
    // An explicitly requested single sample is still a different key part than "not specified".
    EXPECT_NE(Mesh2DPipelineKey{}, Mesh2DPipelineKey::FromMsaaSamples(1));
}

TEST(Mesh2DPipelineKey, AlphaModeBits)
{
    EXPECT_TRUE(AlphaModePipelineKey(AlphaMode2D::Blend).BlendAlpha);
    EXPECT_EQ(AlphaModePipelineKey(AlphaMode2D::Opaque), Mesh2DPipelineKey{});
}

TEST(Mesh2DPipelineKey, TonemappingShaderDefs)
{
    EXPECT_EQ(TonemappingShaderDef(Tonemapping::None), "TONEMAP_METHOD_NONE");
    EXPECT_EQ(TonemappingShaderDef(Tonemapping::AgX), "TONEMAP_METHOD_AGX");
    EXPECT_EQ(TonemappingShaderDef(Tonemapping::TonyMcMapface), "TONEMAP_METHOD_TONY_MC_MAPFACE");
    EXPECT_EQ(TonemappingShaderDef(Tonemapping::BlenderFilmic), "TONEMAP_METHOD_BLENDER_FILMIC");
}

// -----------------------------------------------------------------------------
// View keys
// -----------------------------------------------------------------------------

namespace
{
    ExtractedView2D MakeView(bool hdr, std::optional<Tonemapping> tonemapping, DebandDither dither)
    {
        ExtractedView2D view;
        view.Hdr = hdr;
        view.MsaaSamples = 4;
        view.TonemappingMethod = tonemapping;
        view.Dither = dither;
        return view;
    }
}

TEST(ViewKey, SdrViewTonemapsInShader)
{
    Mesh2DPipelineKey key = MakeViewKey(MakeView(false, Tonemapping::AcesFitted, DebandDither::Disabled));

    EXPECT_TRUE(key.TonemapInShader);
    EXPECT_EQ(key.GetTonemapMethod(), Tonemapping::AcesFitted);
    EXPECT_FALSE(key.Hdr);
    EXPECT_EQ(key.GetMsaaSamples(), 4u);
}

TEST(ViewKey, HdrViewSuppressesInShaderTonemapping)
{
    Mesh2DPipelineKey key = MakeViewKey(MakeView(true, Tonemapping::AcesFitted, DebandDither::Enabled));

    EXPECT_TRUE(key.Hdr);
    EXPECT_FALSE(key.TonemapInShader);
    EXPECT_FALSE(key.TonemapMethod.has_value());
    EXPECT_FALSE(key.DebandDither);
}

TEST(ViewKey, HdrAndSdrViewsProduceDifferentKeys)
{
    const auto sdr = MakeViewKey(MakeView(false, Tonemapping::Reinhard, DebandDither::Disabled));
    const auto hdr = MakeViewKey(MakeView(true, Tonemapping::Reinhard, DebandDither::Disabled));
    EXPECT_NE(sdr, hdr);
}

TEST(ViewKey, NoTonemappingMethodMeansNoFlag)
{
    Mesh2DPipelineKey key = MakeViewKey(MakeView(false, std::nullopt, DebandDither::Enabled));

    EXPECT_FALSE(key.TonemapInShader);
    EXPECT_TRUE(key.DebandDither);
}
