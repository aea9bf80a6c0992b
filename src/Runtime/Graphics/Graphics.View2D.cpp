module;
#include <cstdint>
#include <vector>
#include <entt/entity/registry.hpp>

module Graphics:View2D.Impl;
import :View2D;
import :Components;
import :Mesh2D;
import Core;
import RHI;

namespace Graphics
{
    std::vector<ExtractedView2D> ExtractViews2D(const entt::registry& registry)
    {
        std::vector<ExtractedView2D> views;

        auto cameras = registry.view<const ECS::Camera2D::Component, const ECS::VisibleEntities::Component>();
        for (auto [entity, camera, visible] : cameras.each())
        {
            if (!camera.IsActive)
                continue;

            uint32_t samples = camera.MsaaSamples;
            if (!RHI::IsValidSampleCount(samples))
            {
                Core::Log::Warn("[View2D] Camera {} requests {} MSAA samples; using 1",
                                static_cast<uint32_t>(entity), samples);
                samples = 1;
            }

            views.push_back(ExtractedView2D{
                .View = entity,
                .Hdr = camera.Hdr,
                .MsaaSamples = samples,
                .TonemappingMethod = camera.Tonemapping,
                .Dither = camera.Dither,
                .VisibleEntities = visible.Entities,
            });
        }

        return views;
    }

    Mesh2DPipelineKey MakeViewKey(const ExtractedView2D& view)
    {
        Mesh2DPipelineKey key = Mesh2DPipelineKey::FromMsaaSamples(view.MsaaSamples)
                              | Mesh2DPipelineKey::FromHdr(view.Hdr);

        if (!view.Hdr)
        {
            if (view.TonemappingMethod)
            {
                key |= Mesh2DPipelineKey::TonemapInShaderFlag();
                key |= TonemappingPipelineKey(*view.TonemappingMethod);
            }
            if (view.Dither == DebandDither::Enabled)
                key |= Mesh2DPipelineKey::DebandDitherFlag();
        }

        return key;
    }
}
