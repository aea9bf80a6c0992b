module;
#include <cstdint>
#include <optional>
#include <vector>
#include <entt/entity/registry.hpp>

export module Graphics:View2D;

import :Mesh2D;

export namespace Graphics
{
    // Render-side snapshot of one 2D camera for the current frame.
    struct ExtractedView2D
    {
        entt::entity View = entt::null;
        bool Hdr = false;
        uint32_t MsaaSamples = 1;
        std::optional<Tonemapping> TonemappingMethod;
        DebandDither Dither = DebandDither::Disabled;
        std::vector<entt::entity> VisibleEntities;
    };

    // Collects every active camera that has a visible-entity list. Cameras
    // with an unsupported MSAA sample count fall back to 1 sample.
    [[nodiscard]] std::vector<ExtractedView2D> ExtractViews2D(const entt::registry& registry);

    // Pipeline key bits owned by a view. In-shader tonemapping and dither are
    // suppressed for HDR views; those are tonemapped in a later pass.
    [[nodiscard]] Mesh2DPipelineKey MakeViewKey(const ExtractedView2D& view);
}
