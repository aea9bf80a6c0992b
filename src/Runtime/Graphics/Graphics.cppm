export module Graphics;

export import :Images;
export import :ShaderLibrary;
export import :Mesh2D;
export import :Components;
export import :RenderMeshes;
export import :PipelineCache;
export import :Mesh2DPipeline;
export import :View2D;
export import :RenderPhase;
export import :Material2D;
export import :AsBindGroup;
export import :RenderAssets;
export import :Material2DPipeline;
export import :Render2DWorld;
export import :Material2DPlugin;
export import :ColorMaterial;
