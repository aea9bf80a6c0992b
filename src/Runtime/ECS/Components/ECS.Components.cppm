export module ECS:Components;
export import :Components.NameTag;
export import :Components.Transform;
export import :Components.Visibility;
