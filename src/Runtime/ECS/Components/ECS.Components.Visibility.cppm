module;

export module ECS:Components.Visibility;

export namespace ECS::Components::Visibility
{
    // Author intent. Hidden entities are never marked visible by culling.
    struct Component
    {
        bool Hidden = false;
    };

    // Written by visibility culling each frame: true when the entity is
    // visible from at least one view. Render extraction only reads it.
    struct ViewVisibility
    {
        bool Visible = false;

        [[nodiscard]] bool Get() const { return Visible; }
    };
}
