module;
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

export module Graphics:ShaderLibrary;

import Core;
import RHI;

export namespace Graphics
{
    // Reference to a shader as written by a material: either "use the
    // pipeline's default", an asset path, or an already-resolved handle.
    struct ShaderRef
    {
        enum class Kind : uint8_t
        {
            Default,
            Path,
            Handle
        };

        Kind Type = Kind::Default;
        std::string Path;
        RHI::ShaderHandle Handle{};

        [[nodiscard]] static ShaderRef Default() { return {}; }
        [[nodiscard]] static ShaderRef FromPath(std::string path) { return {Kind::Path, std::move(path), {}}; }
        [[nodiscard]] static ShaderRef FromHandle(RHI::ShaderHandle handle) { return {Kind::Handle, {}, handle}; }

        [[nodiscard]] bool IsDefault() const { return Type == Kind::Default; }

        bool operator==(const ShaderRef&) const = default;
    };

    // -------------------------------------------------------------------------
    // ShaderLibrary
    // -------------------------------------------------------------------------
    // Maps shader asset paths to stable ShaderHandles. Loading the same path
    // twice returns the same handle, so pipeline descriptors built from equal
    // inputs compare equal. Named entries ("Mesh2D.Vert") let the engine
    // refer to built-in shaders without hard-coding their paths.
    // -------------------------------------------------------------------------
    class ShaderLibrary
    {
    public:
        [[nodiscard]] RHI::ShaderHandle Load(std::string_view path);

        [[nodiscard]] std::optional<RHI::ShaderHandle> Find(std::string_view path) const;
        [[nodiscard]] std::optional<std::string> GetPath(RHI::ShaderHandle handle) const;

        void Register(Core::Hash::StringID name, std::string path);
        [[nodiscard]] std::optional<std::string> GetNamed(Core::Hash::StringID name) const;

        // Returns nullopt for ShaderRef::Default, so the caller keeps its own shader.
        [[nodiscard]] std::optional<RHI::ShaderHandle> Resolve(const ShaderRef& ref);

        [[nodiscard]] size_t Size() const;

    private:
        mutable std::shared_mutex m_Mutex;
        std::vector<std::string> m_Paths; // Index = ShaderHandle::Index
        std::unordered_map<std::string, uint32_t> m_PathToIndex;
        std::unordered_map<Core::Hash::StringID, std::string> m_Named;
    };
}
