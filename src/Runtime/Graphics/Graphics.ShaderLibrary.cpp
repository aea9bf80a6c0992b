module;
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>

module Graphics:ShaderLibrary.Impl;
import :ShaderLibrary;
import Core;
import RHI;

namespace Graphics
{
    RHI::ShaderHandle ShaderLibrary::Load(std::string_view path)
    {
        {
            std::shared_lock lock(m_Mutex);
            if (auto it = m_PathToIndex.find(std::string(path)); it != m_PathToIndex.end())
                return {it->second, 1u};
        }

        std::unique_lock lock(m_Mutex);
        auto [it, inserted] = m_PathToIndex.try_emplace(std::string(path), static_cast<uint32_t>(m_Paths.size()));
        if (inserted)
        {
            m_Paths.emplace_back(path);
            Core::Log::Debug("[ShaderLibrary] Registered '{}' as shader #{}", path, it->second);
        }
        return {it->second, 1u};
    }

    std::optional<RHI::ShaderHandle> ShaderLibrary::Find(std::string_view path) const
    {
        std::shared_lock lock(m_Mutex);
        auto it = m_PathToIndex.find(std::string(path));
        if (it == m_PathToIndex.end())
            return std::nullopt;
        return RHI::ShaderHandle{it->second, 1u};
    }

    std::optional<std::string> ShaderLibrary::GetPath(RHI::ShaderHandle handle) const
    {
        std::shared_lock lock(m_Mutex);
        if (!handle.IsValid() || handle.Index >= m_Paths.size())
            return std::nullopt;
        return m_Paths[handle.Index];
    }

    void ShaderLibrary::Register(Core::Hash::StringID name, std::string path)
    {
        std::unique_lock lock(m_Mutex);
        m_Named[name] = std::move(path);
    }

    std::optional<std::string> ShaderLibrary::GetNamed(Core::Hash::StringID name) const
    {
        std::shared_lock lock(m_Mutex);
        auto it = m_Named.find(name);
        if (it != m_Named.end())
            return it->second;
        return std::nullopt;
    }

    std::optional<RHI::ShaderHandle> ShaderLibrary::Resolve(const ShaderRef& ref)
    {
        switch (ref.Type)
        {
        case ShaderRef::Kind::Path: return Load(ref.Path);
        case ShaderRef::Kind::Handle: return ref.Handle;
        case ShaderRef::Kind::Default: break;
        }
        return std::nullopt;
    }

    size_t ShaderLibrary::Size() const
    {
        std::shared_lock lock(m_Mutex);
        return m_Paths.size();
    }
}
