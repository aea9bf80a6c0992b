module;
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

export module Graphics:PipelineCache;

import Core;
import RHI;

export namespace Graphics
{
    // Reported by pipeline specializers. Specialization failures are
    // recoverable: the caller logs them and skips the affected draw.
    struct SpecializeError
    {
        Core::ErrorCode Code = Core::ErrorCode::SpecializationFailed;
        std::string Detail;
    };

    using CachedRenderPipelineId = Core::StrongHandle<struct CachedRenderPipelineTag>;

    enum class CachedPipelineState : uint8_t
    {
        Queued,
        Ok,
        Err
    };

    // -------------------------------------------------------------------------
    // PipelineCache
    // -------------------------------------------------------------------------
    // Two-phase pipeline creation. Queue() hands out an id immediately and can
    // be called from any thread; ProcessQueue() compiles everything queued so
    // far on the device. A draw whose pipeline is not compiled yet is skipped
    // by the renderer until GetRenderPipeline() returns a handle.
    // -------------------------------------------------------------------------
    class PipelineCache
    {
    public:
        explicit PipelineCache(RHI::IRenderDevice& device);

        PipelineCache(const PipelineCache&) = delete;
        PipelineCache& operator=(const PipelineCache&) = delete;

        [[nodiscard]] CachedRenderPipelineId Queue(RHI::RenderPipelineDescriptor descriptor);

        // Compiles every queued pipeline. Returns the number that compiled successfully.
        uint32_t ProcessQueue();

        [[nodiscard]] std::optional<RHI::RenderPipelineHandle> GetRenderPipeline(CachedRenderPipelineId id) const;
        [[nodiscard]] std::optional<CachedPipelineState> GetState(CachedRenderPipelineId id) const;
        [[nodiscard]] std::optional<RHI::RenderPipelineDescriptor> GetDescriptor(CachedRenderPipelineId id) const;

        [[nodiscard]] size_t Size() const;
        [[nodiscard]] size_t QueuedCount() const;

        // Drops every entry. Ids handed out before the call stop resolving.
        void Clear();

    private:
        struct Entry
        {
            RHI::RenderPipelineDescriptor Descriptor;
            CachedPipelineState State = CachedPipelineState::Queued;
            RHI::RenderPipelineHandle Pipeline{};
            Core::ErrorCode Error = Core::ErrorCode::Success;
        };

        [[nodiscard]] const Entry* FindEntry(CachedRenderPipelineId id) const;

        RHI::IRenderDevice& m_Device;

        mutable std::shared_mutex m_Mutex;
        std::deque<Entry> m_Entries;
        std::vector<CachedRenderPipelineId> m_Waiting;
        uint32_t m_Generation = 1;
    };

    // A base pipeline that turns (Key, vertex layout) into a descriptor.
    template <typename S>
    concept SpecializedMeshPipeline = requires(const S& specializer,
                                               const typename S::Key& key,
                                               const RHI::VertexBufferLayout& layout)
    {
        typename S::Key;
        requires std::equality_comparable<typename S::Key>;
        { std::hash<typename S::Key>{}(key) } -> std::convertible_to<size_t>;
        { specializer.Specialize(key, layout) }
            -> std::same_as<std::expected<RHI::RenderPipelineDescriptor, SpecializeError>>;
    };

    // -------------------------------------------------------------------------
    // SpecializedMeshPipelines
    // -------------------------------------------------------------------------
    // Memoizes (Key, vertex layout) -> CachedRenderPipelineId for one
    // specializer. A given pair is specialized at most once; later lookups
    // return the same id. Errors are not cached, so a failed specialization
    // is retried the next time the pair is requested. An id the PipelineCache
    // no longer knows (after PipelineCache::Clear()) is dropped and the pair
    // is specialized again.
    //
    // The specializer runs under this memo's exclusive lock. It must not call
    // back into the same SpecializedMeshPipelines instance.
    // -------------------------------------------------------------------------
    template <SpecializedMeshPipeline S>
    class SpecializedMeshPipelines
    {
    public:
        using Key = typename S::Key;

        [[nodiscard]] std::expected<CachedRenderPipelineId, SpecializeError> Specialize(
            PipelineCache& cache, const S& specializer, const Key& key, const RHI::VertexBufferLayout& layout)
        {
            CacheKey cacheKey{key, layout};
            {
                std::shared_lock lock(m_Mutex);
                if (auto it = m_Cache.find(cacheKey); it != m_Cache.end() && cache.GetState(it->second))
                    return it->second;
            }

            std::unique_lock lock(m_Mutex);
            if (auto it = m_Cache.find(cacheKey); it != m_Cache.end())
            {
                if (cache.GetState(it->second))
                    return it->second;
                m_Cache.erase(it); // Stale: the cache was cleared
            }

            auto descriptor = specializer.Specialize(key, layout);
            if (!descriptor)
                return std::unexpected(std::move(descriptor.error()));

            const CachedRenderPipelineId id = cache.Queue(std::move(*descriptor));
            m_Cache.emplace(std::move(cacheKey), id);
            return id;
        }

        [[nodiscard]] size_t Size() const
        {
            std::shared_lock lock(m_Mutex);
            return m_Cache.size();
        }

        void Clear()
        {
            std::unique_lock lock(m_Mutex);
            m_Cache.clear();
        }

    private:
        struct CacheKey
        {
            Key PipelineKey;
            RHI::VertexBufferLayout Layout;

            bool operator==(const CacheKey&) const = default;
        };

        struct CacheKeyHash
        {
            size_t operator()(const CacheKey& k) const noexcept
            {
                return Core::Hash::HashAll(k.PipelineKey, k.Layout);
            }
        };

        mutable std::shared_mutex m_Mutex;
        std::unordered_map<CacheKey, CachedRenderPipelineId, CacheKeyHash> m_Cache;
    };
}
