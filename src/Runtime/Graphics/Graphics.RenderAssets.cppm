module;
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

export module Graphics:RenderAssets;

import Core;

export namespace Graphics
{
    enum class PrepareAssetErrorKind : uint8_t
    {
        // Dependencies are not ready; the source is handed back for another attempt.
        RetryNextUpdate,
        // Preparation failed for good. The source version is dropped.
        Failed
    };

    template <typename S>
    struct PrepareAssetError
    {
        PrepareAssetErrorKind Kind = PrepareAssetErrorKind::RetryNextUpdate;
        std::optional<S> Source;
        Core::ErrorCode Code = Core::ErrorCode::ResourceNotReady;

        [[nodiscard]] static PrepareAssetError RetryNextUpdate(S source)
        {
            return {PrepareAssetErrorKind::RetryNextUpdate, std::move(source), Core::ErrorCode::ResourceNotReady};
        }

        [[nodiscard]] static PrepareAssetError Failed(Core::ErrorCode code)
        {
            return {PrepareAssetErrorKind::Failed, std::nullopt, code};
        }
    };

    // A GPU-side form of a source asset, produced by PrepareAsset().
    template <typename P>
    concept RenderAsset = requires(typename P::SourceAsset source, typename P::Param& param)
    {
        typename P::SourceAsset;
        typename P::Param;
        { P::PrepareAsset(std::move(source), param) }
            -> std::same_as<std::expected<P, PrepareAssetError<typename P::SourceAsset>>>;
    };

    struct PrepareStats
    {
        uint32_t Prepared = 0;
        uint32_t Retried = 0;
        uint32_t Failed = 0;
        uint32_t Deferred = 0; // Left untouched because of the per-frame budget
    };

    // -------------------------------------------------------------------------
    // RenderAssets
    // -------------------------------------------------------------------------
    // Render-world table of prepared assets, kept in sync with an AssetStore:
    //
    //   Extract(store)  - drains the store's events. Added/Modified queue the
    //                     current value, Removed drops the prepared entry.
    //   Prepare(param)  - prepares queued values in queue order. Retries keep
    //                     their place at the front of the queue.
    //
    // A failed or retried preparation never overwrites an existing entry, so
    // the previous version keeps rendering until the new one is ready.
    // -------------------------------------------------------------------------
    template <RenderAsset P>
    class RenderAssets
    {
    public:
        using SourceAsset = typename P::SourceAsset;
        using Param = typename P::Param;
        using Id = Core::Assets::AssetId<SourceAsset>;

        // maxPreparationsPerFrame == 0 means unlimited.
        explicit RenderAssets(uint32_t maxPreparationsPerFrame = 0)
            : m_MaxPreparationsPerFrame(maxPreparationsPerFrame)
        {
        }

        // Returns the number of events consumed.
        size_t Extract(Core::Assets::AssetStore<SourceAsset>& store)
        {
            auto events = store.DrainEvents();
            for (const auto& event : events)
            {
                switch (event.Kind)
                {
                case Core::Assets::AssetEventKind::Added:
                case Core::Assets::AssetEventKind::Modified:
                    if (const SourceAsset* source = store.Get(event.Id))
                        Enqueue(event.Id, *source);
                    break;
                case Core::Assets::AssetEventKind::Removed:
                    m_Prepared.erase(event.Id);
                    RemovePending(event.Id);
                    break;
                }
            }
            return events.size();
        }

        PrepareStats Prepare(Param& param)
        {
            PrepareStats stats;

            std::deque<Pending> queue;
            queue.swap(m_Pending);

            uint32_t attempts = 0;
            while (!queue.empty())
            {
                if (m_MaxPreparationsPerFrame != 0 && attempts >= m_MaxPreparationsPerFrame)
                {
                    stats.Deferred = static_cast<uint32_t>(queue.size());
                    break;
                }

                Pending pending = std::move(queue.front());
                queue.pop_front();
                ++attempts;

                auto prepared = P::PrepareAsset(std::move(pending.Source), param);
                if (prepared)
                {
                    m_Prepared.insert_or_assign(pending.AssetId, std::move(*prepared));
                    ++stats.Prepared;
                    continue;
                }

                PrepareAssetError<SourceAsset>& error = prepared.error();
                if (error.Kind == PrepareAssetErrorKind::RetryNextUpdate && error.Source)
                {
                    m_Pending.push_back({pending.AssetId, std::move(*error.Source)});
                    ++stats.Retried;
                }
                else
                {
                    Core::Log::Error("[RenderAssets] Preparing asset {} failed: {}",
                                     pending.AssetId, Core::ErrorCodeToString(error.Code));
                    ++stats.Failed;
                }
            }

            // Budget leftovers go after this frame's retries, keeping queue order.
            for (Pending& rest : queue)
                m_Pending.push_back(std::move(rest));

            if (stats.Retried > 0 || stats.Deferred > 0)
            {
                Core::Log::Debug("[RenderAssets] {} prepared, {} retrying, {} deferred",
                                 stats.Prepared, stats.Retried, stats.Deferred);
            }
            return stats;
        }

        [[nodiscard]] const P* Get(Id id) const
        {
            auto it = m_Prepared.find(id);
            return it != m_Prepared.end() ? &it->second : nullptr;
        }

        [[nodiscard]] bool Contains(Id id) const { return m_Prepared.contains(id); }

        [[nodiscard]] bool IsPending(Id id) const
        {
            return std::any_of(m_Pending.begin(), m_Pending.end(),
                               [id](const Pending& p) { return p.AssetId == id; });
        }

        [[nodiscard]] size_t Size() const { return m_Prepared.size(); }
        [[nodiscard]] size_t PendingCount() const { return m_Pending.size(); }

        void Clear()
        {
            m_Prepared.clear();
            m_Pending.clear();
        }

    private:
        struct Pending
        {
            Id AssetId;
            SourceAsset Source;
        };

        void Enqueue(Id id, const SourceAsset& source)
        {
            // The newest value replaces an older one still waiting for preparation.
            for (Pending& pending : m_Pending)
            {
                if (pending.AssetId == id)
                {
                    pending.Source = source;
                    return;
                }
            }
            m_Pending.push_back({id, source});
        }

        void RemovePending(Id id)
        {
            std::erase_if(m_Pending, [id](const Pending& p) { return p.AssetId == id; });
        }

        uint32_t m_MaxPreparationsPerFrame = 0;
        std::unordered_map<Id, P> m_Prepared;
        std::deque<Pending> m_Pending;
    };
}
