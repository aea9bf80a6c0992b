module;

#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <utility>
#include <vector>

export module Core:Assets;

import :Handle;

export namespace Core::Assets
{
    // Stable identifier of a source asset of type T. Generational, so an id
    // that outlived its asset never resolves to whatever reuses the slot.
    template <typename T>
    using AssetId = StrongHandle<T>;

    enum class AssetEventKind : uint8_t
    {
        Added,
        Modified,
        Removed
    };

    template <typename T>
    struct AssetEvent
    {
        AssetEventKind Kind = AssetEventKind::Added;
        AssetId<T> Id{};
    };

    // -------------------------------------------------------------------------
    // AssetStore - author-side table of source assets
    // -------------------------------------------------------------------------
    // Every mutation is recorded as an AssetEvent. The render side drains the
    // events once per frame to learn which assets need (re-)preparation and
    // which prepared entries must be dropped.
    // -------------------------------------------------------------------------
    template <typename T>
    class AssetStore
    {
    public:
        AssetStore() = default;

        AssetStore(const AssetStore&) = delete;
        AssetStore& operator=(const AssetStore&) = delete;

        AssetId<T> Add(T asset)
        {
            std::unique_lock lock(m_Mutex);

            uint32_t index;
            if (!m_FreeIndices.empty())
            {
                index = m_FreeIndices.front();
                m_FreeIndices.pop_front();
            }
            else
            {
                index = static_cast<uint32_t>(m_Slots.size());
                m_Slots.emplace_back();
            }

            Slot& slot = m_Slots[index];
            slot.Data = std::make_unique<T>(std::move(asset));
            ++slot.Generation;

            const AssetId<T> id{index, slot.Generation};
            m_Events.push_back({AssetEventKind::Added, id});
            return id;
        }

        // Re-assigns a new value at an existing id. Returns false for stale ids.
        bool Insert(AssetId<T> id, T asset)
        {
            std::unique_lock lock(m_Mutex);
            Slot* slot = FindSlot(id);
            if (!slot)
                return false;

            *slot->Data = std::move(asset);
            m_Events.push_back({AssetEventKind::Modified, id});
            return true;
        }

        [[nodiscard]] const T* Get(AssetId<T> id) const
        {
            std::shared_lock lock(m_Mutex);
            const Slot* slot = FindSlot(id);
            return slot ? slot->Data.get() : nullptr;
        }

        // Mutable access counts as a modification.
        [[nodiscard]] T* GetMut(AssetId<T> id)
        {
            std::unique_lock lock(m_Mutex);
            Slot* slot = FindSlot(id);
            if (!slot)
                return nullptr;

            m_Events.push_back({AssetEventKind::Modified, id});
            return slot->Data.get();
        }

        bool Remove(AssetId<T> id)
        {
            std::unique_lock lock(m_Mutex);
            Slot* slot = FindSlot(id);
            if (!slot)
                return false;

            slot->Data.reset();
            m_FreeIndices.push_back(id.Index);
            m_Events.push_back({AssetEventKind::Removed, id});
            return true;
        }

        [[nodiscard]] bool Contains(AssetId<T> id) const
        {
            return Get(id) != nullptr;
        }

        // Hands over all events recorded since the previous call, oldest first.
        [[nodiscard]] std::vector<AssetEvent<T>> DrainEvents()
        {
            std::unique_lock lock(m_Mutex);
            std::vector<AssetEvent<T>> out;
            out.swap(m_Events);
            return out;
        }

        [[nodiscard]] size_t Size() const
        {
            std::shared_lock lock(m_Mutex);
            return m_Slots.size() - m_FreeIndices.size();
        }

    private:
        struct Slot
        {
            std::unique_ptr<T> Data; // Pointer stability across slot growth
            uint32_t Generation = 0;
        };

        Slot* FindSlot(AssetId<T> id)
        {
            if (id.Index >= m_Slots.size())
                return nullptr;
            Slot& slot = m_Slots[id.Index];
            if (!slot.Data || slot.Generation != id.Generation)
                return nullptr;
            return &slot;
        }

        const Slot* FindSlot(AssetId<T> id) const
        {
            return const_cast<AssetStore*>(this)->FindSlot(id);
        }

        std::vector<Slot> m_Slots;
        std::deque<uint32_t> m_FreeIndices;
        std::vector<AssetEvent<T>> m_Events;

        mutable std::shared_mutex m_Mutex;
    };
}
