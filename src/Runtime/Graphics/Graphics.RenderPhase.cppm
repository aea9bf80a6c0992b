module;
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <span>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>
#include <entt/entity/entity.hpp>

export module Graphics:RenderPhase;

import Core;
import RHI;
import :Mesh2D;
import :PipelineCache;

export namespace Graphics
{
    using DrawFunctionId = Core::StrongHandle<struct DrawFunctionTag>;

    struct BatchRange
    {
        uint32_t Start = 0;
        uint32_t End = 1;

        bool operator==(const BatchRange&) const = default;
    };

    // One phase item as seen by a draw function.
    struct DrawItem
    {
        entt::entity Entity = entt::null;
        CachedRenderPipelineId Pipeline{};
        BatchRange Batch{};
    };

    enum class RenderCommandResult : uint8_t
    {
        Success,
        // The item's data is not ready; nothing is drawn for it this frame.
        Skip
    };

    // -------------------------------------------------------------------------
    // TrackedRenderPass
    // -------------------------------------------------------------------------
    // Records the state changes and draws issued while rendering phases.
    // Setting the pipeline or a bind group that is already bound is dropped.
    // A GPU backend replays GetCommands() into its command buffer.
    // -------------------------------------------------------------------------
    class TrackedRenderPass
    {
    public:
        struct SetPipelineCommand
        {
            RHI::RenderPipelineHandle Pipeline;
        };

        struct SetBindGroupCommand
        {
            uint32_t Index = 0;
            RHI::BindGroupHandle BindGroup;
        };

        struct DrawCommand
        {
            RHI::BufferHandle VertexBuffer;
            uint32_t VertexCount = 0;
            BatchRange Instances;
        };

        using Command = std::variant<SetPipelineCommand, SetBindGroupCommand, DrawCommand>;

        void SetRenderPipeline(RHI::RenderPipelineHandle pipeline)
        {
            if (m_Pipeline == pipeline)
                return;
            m_Pipeline = pipeline;
            m_Commands.push_back(SetPipelineCommand{pipeline});
        }

        void SetBindGroup(uint32_t index, RHI::BindGroupHandle bindGroup)
        {
            if (index >= m_BindGroups.size())
                m_BindGroups.resize(index + 1);
            if (m_BindGroups[index] == bindGroup)
                return;
            m_BindGroups[index] = bindGroup;
            m_Commands.push_back(SetBindGroupCommand{index, bindGroup});
        }

        void Draw(RHI::BufferHandle vertexBuffer, uint32_t vertexCount, BatchRange instances)
        {
            m_Commands.push_back(DrawCommand{vertexBuffer, vertexCount, instances});
            ++m_DrawCount;
        }

        [[nodiscard]] std::optional<RHI::RenderPipelineHandle> GetPipeline() const { return m_Pipeline; }

        [[nodiscard]] std::optional<RHI::BindGroupHandle> GetBindGroup(uint32_t index) const
        {
            return index < m_BindGroups.size() ? m_BindGroups[index] : std::nullopt;
        }

        [[nodiscard]] std::span<const Command> GetCommands() const { return m_Commands; }
        [[nodiscard]] uint32_t GetDrawCount() const { return m_DrawCount; }

    private:
        std::optional<RHI::RenderPipelineHandle> m_Pipeline;
        std::vector<std::optional<RHI::BindGroupHandle>> m_BindGroups;
        std::vector<Command> m_Commands;
        uint32_t m_DrawCount = 0;
    };

    // -------------------------------------------------------------------------
    // DrawFunctions
    // -------------------------------------------------------------------------
    // Per-phase registry of draw functions. Each draw function type gets one
    // id; registering the same type again returns the existing id. A type may
    // carry a callable that Draw() dispatches items to by id.
    // -------------------------------------------------------------------------
    class DrawFunctions
    {
    public:
        using Function = std::function<RenderCommandResult(const DrawItem&, TrackedRenderPass&)>;

        template <typename T>
        DrawFunctionId Register()
        {
            std::lock_guard lock(m_Mutex);
            return RegisterToken(TypeToken<T>());
        }

        // Registers T and (re)binds its callable.
        template <typename T>
        DrawFunctionId Register(Function function)
        {
            std::lock_guard lock(m_Mutex);
            const DrawFunctionId id = RegisterToken(TypeToken<T>());
            m_Functions[id.Index] = std::move(function);
            return id;
        }

        template <typename T>
        [[nodiscard]] std::optional<DrawFunctionId> GetId() const
        {
            std::lock_guard lock(m_Mutex);
            const void* token = TypeToken<T>();
            for (uint32_t i = 0; i < m_Tokens.size(); ++i)
            {
                if (m_Tokens[i] == token)
                    return DrawFunctionId{i, 1u};
            }
            return std::nullopt;
        }

        // Drops the callable bound to `id`. The id stays reserved.
        void Unbind(DrawFunctionId id)
        {
            std::lock_guard lock(m_Mutex);
            if (id.IsValid() && id.Index < m_Functions.size())
                m_Functions[id.Index] = nullptr;
        }

        // Skip for unknown ids and ids without a callable.
        RenderCommandResult Draw(DrawFunctionId id, const DrawItem& item, TrackedRenderPass& pass) const
        {
            Function function;
            {
                std::lock_guard lock(m_Mutex);
                if (!id.IsValid() || id.Index >= m_Functions.size())
                    return RenderCommandResult::Skip;
                function = m_Functions[id.Index];
            }
            return function ? function(item, pass) : RenderCommandResult::Skip;
        }

        [[nodiscard]] size_t Size() const
        {
            std::lock_guard lock(m_Mutex);
            return m_Tokens.size();
        }

    private:
        template <typename T>
        static const void* TypeToken()
        {
            static const char anchor = 0;
            return &anchor;
        }

        DrawFunctionId RegisterToken(const void* token)
        {
            for (uint32_t i = 0; i < m_Tokens.size(); ++i)
            {
                if (m_Tokens[i] == token)
                    return {i, 1u};
            }
            m_Tokens.push_back(token);
            m_Functions.emplace_back();
            return {static_cast<uint32_t>(m_Tokens.size() - 1), 1u};
        }

        mutable std::mutex m_Mutex;
        std::vector<const void*> m_Tokens;
        std::vector<Function> m_Functions;
    };

    struct PhaseRenderStats
    {
        uint32_t Drawn = 0;
        uint32_t Skipped = 0;
    };

    // -------------------------------------------------------------------------
    // Opaque 2D
    // -------------------------------------------------------------------------

    // Draws sharing every field of the key can be batched together.
    struct Opaque2DBinKey
    {
        CachedRenderPipelineId Pipeline{};
        DrawFunctionId DrawFunction{};
        MeshHandle AssetId{};
        std::optional<RHI::BindGroupHandle> MaterialBindGroupId;

        bool operator==(const Opaque2DBinKey&) const = default;
    };

    enum class BinnedRenderPhaseType : uint8_t
    {
        BatchableMesh,
        UnbatchableMesh,
        NonMesh
    };

    [[nodiscard]] constexpr BinnedRenderPhaseType MeshPhaseType(bool batchable)
    {
        return batchable ? BinnedRenderPhaseType::BatchableMesh : BinnedRenderPhaseType::UnbatchableMesh;
    }

    // Unordered phase: entities are grouped by bin key. Keys are kept in first
    // insertion order so iteration is deterministic within a frame.
    template <typename BinKey>
    class BinnedRenderPhase
    {
    public:
        struct NonMeshItem
        {
            BinKey Key;
            entt::entity Entity;
        };

        void Add(const BinKey& key, entt::entity entity, BinnedRenderPhaseType type)
        {
            switch (type)
            {
            case BinnedRenderPhaseType::BatchableMesh:
                AddToBin(m_BatchableKeys, m_BatchableBins, key, entity);
                break;
            case BinnedRenderPhaseType::UnbatchableMesh:
                AddToBin(m_UnbatchableKeys, m_UnbatchableBins, key, entity);
                break;
            case BinnedRenderPhaseType::NonMesh:
                m_NonMesh.push_back({key, entity});
                break;
            }
        }

        [[nodiscard]] std::span<const BinKey> GetBatchableKeys() const { return m_BatchableKeys; }
        [[nodiscard]] std::span<const BinKey> GetUnbatchableKeys() const { return m_UnbatchableKeys; }
        [[nodiscard]] std::span<const NonMeshItem> GetNonMeshItems() const { return m_NonMesh; }

        [[nodiscard]] const std::vector<entt::entity>* GetBatchable(const BinKey& key) const
        {
            auto it = m_BatchableBins.find(key);
            return it != m_BatchableBins.end() ? &it->second : nullptr;
        }

        [[nodiscard]] const std::vector<entt::entity>* GetUnbatchable(const BinKey& key) const
        {
            auto it = m_UnbatchableBins.find(key);
            return it != m_UnbatchableBins.end() ? &it->second : nullptr;
        }

        [[nodiscard]] size_t BinCount() const { return m_BatchableKeys.size() + m_UnbatchableKeys.size(); }

        [[nodiscard]] size_t ItemCount() const
        {
            size_t count = m_NonMesh.size();
            for (const auto& [key, entities] : m_BatchableBins) count += entities.size();
            for (const auto& [key, entities] : m_UnbatchableBins) count += entities.size();
            return count;
        }

        [[nodiscard]] bool IsEmpty() const { return ItemCount() == 0; }

        // Draws bins in key order, batchable first, then the non-mesh items.
        // BinKey must provide Pipeline and DrawFunction.
        PhaseRenderStats Render(TrackedRenderPass& pass, const DrawFunctions& drawFunctions) const
        {
            PhaseRenderStats stats;
            auto draw = [&](const BinKey& key, entt::entity entity, uint32_t index) {
                const DrawItem item{entity, key.Pipeline, BatchRange{index, index + 1}};
                if (drawFunctions.Draw(key.DrawFunction, item, pass) == RenderCommandResult::Success)
                    ++stats.Drawn;
                else
                    ++stats.Skipped;
            };

            for (const BinKey& key : m_BatchableKeys)
            {
                const std::vector<entt::entity>& entities = m_BatchableBins.at(key);
                for (uint32_t i = 0; i < entities.size(); ++i)
                    draw(key, entities[i], i);
            }
            for (const BinKey& key : m_UnbatchableKeys)
            {
                for (entt::entity entity : m_UnbatchableBins.at(key))
                    draw(key, entity, 0);
            }
            for (const NonMeshItem& item : m_NonMesh)
                draw(item.Key, item.Entity, 0);
            return stats;
        }

        void Clear()
        {
            m_BatchableKeys.clear();
            m_BatchableBins.clear();
            m_UnbatchableKeys.clear();
            m_UnbatchableBins.clear();
            m_NonMesh.clear();
        }

    private:
        using Bins = std::unordered_map<BinKey, std::vector<entt::entity>>;

        static void AddToBin(std::vector<BinKey>& keys, Bins& bins, const BinKey& key, entt::entity entity)
        {
            auto [it, inserted] = bins.try_emplace(key);
            if (inserted)
                keys.push_back(key);
            it->second.push_back(entity);
        }

        std::vector<BinKey> m_BatchableKeys;
        Bins m_BatchableBins;
        std::vector<BinKey> m_UnbatchableKeys;
        Bins m_UnbatchableBins;
        std::vector<NonMeshItem> m_NonMesh;
    };

    // -------------------------------------------------------------------------
    // Transparent 2D
    // -------------------------------------------------------------------------

    struct Transparent2D
    {
        float SortKey = 0.0f;
        entt::entity Entity = entt::null;
        CachedRenderPipelineId Pipeline{};
        DrawFunctionId DrawFunction{};
        BatchRange Batch{};
        std::optional<uint32_t> ExtraIndex;
    };

    // Total order on floats for sorting: NaN sorts before every number.
    [[nodiscard]] inline bool FloatOrdLess(float a, float b)
    {
        if (std::isnan(a)) return !std::isnan(b);
        if (std::isnan(b)) return false;
        return a < b;
    }

    // Ordered phase. Items are added unordered during queuing and must be
    // sorted with Sort() right before they are consumed.
    template <typename Item>
    class SortedRenderPhase
    {
    public:
        void Add(Item item) { m_Items.push_back(std::move(item)); }

        // Ascending by SortKey. Items with equal keys keep their insertion order.
        void Sort()
        {
            std::stable_sort(m_Items.begin(), m_Items.end(),
                             [](const Item& a, const Item& b) { return FloatOrdLess(a.SortKey, b.SortKey); });
        }

        [[nodiscard]] std::span<const Item> GetItems() const { return m_Items; }

        // Draws items in their current order. Call Sort() first.
        PhaseRenderStats Render(TrackedRenderPass& pass, const DrawFunctions& drawFunctions) const
        {
            PhaseRenderStats stats;
            for (const Item& item : m_Items)
            {
                const DrawItem drawItem{item.Entity, item.Pipeline, item.Batch};
                if (drawFunctions.Draw(item.DrawFunction, drawItem, pass) == RenderCommandResult::Success)
                    ++stats.Drawn;
                else
                    ++stats.Skipped;
            }
            return stats;
        }
        [[nodiscard]] size_t Size() const { return m_Items.size(); }
        [[nodiscard]] bool IsEmpty() const { return m_Items.empty(); }
        void Clear() { m_Items.clear(); }

    private:
        std::vector<Item> m_Items;
    };

    // -------------------------------------------------------------------------
    // Per-view phase containers
    // -------------------------------------------------------------------------
    // Each view owns exactly one phase of each kind. PrepareForViews() runs
    // once per frame before queuing: live views get an empty phase, phases
    // of views that no longer exist are dropped.
    // -------------------------------------------------------------------------
    template <typename Phase>
    class ViewPhases
    {
    public:
        void PrepareForViews(std::span<const entt::entity> views)
        {
            std::unordered_set<entt::entity> live(views.begin(), views.end());
            std::erase_if(m_Phases, [&](const auto& entry) { return !live.contains(entry.first); });

            for (entt::entity view : views)
                m_Phases[view].Clear();
        }

        [[nodiscard]] Phase* Get(entt::entity view)
        {
            auto it = m_Phases.find(view);
            return it != m_Phases.end() ? &it->second : nullptr;
        }

        [[nodiscard]] const Phase* Get(entt::entity view) const
        {
            auto it = m_Phases.find(view);
            return it != m_Phases.end() ? &it->second : nullptr;
        }

        Phase& Insert(entt::entity view) { return m_Phases[view]; }
        void Remove(entt::entity view) { m_Phases.erase(view); }

        [[nodiscard]] size_t Size() const { return m_Phases.size(); }

        template <typename F>
        void ForEach(F&& fn)
        {
            for (auto& [view, phase] : m_Phases)
                fn(view, phase);
        }

    private:
        std::unordered_map<entt::entity, Phase> m_Phases;
    };

    using ViewBinnedRenderPhases = ViewPhases<BinnedRenderPhase<Opaque2DBinKey>>;
    using ViewSortedRenderPhases = ViewPhases<SortedRenderPhase<Transparent2D>>;

    // Sorts every view's transparent phase. Runs after queuing, before draw.
    inline void SortPhases(ViewSortedRenderPhases& phases)
    {
        phases.ForEach([](entt::entity, SortedRenderPhase<Transparent2D>& phase) { phase.Sort(); });
    }
}

template <>
struct std::hash<Graphics::Opaque2DBinKey>
{
    std::size_t operator()(const Graphics::Opaque2DBinKey& key) const noexcept
    {
        return Core::Hash::HashAll(key.Pipeline, key.DrawFunction, key.AssetId, key.MaterialBindGroupId);
    }
};
