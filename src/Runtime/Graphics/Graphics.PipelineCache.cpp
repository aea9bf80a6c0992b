module;
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>
#include <vector>

module Graphics:PipelineCache.Impl;
import :PipelineCache;
import Core;
import RHI;

namespace Graphics
{
    PipelineCache::PipelineCache(RHI::IRenderDevice& device)
        : m_Device(device)
    {
    }

    CachedRenderPipelineId PipelineCache::Queue(RHI::RenderPipelineDescriptor descriptor)
    {
        std::unique_lock lock(m_Mutex);
        const auto index = static_cast<uint32_t>(m_Entries.size());
        m_Entries.push_back(Entry{std::move(descriptor)});
        const CachedRenderPipelineId id{index, m_Generation};
        m_Waiting.push_back(id);
        return id;
    }

    uint32_t PipelineCache::ProcessQueue()
    {
        std::vector<CachedRenderPipelineId> waiting;
        {
            std::unique_lock lock(m_Mutex);
            waiting.swap(m_Waiting);
        }

        uint32_t compiled = 0;
        for (CachedRenderPipelineId id : waiting)
        {
            // The device call runs unlocked so Queue() stays available meanwhile.
            RHI::RenderPipelineDescriptor descriptor;
            {
                std::shared_lock lock(m_Mutex);
                const Entry* entry = FindEntry(id);
                if (!entry) continue; // Cleared meanwhile
                descriptor = entry->Descriptor;
            }

            auto result = m_Device.CreateRenderPipeline(descriptor);

            std::unique_lock lock(m_Mutex);
            if (!FindEntry(id)) continue;
            Entry& entry = m_Entries[id.Index];
            if (result)
            {
                entry.State = CachedPipelineState::Ok;
                entry.Pipeline = *result;
                ++compiled;
            }
            else
            {
                entry.State = CachedPipelineState::Err;
                entry.Error = result.error();
                Core::Log::Error("[PipelineCache] Failed to create pipeline '{}': {}",
                                 entry.Descriptor.Label, Core::ErrorCodeToString(result.error()));
            }
        }

        if (!waiting.empty())
            Core::Log::Debug("[PipelineCache] Processed {} queued pipelines ({} compiled)", waiting.size(), compiled);
        return compiled;
    }

    const PipelineCache::Entry* PipelineCache::FindEntry(CachedRenderPipelineId id) const
    {
        if (!id.IsValid() || id.Generation != m_Generation || id.Index >= m_Entries.size())
            return nullptr;
        return &m_Entries[id.Index];
    }

    std::optional<RHI::RenderPipelineHandle> PipelineCache::GetRenderPipeline(CachedRenderPipelineId id) const
    {
        std::shared_lock lock(m_Mutex);
        const Entry* entry = FindEntry(id);
        if (!entry || entry->State != CachedPipelineState::Ok)
            return std::nullopt;
        return entry->Pipeline;
    }

    std::optional<CachedPipelineState> PipelineCache::GetState(CachedRenderPipelineId id) const
    {
        std::shared_lock lock(m_Mutex);
        const Entry* entry = FindEntry(id);
        if (!entry)
            return std::nullopt;
        return entry->State;
    }

    std::optional<RHI::RenderPipelineDescriptor> PipelineCache::GetDescriptor(CachedRenderPipelineId id) const
    {
        std::shared_lock lock(m_Mutex);
        const Entry* entry = FindEntry(id);
        if (!entry)
            return std::nullopt;
        return entry->Descriptor;
    }

    size_t PipelineCache::Size() const
    {
        std::shared_lock lock(m_Mutex);
        return m_Entries.size();
    }

    size_t PipelineCache::QueuedCount() const
    {
        std::shared_lock lock(m_Mutex);
        return m_Waiting.size();
    }

    void PipelineCache::Clear()
    {
        std::unique_lock lock(m_Mutex);
        m_Entries.clear();
        m_Waiting.clear();
        ++m_Generation;
        Core::Log::Info("[PipelineCache] Cleared (generation {})", m_Generation);
    }
}
