// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "archdiagram/DiagramConstants.hpp"

#include <utils/async/DebouncedInvoker.hpp>

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <utility>

namespace ArchDiagram::State {

// Coalesces bursts of mutations per entity. Each schedule() restarts that
// entity's quiet period; when it elapses the sink runs once with the pending
// payload. Without a merge policy the last payload replaces earlier ones.
template <typename Payload>
class MutationQueue final
{
public:
    using Sink = std::function<void(const QString& entityId, const Payload& payload)>;
    using MergePolicy = std::function<void(Payload& pending, const Payload& incoming)>;

    explicit MutationQueue(Sink sink, int delayMs = Constants::kMutationDebounceMs)
        : m_sink(std::move(sink))
        , m_delayMs(delayMs)
    {}

    MutationQueue(const MutationQueue&) = delete;
    MutationQueue& operator=(const MutationQueue&) = delete;

    ~MutationQueue() { cancelAll(); }

    void setMergePolicy(MergePolicy policy) { m_merge = std::move(policy); }

    void setDelayMs(int ms)
    {
        m_delayMs = ms;
        for (auto& [id, entry] : m_entries)
            entry.invoker->setDelayMs(ms);
    }
    int delayMs() const noexcept { return m_delayMs; }

    void schedule(const QString& entityId, Payload payload)
    {
        if (entityId.isEmpty())
            return;

        Entry& entry = entryFor(entityId);
        if (entry.payload && m_merge)
            m_merge(*entry.payload, payload);
        else
            entry.payload = std::move(payload);
        entry.invoker->trigger();
    }

    bool cancel(const QString& entityId)
    {
        auto it = m_entries.find(entityId);
        if (it == m_entries.end() || !it->second.payload)
            return false;
        it->second.invoker->cancel();
        it->second.payload.reset();
        return true;
    }

    // Drops every pending payload without invoking the sink.
    void cancelAll()
    {
        for (auto& [id, entry] : m_entries) {
            entry.invoker->cancel();
            entry.payload.reset();
        }
        if (m_firing == 0)
            m_entries.clear();
    }

    bool flush(const QString& entityId)
    {
        auto it = m_entries.find(entityId);
        if (it == m_entries.end() || !it->second.payload)
            return false;
        return it->second.invoker->flush();
    }

    void flushAll()
    {
        QStringList ids;
        for (const auto& [id, entry] : m_entries) {
            if (entry.payload)
                ids.push_back(id);
        }
        for (const QString& id : ids)
            flush(id);
    }

    bool isPending(const QString& entityId) const
    {
        const auto it = m_entries.find(entityId);
        return it != m_entries.end() && it->second.payload.has_value();
    }

    int pendingCount() const
    {
        int count = 0;
        for (const auto& [id, entry] : m_entries) {
            if (entry.payload)
                ++count;
        }
        return count;
    }

    std::optional<Payload> pendingPayload(const QString& entityId) const
    {
        const auto it = m_entries.find(entityId);
        if (it == m_entries.end())
            return std::nullopt;
        return it->second.payload;
    }

    // Ids with a payload waiting, in id order.
    QStringList pendingIds() const
    {
        QStringList ids;
        for (const auto& [id, entry] : m_entries) {
            if (entry.payload)
                ids.push_back(id);
        }
        return ids;
    }

private:
    struct Entry {
        std::unique_ptr<Utils::Async::DebouncedInvoker> invoker;
        std::optional<Payload> payload;
    };

    Entry& entryFor(const QString& entityId)
    {
        auto it = m_entries.find(entityId);
        if (it != m_entries.end())
            return it->second;

        Entry entry;
        entry.invoker = std::make_unique<Utils::Async::DebouncedInvoker>(m_delayMs);
        entry.invoker->setAction([this, entityId]() { fire(entityId); });
        return m_entries.emplace(entityId, std::move(entry)).first->second;
    }

    void fire(const QString& entityId)
    {
        auto it = m_entries.find(entityId);
        if (it == m_entries.end() || !it->second.payload)
            return;

        Payload payload = std::move(*it->second.payload);
        it->second.payload.reset();

        // The sink may schedule or cancel; entries stay alive until it returns.
        ++m_firing;
        if (m_sink)
            m_sink(entityId, payload);
        --m_firing;
    }

    Sink m_sink;
    MergePolicy m_merge;
    int m_delayMs = Constants::kMutationDebounceMs;
    int m_firing = 0;
    std::map<QString, Entry> m_entries;
};

} // namespace ArchDiagram::State
