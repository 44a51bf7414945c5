// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "MemoryTileCache.h"

#include "../global/logging.h"

#include <algorithm>
#include <utility>

MemoryTileCache::MemoryTileCache(const qint64 budgetBytes)
    : m_budgetBytes{std::max<qint64>(0, budgetBytes)}
{}

qint64 MemoryTileCache::imageBytes(const QImage &image)
{
    return static_cast<qint64>(image.sizeInBytes());
}

std::optional<QImage> MemoryTileCache::get(const TileKey &key)
{
    const auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        ++m_stats.misses;
        return std::nullopt;
    }

    ++m_stats.hits;
    Entry &entry = it->second;
    entry.lastAccess = ++m_tick;
    m_lru.splice(m_lru.begin(), m_lru, entry.lruPos);
    return entry.image;
}

bool MemoryTileCache::contains(const TileKey &key) const
{
    return m_entries.find(key) != m_entries.end();
}

bool MemoryTileCache::put(const TileKey &key, const QImage &image)
{
    if (image.isNull()) {
        return false;
    }

    const qint64 bytes = imageBytes(image);
    if (bytes > m_budgetBytes) {
        SMLOG_DEBUG() << "Tile " << key << " (" << bytes << " bytes) exceeds the memory budget";
        remove(key);
        return false;
    }

    auto it = m_entries.find(key);
    if (it != m_entries.end()) {
        Entry &entry = it->second;
        m_stats.bytesUsed -= entry.bytes;
        entry.image = image;
        entry.bytes = bytes;
        entry.lastAccess = ++m_tick;
        m_lru.splice(m_lru.begin(), m_lru, entry.lruPos);
    } else {
        m_lru.push_front(key);
        Entry entry;
        entry.image = image;
        entry.bytes = bytes;
        entry.lastAccess = ++m_tick;
        entry.lruPos = m_lru.begin();
        m_entries.emplace(key, std::move(entry));
    }
    m_stats.bytesUsed += bytes;

    evictToBudget();
    return contains(key);
}

bool MemoryTileCache::remove(const TileKey &key)
{
    const auto it = m_entries.find(key);
    if (it == m_entries.end()) {
        return false;
    }
    erase(it);
    return true;
}

void MemoryTileCache::clear()
{
    m_entries.clear();
    m_lru.clear();
    m_stats.bytesUsed = 0;
}

void MemoryTileCache::setPinned(TileKeySet pinned)
{
    m_pinned = std::move(pinned);
    evictToBudget();
}

void MemoryTileCache::setBudget(const qint64 budgetBytes)
{
    m_budgetBytes = std::max<qint64>(0, budgetBytes);
    evictToBudget();
}

MemoryTileCache::Stats MemoryTileCache::getStats() const
{
    Stats stats = m_stats;
    stats.entries = m_entries.size();
    return stats;
}

void MemoryTileCache::erase(const std::unordered_map<TileKey, Entry>::iterator it)
{
    m_stats.bytesUsed -= it->second.bytes;
    m_lru.erase(it->second.lruPos);
    m_entries.erase(it);
}

void MemoryTileCache::evictToBudget()
{
    // Walk from the least recently used end, skipping pinned keys.
    auto pos = m_lru.end();
    while (m_stats.bytesUsed > m_budgetBytes && pos != m_lru.begin()) {
        --pos;
        if (isPinned(*pos)) {
            continue;
        }
        const auto victim = m_entries.find(*pos);
        // erase() invalidates pos; step past it first.
        auto next = pos;
        ++next;
        erase(victim);
        ++m_stats.evictions;
        pos = next;
    }
}
