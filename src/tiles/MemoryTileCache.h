#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "TileKey.h"

#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include <QImage>
#include <QtGlobal>

using TileKeySet = std::unordered_set<TileKey>;

/// LRU store of decoded tiles with a byte budget.
///
/// Lives in the UI context and is not thread-safe. Pinned keys are never
/// evicted, so the budget may be exceeded only while every resident entry
/// is pinned.
class NODISCARD MemoryTileCache final
{
public:
    struct NODISCARD Stats final
    {
        qint64 bytesUsed = 0;
        size_t entries = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
    };

private:
    using LruList = std::list<TileKey>;

    struct NODISCARD Entry final
    {
        QImage image;
        qint64 bytes = 0;
        uint64_t lastAccess = 0;
        LruList::iterator lruPos;
    };

    std::unordered_map<TileKey, Entry> m_entries;
    /// Most recently used at the front.
    LruList m_lru;
    TileKeySet m_pinned;
    qint64 m_budgetBytes = 0;
    uint64_t m_tick = 0;
    Stats m_stats;

public:
    explicit MemoryTileCache(qint64 budgetBytes);
    ~MemoryTileCache() = default;
    DELETE_CTORS_AND_ASSIGN_OPS(MemoryTileCache);

public:
    /// Counts a hit or a miss and refreshes the entry on a hit.
    NODISCARD std::optional<QImage> get(const TileKey &key);
    NODISCARD bool contains(const TileKey &key) const;

    /// Returns false if the image was not kept because it alone exceeds the budget.
    bool put(const TileKey &key, const QImage &image);
    bool remove(const TileKey &key);
    void clear();

    /// Replaces the pinned set; previously pinned entries become evictable again.
    void setPinned(TileKeySet pinned);
    NODISCARD const TileKeySet &getPinned() const { return m_pinned; }
    NODISCARD bool isPinned(const TileKey &key) const { return m_pinned.count(key) != 0; }

    void setBudget(qint64 budgetBytes);
    NODISCARD qint64 getBudget() const { return m_budgetBytes; }

    NODISCARD Stats getStats() const;
    NODISCARD qint64 getBytesUsed() const { return m_stats.bytesUsed; }
    NODISCARD size_t size() const { return m_entries.size(); }

    NODISCARD static qint64 imageBytes(const QImage &image);

private:
    void evictToBudget();
    void erase(std::unordered_map<TileKey, Entry>::iterator it);
};
