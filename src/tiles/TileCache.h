#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "DiskTileCache.h"
#include "MemoryTileCache.h"
#include "TileKey.h"

#include <optional>
#include <utility>

#include <QByteArray>
#include <QImage>

/// Decodes PNG/JPEG/... bytes; nullopt for corrupt or unsupported data.
NODISCARD std::optional<QImage> decodeTileImage(const QByteArray &bytes);

/// Memory tier in front of a disk tier.
///
/// The memory tier is not thread-safe and belongs to the UI context, as do
/// get(), put(), lookupMemory() and insertMemory(). Worker threads only use
/// the disk-only loadFromDisk() and storeOnDisk().
class NODISCARD TileCache final
{
public:
    struct NODISCARD Settings final
    {
        qint64 memoryBudgetBytes = 64 * 1024 * 1024;
        DiskTileCache::Settings disk;
    };

private:
    MemoryTileCache m_memory;
    DiskTileCache m_disk;

public:
    explicit TileCache(const Settings &settings);
    ~TileCache() = default;
    DELETE_CTORS_AND_ASSIGN_OPS(TileCache);

public:
    /// Memory first, then a blocking disk read that promotes the hit.
    NODISCARD std::optional<QImage> get(const TileKey &key);
    void put(const TileKey &key, const QImage &image, const QByteArray &encoded);

    /// Reads and decodes the disk copy; a corrupt file is deleted.
    /// Never touches the memory tier.
    NODISCARD std::optional<QImage> loadFromDisk(const TileKey &key);
    bool storeOnDisk(const TileKey &key, const QByteArray &encoded);

    NODISCARD std::optional<QImage> lookupMemory(const TileKey &key) { return m_memory.get(key); }
    bool insertMemory(const TileKey &key, const QImage &image) { return m_memory.put(key, image); }

    void setPinned(TileKeySet pinned) { m_memory.setPinned(std::move(pinned)); }
    void clearMemory() { m_memory.clear(); }

    NODISCARD MemoryTileCache &getMemory() { return m_memory; }
    NODISCARD const MemoryTileCache &getMemory() const { return m_memory; }
    NODISCARD DiskTileCache &getDisk() { return m_disk; }
};
