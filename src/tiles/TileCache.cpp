// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TileCache.h"

#include "../global/logging.h"

#include <tuple>

std::optional<QImage> decodeTileImage(const QByteArray &bytes)
{
    if (bytes.isEmpty()) {
        return std::nullopt;
    }
    QImage image;
    if (!image.loadFromData(bytes) || image.isNull()) {
        return std::nullopt;
    }
    return image;
}

TileCache::TileCache(const Settings &settings)
    : m_memory{settings.memoryBudgetBytes}
    , m_disk{settings.disk}
{}

std::optional<QImage> TileCache::get(const TileKey &key)
{
    if (auto image = m_memory.get(key)) {
        return image;
    }
    auto image = loadFromDisk(key);
    if (image) {
        m_memory.put(key, *image);
    }
    return image;
}

void TileCache::put(const TileKey &key, const QImage &image, const QByteArray &encoded)
{
    std::ignore = storeOnDisk(key, encoded);
    m_memory.put(key, image);
}

std::optional<QImage> TileCache::loadFromDisk(const TileKey &key)
{
    const std::optional<QByteArray> bytes = m_disk.read(key);
    if (!bytes) {
        return std::nullopt;
    }

    auto image = decodeTileImage(*bytes);
    if (!image) {
        SMLOG_WARNING() << "Dropping undecodable cached tile " << key;
        m_disk.remove(key);
    }
    return image;
}

bool TileCache::storeOnDisk(const TileKey &key, const QByteArray &encoded)
{
    if (!m_disk.write(key, encoded)) {
        SMLOG_WARNING() << "Tile " << key << " was not stored on disk";
        return false;
    }
    return true;
}
