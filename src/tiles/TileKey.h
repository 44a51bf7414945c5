#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../geo/TileAddress.h"
#include "../global/macros.h"

#include <cstddef>
#include <functional>
#include <ostream>
#include <utility>

#include <QHashFunctions>
#include <QString>

class QDebug;

/// Cache namespace of one tile template.
///
/// The value is "<slug>-<hash>": the slug is the URL host (or "local") and
/// the hash is the first 12 hex digits of SHA-1 over the full template, so the
/// id is stable across restarts and usable as a directory name.
class NODISCARD TileSourceId final
{
private:
    QString m_value;

public:
    TileSourceId() = default;
    explicit TileSourceId(QString value)
        : m_value{std::move(value)}
    {}

    NODISCARD static TileSourceId fromTemplate(const QString &tileTemplate);

public:
    NODISCARD const QString &toQString() const { return m_value; }
    NODISCARD bool isEmpty() const { return m_value.isEmpty(); }

    NODISCARD bool operator==(const TileSourceId &rhs) const { return m_value == rhs.m_value; }
    NODISCARD bool operator!=(const TileSourceId &rhs) const { return !(*this == rhs); }
};

struct NODISCARD TileKey final
{
    TileSourceId source;
    TileAddress address;

    NODISCARD bool operator==(const TileKey &rhs) const
    {
        return address == rhs.address && source == rhs.source;
    }
    NODISCARD bool operator!=(const TileKey &rhs) const { return !(*this == rhs); }

    friend std::ostream &operator<<(std::ostream &os, const TileKey &key);
    friend QDebug operator<<(QDebug os, const TileKey &key);
};

namespace std {
template<>
struct hash<TileSourceId>
{
    std::size_t operator()(const TileSourceId &id) const noexcept
    {
        return static_cast<std::size_t>(qHash(id.toQString()));
    }
};

template<>
struct hash<TileKey>
{
    std::size_t operator()(const TileKey &key) const noexcept
    {
        const std::size_t h = std::hash<TileSourceId>{}(key.source);
        return h ^ (std::hash<TileAddress>{}(key.address) + 0x9e3779b9u + (h << 6) + (h >> 2));
    }
};
} // namespace std
