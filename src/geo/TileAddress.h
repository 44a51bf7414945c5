#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/macros.h"

#include <cstddef>
#include <functional>
#include <ostream>
#include <tuple>

class QDebug;

/// Highest zoom level whose tile indices still fit comfortably in an int.
static constexpr int MAX_TILE_ZOOM = 30;

/// One cell of the XYZ tile pyramid.
struct NODISCARD TileAddress final
{
    int zoom = 0;
    int x = 0;
    int y = 0;

    constexpr TileAddress() = default;
    constexpr TileAddress(const int zoom_, const int x_, const int y_)
        : zoom{zoom_}
        , x{x_}
        , y{y_}
    {}

    /// 2^zoom; tiles per axis.
    NODISCARD static constexpr int tileCount(const int zoom) { return 1 << zoom; }

    NODISCARD constexpr bool isValid() const
    {
        return zoom >= 0 && zoom <= MAX_TILE_ZOOM && x >= 0 && y >= 0 && x < tileCount(zoom)
               && y < tileCount(zoom);
    }

    NODISCARD bool operator==(const TileAddress &rhs) const
    {
        return zoom == rhs.zoom && x == rhs.x && y == rhs.y;
    }
    NODISCARD bool operator!=(const TileAddress &rhs) const { return !(*this == rhs); }
    NODISCARD bool operator<(const TileAddress &rhs) const
    {
        return std::tie(zoom, y, x) < std::tie(rhs.zoom, rhs.y, rhs.x);
    }

    friend std::ostream &operator<<(std::ostream &os, const TileAddress &addr);
    friend QDebug operator<<(QDebug os, const TileAddress &addr);
};

namespace std {
template<>
struct hash<TileAddress>
{
    std::size_t operator()(const TileAddress &addr) const noexcept
    {
        std::size_t h = std::hash<int>{}(addr.zoom);
        h = h * 31u + std::hash<int>{}(addr.x);
        h = h * 31u + std::hash<int>{}(addr.y);
        return h;
    }
};
} // namespace std
