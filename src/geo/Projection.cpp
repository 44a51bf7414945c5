// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "Projection.h"

#include "../global/utils.h"

#include <algorithm>
#include <cmath>

namespace projection {

namespace { // anonymous

constexpr double PI = 3.14159265358979323846;

NODISCARD double degToRad(const double deg)
{
    return deg * PI / 180.0;
}

NODISCARD double radToDeg(const double rad)
{
    return rad * 180.0 / PI;
}

} // namespace

int clampZoomLevel(const int zoom)
{
    return std::clamp(zoom, 0, MAX_TILE_ZOOM);
}

double worldSize(const double zoom, const int tileSize)
{
    return static_cast<double>(tileSize) * std::exp2(std::max(0.0, zoom));
}

glm::dvec2 geoToWorldPixel(const LonLat &lonLat, const double zoom, const int tileSize)
{
    const double size = worldSize(zoom, tileSize);
    const double lat = LonLat::clampLatitude(lonLat.lat);

    const double x = (lonLat.lon + MAX_LONGITUDE) / (2.0 * MAX_LONGITUDE) * size;

    // Clamped latitude keeps |sinLat| < 1, so the log stays finite.
    const double sinLat = std::sin(degToRad(lat));
    const double y = (0.5 - std::log((1.0 + sinLat) / (1.0 - sinLat)) / (4.0 * PI)) * size;

    return glm::dvec2{x, std::clamp(y, 0.0, size)};
}

LonLat worldPixelToGeo(const glm::dvec2 &worldPixel, const double zoom, const int tileSize)
{
    const double size = worldSize(zoom, tileSize);

    const double lon = worldPixel.x / size * (2.0 * MAX_LONGITUDE) - MAX_LONGITUDE;

    const double yNorm = std::clamp(worldPixel.y, 0.0, size) / size;
    const double lat = radToDeg(std::atan(std::sinh(PI * (1.0 - 2.0 * yNorm))));

    return LonLat::clamped(lon, lat);
}

TileAddress tileContaining(const glm::dvec2 &worldPixel, const int zoom, const int tileSize)
{
    const int z = clampZoomLevel(zoom);
    const int n = TileAddress::tileCount(z);
    const double ts = static_cast<double>(tileSize);

    const double col = std::floor(worldPixel.x / ts);
    const double row = std::floor(worldPixel.y / ts);

    const int x = static_cast<int>(utils::floorMod(col, static_cast<double>(n)));
    const int y = static_cast<int>(std::clamp(row, 0.0, static_cast<double>(n - 1)));
    return TileAddress{z, std::clamp(x, 0, n - 1), y};
}

glm::dvec2 tileOrigin(const TileAddress &addr, const int tileSize)
{
    return glm::dvec2{static_cast<double>(addr.x) * tileSize,
                      static_cast<double>(addr.y) * tileSize};
}

} // namespace projection
