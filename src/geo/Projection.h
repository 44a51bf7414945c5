#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/macros.h"
#include "LonLat.h"
#include "TileAddress.h"

#include <glm/glm.hpp>

/// Web Mercator math. Every geographic <-> pixel <-> tile conversion in the
/// project goes through these functions; they are pure and never fail.
///
/// "World pixels" are measured from the north-west corner of the world at the
/// given zoom, so the world spans [0, tileSize * 2^zoom) on both axes.
namespace projection {

static constexpr int DEFAULT_TILE_SIZE = 256;

/// Width (and height) of the whole world in pixels; zoom may be fractional.
NODISCARD double worldSize(double zoom, int tileSize = DEFAULT_TILE_SIZE);

/// Latitude is clamped to the Mercator limit before projecting.
NODISCARD glm::dvec2 geoToWorldPixel(const LonLat &lonLat,
                                     double zoom,
                                     int tileSize = DEFAULT_TILE_SIZE);

/// x wraps around the antimeridian; y is clamped to the world extent.
NODISCARD LonLat worldPixelToGeo(const glm::dvec2 &worldPixel,
                                 double zoom,
                                 int tileSize = DEFAULT_TILE_SIZE);

/// x wraps modulo 2^zoom, y is clamped to [0, 2^zoom).
NODISCARD TileAddress tileContaining(const glm::dvec2 &worldPixel,
                                     int zoom,
                                     int tileSize = DEFAULT_TILE_SIZE);

/// World pixel of the north-west corner of a tile.
NODISCARD glm::dvec2 tileOrigin(const TileAddress &addr, int tileSize = DEFAULT_TILE_SIZE);

NODISCARD int clampZoomLevel(int zoom);

} // namespace projection
