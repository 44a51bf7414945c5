#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/macros.h"

#include <ostream>

class QDebug;

/// Web Mercator latitude limit: atan(sinh(pi)) in degrees.
static constexpr double MERCATOR_MAX_LATITUDE = 85.0511287798066;
static constexpr double MAX_LONGITUDE = 180.0;

/// Longitude/latitude pair in degrees.
/// Values produced by clamped() satisfy |lon| <= 180 and |lat| <= MERCATOR_MAX_LATITUDE.
struct NODISCARD LonLat final
{
    double lon = 0.0;
    double lat = 0.0;

    constexpr LonLat() = default;
    constexpr LonLat(const double lon_, const double lat_)
        : lon{lon_}
        , lat{lat_}
    {}

    /// Wraps longitude into [-180, 180] and clamps latitude to the Mercator limit.
    NODISCARD static LonLat clamped(double lon, double lat);
    NODISCARD static double wrapLongitude(double lon);
    NODISCARD static double clampLatitude(double lat);

    NODISCARD bool isValid() const;

    NODISCARD bool operator==(const LonLat &rhs) const { return lon == rhs.lon && lat == rhs.lat; }
    NODISCARD bool operator!=(const LonLat &rhs) const { return !(*this == rhs); }

    friend std::ostream &operator<<(std::ostream &os, const LonLat &ll);
    friend QDebug operator<<(QDebug os, const LonLat &ll);
};
