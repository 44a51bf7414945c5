// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "LonLat.h"

#include "../global/utils.h"

#include <algorithm>
#include <cmath>

#include <QDebug>

double LonLat::wrapLongitude(const double lon)
{
    if (!std::isfinite(lon)) {
        return 0.0;
    }
    if (isClamped(lon, -MAX_LONGITUDE, MAX_LONGITUDE)) {
        return lon;
    }
    return utils::floorMod(lon + MAX_LONGITUDE, 2.0 * MAX_LONGITUDE) - MAX_LONGITUDE;
}

double LonLat::clampLatitude(const double lat)
{
    if (std::isnan(lat)) {
        return 0.0;
    }
    return std::clamp(lat, -MERCATOR_MAX_LATITUDE, MERCATOR_MAX_LATITUDE);
}

LonLat LonLat::clamped(const double lon, const double lat)
{
    return LonLat{wrapLongitude(lon), clampLatitude(lat)};
}

bool LonLat::isValid() const
{
    return isClamped(lon, -MAX_LONGITUDE, MAX_LONGITUDE)
           && isClamped(lat, -MERCATOR_MAX_LATITUDE, MERCATOR_MAX_LATITUDE);
}

std::ostream &operator<<(std::ostream &os, const LonLat &ll)
{
    return os << "LonLat(" << ll.lon << ", " << ll.lat << ")";
}

QDebug operator<<(QDebug os, const LonLat &ll)
{
    const QDebugStateSaver saver{os};
    os.nospace() << "LonLat(" << ll.lon << ", " << ll.lat << ")";
    return os;
}
