#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../geo/LonLat.h"
#include "../global/macros.h"

#include <QPointF>
#include <QSize>

class QDebug;

/// Pointer position snapshot handed to listeners of the map widget.
struct NODISCARD MouseMovedEvent final
{
    QPointF screen;
    LonLat lonLat;

    friend QDebug operator<<(QDebug os, const MouseMovedEvent &event);
};

/// Produced after every pan, zoom or resize.
struct NODISCARD ViewportChangeEvent final
{
    QSize windowSize;
    LonLat center;
    double zoom = 0.0;

    friend QDebug operator<<(QDebug os, const ViewportChangeEvent &event);
};
