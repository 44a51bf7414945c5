// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "MapEvents.h"

#include <QDebug>

QDebug operator<<(QDebug os, const MouseMovedEvent &event)
{
    const QDebugStateSaver saver{os};
    os.nospace() << "MouseMovedEvent(" << event.screen << ", " << event.lonLat << ")";
    return os;
}

QDebug operator<<(QDebug os, const ViewportChangeEvent &event)
{
    const QDebugStateSaver saver{os};
    os.nospace() << "ViewportChangeEvent(" << event.windowSize << ", " << event.center
                 << ", zoom=" << event.zoom << ")";
    return os;
}
