// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TileAddress.h"

#include <QDebug>

std::ostream &operator<<(std::ostream &os, const TileAddress &addr)
{
    return os << addr.zoom << "/" << addr.x << "/" << addr.y;
}

QDebug operator<<(QDebug os, const TileAddress &addr)
{
    const QDebugStateSaver saver{os};
    os.nospace() << addr.zoom << "/" << addr.x << "/" << addr.y;
    return os;
}
