// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TileError.h"

const char *getName(const TileErrorEnum e)
{
#define X_CASE(_id, _desc) \
    case TileErrorEnum::_id: \
        return _desc;
    switch (e) {
        XFOREACH_TILE_ERROR(X_CASE)
    }
#undef X_CASE
    return "unknown error";
}
