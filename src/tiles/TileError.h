#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/macros.h"

#include <QString>

#define XFOREACH_TILE_ERROR(X) \
    X(DECODE_ERROR, "decode error") \
    X(FETCH_ERROR, "fetch error") \
    X(NOT_FOUND, "not found")

#define X_DECL(_id, _desc) _id,
enum class NODISCARD TileErrorEnum { XFOREACH_TILE_ERROR(X_DECL) };
#undef X_DECL

NODISCARD const char *getName(TileErrorEnum e);

/// Terminal failure of one tile; reported through completion callbacks only.
struct NODISCARD TileError final
{
    TileErrorEnum kind = TileErrorEnum::FETCH_ERROR;
    QString message;

    NODISCARD bool operator==(const TileError &rhs) const
    {
        return kind == rhs.kind && message == rhs.message;
    }
    NODISCARD bool operator!=(const TileError &rhs) const { return !(*this == rhs); }
};
