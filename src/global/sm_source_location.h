#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "macros.h"

namespace sm {

/// Call site of a log statement, in the shape QMessageLogger takes it.
struct NODISCARD source_location final
{
    const char *file = "";
    const char *function = "";
    int line = 0;
};

} // namespace sm

#define SM_SOURCE_LOCATION() (::sm::source_location{__FILE__, __func__, __LINE__})
