#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#ifdef NDEBUG
static inline constexpr const bool IS_DEBUG_BUILD = false;
#else
static inline constexpr const bool IS_DEBUG_BUILD = true;
#endif
