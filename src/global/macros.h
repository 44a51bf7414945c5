#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#define NODISCARD [[nodiscard]]

// moc does not understand attributes in class heads.
#define NODISCARD_QOBJECT
