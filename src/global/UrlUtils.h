#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "macros.h"

#include <QString>

class QUrl;

namespace smqt {
void openUrl(const QUrl &url);

/// Substitutes the {z}, {x} and {y} placeholders of a tile template.
NODISCARD QString expandTileTemplate(const QString &tileTemplate, int z, int x, int y);

/// True for http:// and https:// templates.
NODISCARD bool isRemoteTemplate(const QString &tileTemplate);

/// Converts a local template (plain path or file:// URL) into a path template.
NODISCARD QString toLocalPathTemplate(const QString &tileTemplate);

/// Host name of a remote template, or an empty string if it cannot be parsed.
NODISCARD QString templateHost(const QString &tileTemplate);
} // namespace smqt
