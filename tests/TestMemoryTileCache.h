#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../src/global/macros.h"

#include <QObject>

class NODISCARD_QOBJECT TestMemoryTileCache final : public QObject
{
    Q_OBJECT

public:
    TestMemoryTileCache();
    ~TestMemoryTileCache() final;

private Q_SLOTS:
    void putGetTest();
    void lruEvictionTest();
    void budgetInvariantTest();
    void pinnedTest();
    void oversizedEntryTest();
    void replaceTest();
    void statsTest();
    void keyNamespaceTest();
};
