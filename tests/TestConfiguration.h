#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../src/global/macros.h"

#include <memory>

#include <QObject>

class QTemporaryDir;

class NODISCARD_QOBJECT TestConfiguration final : public QObject
{
    Q_OBJECT

private:
    std::unique_ptr<QTemporaryDir> m_settingsDir;

public:
    TestConfiguration();
    ~TestConfiguration() final;

private Q_SLOTS:
    void initTestCase();
    void init();

    void defaultsTest();
    void roundTripTest();
    void clampingTest();
    void zoomSwapTest();
    void changeMonitorTest();
};
