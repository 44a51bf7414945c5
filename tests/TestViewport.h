#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../src/global/macros.h"

#include <QObject>

class NODISCARD_QOBJECT TestViewport final : public QObject
{
    Q_OBJECT

public:
    TestViewport();
    ~TestViewport() final;

private Q_SLOTS:
    void exampleGridTest();
    void marginTest();
    void fractionalZoomTest();
    void antimeridianRepeatTest();
    void rowsOutsideWorldTest();
    void emptyWindowTest();
    void determinismTest();
    void anchorPreservingZoomTest();
    void anchorPreservingZoomTest_data();
    void zoomClampTest();
    void zoomInOutTest();
    void panTest();
    void panLatitudeClampTest();
    void screenConversionTest();
    void visibleAreaTest();
    void eventsTest();
};
