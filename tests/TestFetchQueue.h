#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../src/global/macros.h"

#include <QObject>

class NODISCARD_QOBJECT TestFetchQueue final : public QObject
{
    Q_OBJECT

public:
    TestFetchQueue();
    ~TestFetchQueue() final;

private Q_SLOTS:
    void successTest();
    void deduplicationTest();
    void retryThenSuccessTest();
    void retryExhaustedTest();
    void notFoundTest();
    void decodeErrorTest();
    void diskHitTest();
    void noNegativeCachingTest();
    void abandonTest();
    void abandonKeepsOtherRequestersTest();
    void expiredLifetimeTest();
    void concurrencyBoundTest();
    void fifoOrderTest();
    void priorityOrderTest();
    void drainBatchTest();
    void backoffTest();
    void shutdownTest();
};
