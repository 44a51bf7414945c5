#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/ChangeMonitor.h"
#include "../global/RuleOf5.h"
#include "../global/macros.h"

#include <QSettings>
#include <QString>
#include <QtGlobal>

#define SUBGROUP() \
    friend class Configuration; \
    void read(const QSettings &conf); \
    void write(QSettings &conf) const

class NODISCARD Configuration final
{
public:
    void read();
    void write() const;
    void reset();

public:
    struct NODISCARD TileCacheSettings final
    {
        /// Decoded images kept in RAM.
        qint64 memoryBudgetBytes = 0;
        /// Encoded tiles kept on disk, per cache root.
        qint64 diskBudgetBytes = 0;
        int diskMaxAgeDays = 0;
        QString cacheDirectory;

    private:
        SUBGROUP();
    } tileCache;

    struct NODISCARD FetchSettings final
    {
        int maxConcurrentFetches = 0;
        int maxAttempts = 0;
        int backoffInitialMs = 0;
        int backoffMaxMs = 0;
        double backoffMultiplier = 0.0;
        int requestTimeoutMs = 0;
        QString userAgent;
        bool prioritizeVisible = false;

    private:
        SUBGROUP();
    } fetch;

    struct NODISCARD ViewportSettings final
    {
        int minZoom = 0;
        int maxZoom = 0;
        int tileSize = 0;
        int prefetchMarginTiles = 0;

    private:
        SUBGROUP();
    } viewport;

    struct NODISCARD LoaderSettings final
    {
    private:
        ChangeMonitor m_changeMonitor;
        int m_drainIntervalMs = 0;

    public:
        int drainBatchSize = 0;

    public:
        explicit LoaderSettings() = default;
        ~LoaderSettings() = default;
        DELETE_CTORS_AND_ASSIGN_OPS(LoaderSettings);

    public:
        NODISCARD int getDrainIntervalMs() const { return m_drainIntervalMs; }
        void setDrainIntervalMs(int ms);

        void registerChangeCallback(const ChangeMonitor::Lifetime &lifetime,
                                    const ChangeMonitor::Function &callback)
        {
            m_changeMonitor.registerChangeCallback(lifetime, callback);
        }

    private:
        SUBGROUP();
    } loader;

    struct NODISCARD TileSourceSettings final
    {
        QString tileUrlTemplate;

    private:
        SUBGROUP();
    } source;

public:
    DELETE_CTORS_AND_ASSIGN_OPS(Configuration);

private:
    Configuration();
    friend Configuration &setConfig();
};

#undef SUBGROUP

/// Must be called before you can call setConfig() or getConfig().
/// Please don't try to cheat it. Only call this function from main().
void setEnteredMain();
/// Returns a reference to the application configuration object.
NODISCARD Configuration &setConfig();
NODISCARD const Configuration &getConfig();
