// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "configuration.h"

#include "../global/logging.h"

#include <algorithm>
#include <atomic>
#include <stdexcept>
#include <utility>

#include <QDir>
#include <QStandardPaths>

namespace { // anonymous

std::atomic_bool g_enteredMain{false};

constexpr qint64 MiB = 1024 * 1024;

constexpr qint64 DEFAULT_MEMORY_BUDGET = 64 * MiB;
constexpr qint64 DEFAULT_DISK_BUDGET = 512 * MiB;
constexpr int DEFAULT_DISK_MAX_AGE_DAYS = 30;

constexpr int DEFAULT_MAX_CONCURRENT_FETCHES = 4;
constexpr int MAX_CONCURRENT_FETCHES_LIMIT = 16;
constexpr int DEFAULT_MAX_ATTEMPTS = 3;
constexpr int DEFAULT_BACKOFF_INITIAL_MS = 250;
constexpr int DEFAULT_BACKOFF_MAX_MS = 4000;
constexpr double DEFAULT_BACKOFF_MULTIPLIER = 2.0;
constexpr int DEFAULT_REQUEST_TIMEOUT_MS = 10000;

constexpr int DEFAULT_MIN_ZOOM = 0;
constexpr int DEFAULT_MAX_ZOOM = 19;
constexpr int DEFAULT_TILE_SIZE = 256;
constexpr int DEFAULT_PREFETCH_MARGIN = 1;

constexpr int DEFAULT_DRAIN_INTERVAL_MS = 100;
constexpr int DEFAULT_DRAIN_BATCH_SIZE = 64;

// Group names
const QString GRP_TILE_CACHE = QStringLiteral("Tile Cache");
const QString GRP_FETCH = QStringLiteral("Fetch");
const QString GRP_VIEWPORT = QStringLiteral("Viewport");
const QString GRP_LOADER = QStringLiteral("Loader");
const QString GRP_SOURCE = QStringLiteral("Tile Source");

// Keys
const QString KEY_MEMORY_BUDGET = QStringLiteral("Memory budget bytes");
const QString KEY_DISK_BUDGET = QStringLiteral("Disk budget bytes");
const QString KEY_DISK_MAX_AGE_DAYS = QStringLiteral("Disk max age days");
const QString KEY_CACHE_DIRECTORY = QStringLiteral("Cache directory");
const QString KEY_MAX_CONCURRENT_FETCHES = QStringLiteral("Max concurrent fetches");
const QString KEY_MAX_ATTEMPTS = QStringLiteral("Max attempts");
const QString KEY_BACKOFF_INITIAL_MS = QStringLiteral("Backoff initial ms");
const QString KEY_BACKOFF_MAX_MS = QStringLiteral("Backoff max ms");
const QString KEY_BACKOFF_MULTIPLIER = QStringLiteral("Backoff multiplier");
const QString KEY_REQUEST_TIMEOUT_MS = QStringLiteral("Request timeout ms");
const QString KEY_USER_AGENT = QStringLiteral("User agent");
const QString KEY_PRIORITIZE_VISIBLE = QStringLiteral("Prioritize visible tiles");
const QString KEY_MIN_ZOOM = QStringLiteral("Min zoom");
const QString KEY_MAX_ZOOM = QStringLiteral("Max zoom");
const QString KEY_TILE_SIZE = QStringLiteral("Tile size");
const QString KEY_PREFETCH_MARGIN = QStringLiteral("Prefetch margin tiles");
const QString KEY_DRAIN_INTERVAL_MS = QStringLiteral("Drain interval ms");
const QString KEY_DRAIN_BATCH_SIZE = QStringLiteral("Drain batch size");
const QString KEY_TILE_URL_TEMPLATE = QStringLiteral("Tile URL template");

NODISCARD QString getDefaultUserAgent()
{
    return QStringLiteral("SlippyMapper/1.0");
}

NODISCARD QString getDefaultTileUrlTemplate()
{
    return QStringLiteral("https://tile.openstreetmap.org/{z}/{x}/{y}.png");
}

NODISCARD QString getDefaultCacheDirectory()
{
    const QString base = QStandardPaths::writableLocation(QStandardPaths::CacheLocation);
    if (base.isEmpty()) {
        return QDir::temp().filePath(QStringLiteral("slippymapper/tiles"));
    }
    return QDir{base}.filePath(QStringLiteral("tiles"));
}

NODISCARD int readInt(
    const QSettings &conf, const QString &key, const int def, const int lo, const int hi)
{
    bool ok = false;
    const int value = conf.value(key, def).toInt(&ok);
    if (!ok) {
        SMLOG_WARNING() << "Ignoring invalid value for " << key << "; using " << def;
        return def;
    }
    return std::clamp(value, lo, hi);
}

NODISCARD qint64 readInt64(const QSettings &conf,
                           const QString &key,
                           const qint64 def,
                           const qint64 lo,
                           const qint64 hi)
{
    bool ok = false;
    const qint64 value = conf.value(key, def).toLongLong(&ok);
    if (!ok) {
        SMLOG_WARNING() << "Ignoring invalid value for " << key << "; using " << def;
        return def;
    }
    return std::clamp(value, lo, hi);
}

NODISCARD double readDouble(
    const QSettings &conf, const QString &key, const double def, const double lo, const double hi)
{
    bool ok = false;
    const double value = conf.value(key, def).toDouble(&ok);
    if (!ok) {
        SMLOG_WARNING() << "Ignoring invalid value for " << key << "; using " << def;
        return def;
    }
    return std::clamp(value, lo, hi);
}

NODISCARD QString readString(const QSettings &conf, const QString &key, const QString &def)
{
    const QString value = conf.value(key, def).toString();
    return value.isEmpty() ? def : value;
}

} // namespace

Configuration::Configuration()
{
    read();
}

void Configuration::read()
{
    QSettings conf;

#define FOREACH_SUBGROUP(X) \
    X(tileCache, GRP_TILE_CACHE) \
    X(fetch, GRP_FETCH) \
    X(viewport, GRP_VIEWPORT) \
    X(loader, GRP_LOADER) \
    X(source, GRP_SOURCE)

#define X_READ(_member, _group) \
    conf.beginGroup(_group); \
    _member.read(conf); \
    conf.endGroup();

    FOREACH_SUBGROUP(X_READ)
#undef X_READ
}

void Configuration::write() const
{
    QSettings conf;

#define X_WRITE(_member, _group) \
    conf.beginGroup(_group); \
    _member.write(conf); \
    conf.endGroup();

    FOREACH_SUBGROUP(X_WRITE)
#undef X_WRITE
#undef FOREACH_SUBGROUP
}

void Configuration::reset()
{
    SMLOG_INFO() << "Resetting configuration to defaults";
    {
        QSettings conf;
        conf.clear();
    }
    read();
}

void Configuration::TileCacheSettings::read(const QSettings &conf)
{
    constexpr qint64 MAX_BUDGET = qint64{1} << 40;
    memoryBudgetBytes = readInt64(conf, KEY_MEMORY_BUDGET, DEFAULT_MEMORY_BUDGET, 0, MAX_BUDGET);
    diskBudgetBytes = readInt64(conf, KEY_DISK_BUDGET, DEFAULT_DISK_BUDGET, 0, MAX_BUDGET);
    diskMaxAgeDays = readInt(conf, KEY_DISK_MAX_AGE_DAYS, DEFAULT_DISK_MAX_AGE_DAYS, 1, 3650);
    cacheDirectory = readString(conf, KEY_CACHE_DIRECTORY, getDefaultCacheDirectory());
}

void Configuration::TileCacheSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_MEMORY_BUDGET, memoryBudgetBytes);
    conf.setValue(KEY_DISK_BUDGET, diskBudgetBytes);
    conf.setValue(KEY_DISK_MAX_AGE_DAYS, diskMaxAgeDays);
    conf.setValue(KEY_CACHE_DIRECTORY, cacheDirectory);
}

void Configuration::FetchSettings::read(const QSettings &conf)
{
    maxConcurrentFetches = readInt(conf,
                                   KEY_MAX_CONCURRENT_FETCHES,
                                   DEFAULT_MAX_CONCURRENT_FETCHES,
                                   1,
                                   MAX_CONCURRENT_FETCHES_LIMIT);
    maxAttempts = readInt(conf, KEY_MAX_ATTEMPTS, DEFAULT_MAX_ATTEMPTS, 1, 10);
    backoffInitialMs = readInt(conf, KEY_BACKOFF_INITIAL_MS, DEFAULT_BACKOFF_INITIAL_MS, 0, 60000);
    backoffMaxMs = readInt(conf, KEY_BACKOFF_MAX_MS, DEFAULT_BACKOFF_MAX_MS, 0, 600000);
    backoffMaxMs = std::max(backoffMaxMs, backoffInitialMs);
    backoffMultiplier = readDouble(conf,
                                   KEY_BACKOFF_MULTIPLIER,
                                   DEFAULT_BACKOFF_MULTIPLIER,
                                   1.0,
                                   10.0);
    requestTimeoutMs = readInt(conf,
                               KEY_REQUEST_TIMEOUT_MS,
                               DEFAULT_REQUEST_TIMEOUT_MS,
                               100,
                               300000);
    userAgent = readString(conf, KEY_USER_AGENT, getDefaultUserAgent());
    prioritizeVisible = conf.value(KEY_PRIORITIZE_VISIBLE, false).toBool();
}

void Configuration::FetchSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_MAX_CONCURRENT_FETCHES, maxConcurrentFetches);
    conf.setValue(KEY_MAX_ATTEMPTS, maxAttempts);
    conf.setValue(KEY_BACKOFF_INITIAL_MS, backoffInitialMs);
    conf.setValue(KEY_BACKOFF_MAX_MS, backoffMaxMs);
    conf.setValue(KEY_BACKOFF_MULTIPLIER, backoffMultiplier);
    conf.setValue(KEY_REQUEST_TIMEOUT_MS, requestTimeoutMs);
    conf.setValue(KEY_USER_AGENT, userAgent);
    conf.setValue(KEY_PRIORITIZE_VISIBLE, prioritizeVisible);
}

void Configuration::ViewportSettings::read(const QSettings &conf)
{
    minZoom = readInt(conf, KEY_MIN_ZOOM, DEFAULT_MIN_ZOOM, 0, 24);
    maxZoom = readInt(conf, KEY_MAX_ZOOM, DEFAULT_MAX_ZOOM, 0, 24);
    if (maxZoom < minZoom) {
        SMLOG_WARNING() << "Max zoom " << maxZoom << " is below min zoom " << minZoom
                        << "; swapping";
        std::swap(minZoom, maxZoom);
    }
    tileSize = readInt(conf, KEY_TILE_SIZE, DEFAULT_TILE_SIZE, 64, 1024);
    prefetchMarginTiles = readInt(conf, KEY_PREFETCH_MARGIN, DEFAULT_PREFETCH_MARGIN, 0, 4);
}

void Configuration::ViewportSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_MIN_ZOOM, minZoom);
    conf.setValue(KEY_MAX_ZOOM, maxZoom);
    conf.setValue(KEY_TILE_SIZE, tileSize);
    conf.setValue(KEY_PREFETCH_MARGIN, prefetchMarginTiles);
}

void Configuration::LoaderSettings::setDrainIntervalMs(const int ms)
{
    const int clamped = std::max(1, ms);
    if (clamped == m_drainIntervalMs) {
        return;
    }
    m_drainIntervalMs = clamped;
    m_changeMonitor.notifyAll();
}

void Configuration::LoaderSettings::read(const QSettings &conf)
{
    setDrainIntervalMs(readInt(conf, KEY_DRAIN_INTERVAL_MS, DEFAULT_DRAIN_INTERVAL_MS, 1, 10000));
    drainBatchSize = readInt(conf, KEY_DRAIN_BATCH_SIZE, DEFAULT_DRAIN_BATCH_SIZE, 1, 4096);
}

void Configuration::LoaderSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_DRAIN_INTERVAL_MS, m_drainIntervalMs);
    conf.setValue(KEY_DRAIN_BATCH_SIZE, drainBatchSize);
}

void Configuration::TileSourceSettings::read(const QSettings &conf)
{
    tileUrlTemplate = readString(conf, KEY_TILE_URL_TEMPLATE, getDefaultTileUrlTemplate());
}

void Configuration::TileSourceSettings::write(QSettings &conf) const
{
    conf.setValue(KEY_TILE_URL_TEMPLATE, tileUrlTemplate);
}

void setEnteredMain()
{
    g_enteredMain = true;
}

Configuration &setConfig()
{
    if (!g_enteredMain) {
        throw std::runtime_error("configuration accessed before main()");
    }
    static Configuration conf;
    return conf;
}

const Configuration &getConfig()
{
    return setConfig();
}
