// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TileLoader.h"

#include "../global/logging.h"

#include <algorithm>
#include <tuple>
#include <utility>

TileLoader::TileLoader(std::shared_ptr<ITileSource> source, const Settings &settings)
    : m_cache{settings.cache}
    , m_queue{m_cache, settings.fetch}
    , m_source{std::move(source)}
    , m_drainBatchSize{std::max(1, settings.drainBatchSize)}
{
    std::ignore = deref(m_source);
    m_drainTimer.setInterval(std::max(1, settings.drainIntervalMs));
    QObject::connect(&m_drainTimer, &QTimer::timeout, &m_drainTimer, [this]() {
        std::ignore = drainCompleted(static_cast<size_t>(m_drainBatchSize));
    });
}

TileLoader::~TileLoader()
{
    m_drainTimer.stop();
    m_queue.shutdown();
}

TileLoader::Settings TileLoader::settingsFromConfig(const Configuration &config)
{
    Settings s;

    const auto &cache = config.tileCache;
    s.cache.memoryBudgetBytes = cache.memoryBudgetBytes;
    s.cache.disk.rootDirectory = cache.cacheDirectory;
    s.cache.disk.budgetBytes = cache.diskBudgetBytes;
    s.cache.disk.maxAgeDays = cache.diskMaxAgeDays;

    const auto &fetch = config.fetch;
    s.fetch.maxConcurrentFetches = fetch.maxConcurrentFetches;
    s.fetch.maxAttempts = fetch.maxAttempts;
    s.fetch.backoffInitialMs = fetch.backoffInitialMs;
    s.fetch.backoffMaxMs = fetch.backoffMaxMs;
    s.fetch.backoffMultiplier = fetch.backoffMultiplier;
    s.fetch.prioritizeVisible = fetch.prioritizeVisible;

    s.drainIntervalMs = config.loader.getDrainIntervalMs();
    s.drainBatchSize = config.loader.drainBatchSize;
    return s;
}

TileKey TileLoader::makeKey(const TileAddress &address) const
{
    return TileKey{deref(m_source).getId(), address};
}

TileLookup TileLoader::getOrSchedule(const TileAddress &address, const FetchPriorityEnum priority)
{
    TileLookup lookup;

    const ITileSource &source = deref(m_source);
    if (!address.isValid() || address.zoom < source.getMinZoom()
        || address.zoom > source.getMaxZoom()) {
        lookup.status = TileStatusEnum::FAILED;
        lookup.error = TileError{TileErrorEnum::NOT_FOUND,
                                 QStringLiteral("tile address outside the tile grid")};
        return lookup;
    }

    const TileKey key = makeKey(address);
    if (std::optional<QImage> image = m_cache.lookupMemory(key)) {
        lookup.status = TileStatusEnum::READY;
        lookup.image = std::move(*image);
        return lookup;
    }

    if (const auto failed = m_failed.find(key); failed != m_failed.end()) {
        lookup.status = TileStatusEnum::FAILED;
        lookup.error = failed->second;
        return lookup;
    }

    if (m_queue.isShutdown()) {
        lookup.status = TileStatusEnum::FAILED;
        lookup.error = TileError{TileErrorEnum::FETCH_ERROR, QStringLiteral("loader is shut down")};
        return lookup;
    }

    if (m_attached.count(key) == 0) {
        m_attached.insert(key);
        m_queue.request(key, m_source, priority, m_lifetime, [this](const FetchOutcome &outcome) {
            onFetched(outcome);
        });
    }

    lookup.status = TileStatusEnum::PENDING;
    return lookup;
}

size_t TileLoader::drainCompleted(const size_t maxItems)
{
    return m_queue.drain(maxItems);
}

void TileLoader::onFetched(const FetchOutcome &outcome)
{
    m_attached.erase(outcome.key);
    if (outcome.key.source != deref(m_source).getId()) {
        return;
    }

    if (outcome.isSuccess()) {
        m_failed.erase(outcome.key);
        sig_tileReady.invoke(outcome.key.address);
    } else if (outcome.error) {
        m_failed.insert_or_assign(outcome.key, *outcome.error);
        sig_tileFailed.invoke(outcome.key.address, *outcome.error);
    }
}

void TileLoader::updateVisibleTiles(const std::vector<VisibleTile> &tiles)
{
    TileKeySet wanted;
    for (const VisibleTile &tile : tiles) {
        wanted.insert(makeKey(tile.address));
    }

    for (auto it = m_attached.begin(); it != m_attached.end();) {
        if (wanted.count(*it) == 0) {
            m_queue.abandon(*it, m_lifetime);
            it = m_attached.erase(it);
        } else {
            ++it;
        }
    }

    m_cache.setPinned(std::move(wanted));
    m_failed.clear();

    for (const VisibleTile &tile : tiles) {
        std::ignore = getOrSchedule(tile.address,
                                    tile.isMargin ? FetchPriorityEnum::PREFETCH
                                                  : FetchPriorityEnum::VISIBLE);
    }
}

void TileLoader::abandonAll()
{
    for (const TileKey &key : m_attached) {
        m_queue.abandon(key, m_lifetime);
    }
    m_attached.clear();
}

void TileLoader::setTileSource(std::shared_ptr<ITileSource> source)
{
    std::ignore = deref(source);
    if (source == m_source) {
        return;
    }

    SMLOG_INFO() << "Switching tile source from " << m_source->getId().toQString() << " to "
                 << source->getId().toQString();

    abandonAll();
    m_failed.clear();
    m_cache.setPinned(TileKeySet{});
    m_cache.clearMemory();
    m_source = std::move(source);
}

void TileLoader::startDrainTimer()
{
    m_drainTimer.start();
}

void TileLoader::stopDrainTimer()
{
    m_drainTimer.stop();
}

void TileLoader::setDrainInterval(const int ms)
{
    // Restarts the timer if it is running.
    m_drainTimer.setInterval(std::max(1, ms));
}

void TileLoader::setDrainBatchSize(const int items)
{
    m_drainBatchSize = std::max(1, items);
}

void TileLoader::followConfiguration(Configuration::LoaderSettings &settings)
{
    setDrainInterval(settings.getDrainIntervalMs());
    setDrainBatchSize(settings.drainBatchSize);
    settings.registerChangeCallback(m_lifetime, [this, &settings]() {
        SMLOG_DEBUG() << "Drain interval is now " << settings.getDrainIntervalMs() << " ms";
        setDrainInterval(settings.getDrainIntervalMs());
        setDrainBatchSize(settings.drainBatchSize);
    });
}
