#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../configuration/configuration.h"
#include "../display/Viewport.h"
#include "../geo/TileAddress.h"
#include "../global/RuleOf5.h"
#include "../global/Signal2.h"
#include "../global/utils.h"
#include "../global/macros.h"
#include "FetchQueue.h"
#include "TileCache.h"
#include "TileError.h"
#include "TileKey.h"
#include "TileSource.h"

#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include <QImage>
#include <QTimer>

enum class NODISCARD TileStatusEnum { READY, PENDING, FAILED };

struct NODISCARD TileLookup final
{
    TileStatusEnum status = TileStatusEnum::PENDING;
    QImage image;
    std::optional<TileError> error;
};

/// What the map widget talks to: "this tile now if cached, otherwise later".
///
/// Everything here runs in the UI context. Finished fetches are picked up by
/// drainCompleted(), either called by the host or driven by the drain timer.
class NODISCARD TileLoader final
{
public:
    struct NODISCARD Settings final
    {
        TileCache::Settings cache;
        FetchQueue::Settings fetch;
        int drainIntervalMs = 100;
        int drainBatchSize = 64;
    };

private:
    // Declared before the queue: the workers must stop before the cache goes away.
    TileCache m_cache;
    FetchQueue m_queue;
    std::shared_ptr<ITileSource> m_source;
    /// Keys whose pending task carries our callback.
    std::unordered_set<TileKey> m_attached;
    /// Failures reported as FAILED until the next viewport pass.
    std::unordered_map<TileKey, TileError> m_failed;
    QTimer m_drainTimer;
    int m_drainBatchSize = 64;
    Signal2Lifetime m_lifetime;

public:
    Signal2<TileAddress> sig_tileReady;
    Signal2<TileAddress, TileError> sig_tileFailed;

public:
    TileLoader(std::shared_ptr<ITileSource> source, const Settings &settings);
    ~TileLoader();
    DELETE_CTORS_AND_ASSIGN_OPS(TileLoader);

    NODISCARD static Settings settingsFromConfig(const Configuration &config);

public:
    NODISCARD TileLookup getOrSchedule(const TileAddress &address,
                                       FetchPriorityEnum priority = FetchPriorityEnum::VISIBLE);
    size_t drainCompleted(size_t maxItems);

    /// Pins the given tiles, abandons pending tiles that left the view and
    /// schedules the missing ones (border tiles as prefetch). Earlier
    /// failures are forgotten, so failed tiles still in view are retried.
    void updateVisibleTiles(const std::vector<VisibleTile> &tiles);

    /// Switches sources: the memory tier, pins and failures are dropped and
    /// pending tiles of the old source are abandoned. Disk namespaces stay separate.
    void setTileSource(std::shared_ptr<ITileSource> source);
    NODISCARD const ITileSource &getTileSource() const { return deref(m_source); }

    void startDrainTimer();
    void stopDrainTimer();
    NODISCARD bool isDrainTimerActive() const { return m_drainTimer.isActive(); }
    void setDrainInterval(int ms);
    NODISCARD int getDrainInterval() const { return m_drainTimer.interval(); }
    void setDrainBatchSize(int items);

    /// Keeps the drain interval in sync with the configuration.
    void followConfiguration(Configuration::LoaderSettings &settings);

    NODISCARD TileCache &getCache() { return m_cache; }
    NODISCARD const FetchQueue &getQueue() const { return m_queue; }

private:
    NODISCARD TileKey makeKey(const TileAddress &address) const;
    void onFetched(const FetchOutcome &outcome);
    void abandonAll();
};
