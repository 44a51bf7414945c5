#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/RuleOf5.h"
#include "../global/Signal2.h"
#include "../global/macros.h"
#include "TileCache.h"
#include "TileError.h"
#include "TileKey.h"
#include "TileSource.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>

#include <QImage>

enum class NODISCARD FetchPriorityEnum { VISIBLE, PREFETCH };

/// Result of one task, delivered to every callback attached to it.
struct NODISCARD FetchOutcome final
{
    TileKey key;
    std::optional<QImage> image;
    std::optional<TileError> error;
    int attempts = 0;
    bool fromDisk = false;

    NODISCARD bool isSuccess() const { return image.has_value(); }
};

/// Deduplicating fetch pipeline.
///
/// request(), abandon() and drain() belong to the UI context. A fixed pool of
/// worker threads looks up the disk tier, calls the tile source and decodes
/// the bytes; results travel back through a locked completion queue and are
/// only acted upon inside drain().
class NODISCARD FetchQueue final
{
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void(const FetchOutcome &)>;

    struct NODISCARD Settings final
    {
        int maxConcurrentFetches = 4;
        int maxAttempts = 3;
        int backoffInitialMs = 250;
        int backoffMaxMs = 4000;
        double backoffMultiplier = 2.0;
        bool prioritizeVisible = false;
    };

private:
    struct NODISCARD Waiter final
    {
        std::weak_ptr<Signal2Lifetime::Obj> lifetime;
        Callback callback;
    };

    // UI context only.
    struct NODISCARD Task final
    {
        std::vector<Waiter> waiters;
        Clock::time_point started;
    };

    struct NODISCARD Job final
    {
        TileKey key;
        std::shared_ptr<ITileSource> source;
        FetchPriorityEnum priority = FetchPriorityEnum::VISIBLE;
        int attempt = 0;
        Clock::time_point notBefore;
    };

private:
    const Settings m_settings;
    TileCache &m_cache;

    std::unordered_map<TileKey, Task> m_tasks;

    std::mutex m_jobMutex;
    std::condition_variable m_jobCv;
    std::deque<Job> m_jobs;
    bool m_stopping = false;

    std::mutex m_doneMutex;
    std::deque<FetchOutcome> m_done;

    std::vector<std::thread> m_workers;

public:
    FetchQueue(TileCache &cache, const Settings &settings);
    ~FetchQueue();
    DELETE_CTORS_AND_ASSIGN_OPS(FetchQueue);

public:
    /// Attaches the callback to the live task for the key, or starts a new one.
    /// Returns true if a new task was created.
    bool request(const TileKey &key,
                 const std::shared_ptr<ITileSource> &source,
                 FetchPriorityEnum priority,
                 const Signal2Lifetime &lifetime,
                 Callback callback);

    /// Forgets the callbacks the given requester attached to a pending task.
    /// Other requesters keep theirs. The fetch itself keeps going and its
    /// image still reaches the memory tier.
    void abandon(const TileKey &key, const Signal2Lifetime &lifetime);

    /// Delivers up to maxItems finished tasks. Returns the number delivered.
    size_t drain(size_t maxItems);

    NODISCARD bool isPending(const TileKey &key) const { return m_tasks.count(key) != 0; }
    NODISCARD size_t getPendingCount() const { return m_tasks.size(); }

    /// Stops the workers and drops queued jobs. Pending tasks never complete.
    void shutdown();
    NODISCARD bool isShutdown() const { return m_workers.empty(); }

    NODISCARD const Settings &getSettings() const { return m_settings; }

    /// Delay before the given (1-based) retry.
    NODISCARD static std::chrono::milliseconds computeBackoff(const Settings &settings,
                                                              int attempt);

private:
    void workerLoop();
    NODISCARD std::optional<Job> takeJob();
    void process(Job job);
    void complete(FetchOutcome outcome);
    void enqueue(Job job);
};
