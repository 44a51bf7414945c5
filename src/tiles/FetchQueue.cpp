// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "FetchQueue.h"

#include "../global/logging.h"
#include "../global/utils.h"

#include <algorithm>
#include <cmath>
#include <exception>
#include <tuple>
#include <utility>

namespace { // anonymous

constexpr int MAX_WORKERS = 16;

NODISCARD long long toMillis(const FetchQueue::Clock::duration d)
{
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(d).count());
}

} // namespace

FetchQueue::FetchQueue(TileCache &cache, const Settings &settings)
    : m_settings{settings}
    , m_cache{cache}
{
    const int workers = std::clamp(m_settings.maxConcurrentFetches, 1, MAX_WORKERS);
    m_workers.reserve(static_cast<size_t>(workers));
    for (int i = 0; i < workers; ++i) {
        m_workers.emplace_back([this]() { workerLoop(); });
    }
    SMLOG_DEBUG() << "Started " << workers << " tile fetch worker(s)";
}

FetchQueue::~FetchQueue()
{
    shutdown();
}

std::chrono::milliseconds FetchQueue::computeBackoff(const Settings &settings, const int attempt)
{
    const double initial = static_cast<double>(std::max(0, settings.backoffInitialMs));
    const double cap = static_cast<double>(std::max(settings.backoffInitialMs, settings.backoffMaxMs));
    const double factor = std::pow(std::max(1.0, settings.backoffMultiplier),
                                   static_cast<double>(std::max(0, attempt - 1)));
    const double delay = std::min(cap, initial * factor);
    return std::chrono::milliseconds{static_cast<long long>(delay)};
}

bool FetchQueue::request(const TileKey &key,
                         const std::shared_ptr<ITileSource> &source,
                         const FetchPriorityEnum priority,
                         const Signal2Lifetime &lifetime,
                         Callback callback)
{
    std::ignore = deref(source);

    const auto it = m_tasks.find(key);
    if (it != m_tasks.end()) {
        it->second.waiters.push_back(Waiter{lifetime.getObj(), std::move(callback)});
        return false;
    }

    if (isShutdown()) {
        SMLOG_WARNING() << "Fetch queue is shut down; ignoring request for " << key;
        return false;
    }

    Task task;
    task.started = Clock::now();
    task.waiters.push_back(Waiter{lifetime.getObj(), std::move(callback)});
    m_tasks.emplace(key, std::move(task));

    Job job;
    job.key = key;
    job.source = source;
    job.priority = priority;
    enqueue(std::move(job));
    return true;
}

void FetchQueue::abandon(const TileKey &key, const Signal2Lifetime &lifetime)
{
    const auto it = m_tasks.find(key);
    if (it == m_tasks.end()) {
        return;
    }

    const auto obj = lifetime.getObj().lock();
    auto &waiters = it->second.waiters;
    waiters.erase(std::remove_if(waiters.begin(),
                                 waiters.end(),
                                 [&obj](const Waiter &w) {
                                     const auto owner = w.lifetime.lock();
                                     return owner == nullptr || owner == obj;
                                 }),
                  waiters.end());
}

size_t FetchQueue::drain(const size_t maxItems)
{
    std::vector<FetchOutcome> batch;
    {
        std::lock_guard<std::mutex> lock{m_doneMutex};
        const size_t n = std::min(maxItems, m_done.size());
        batch.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            batch.emplace_back(std::move(m_done.front()));
            m_done.pop_front();
        }
    }

    for (const FetchOutcome &outcome : batch) {
        if (outcome.image) {
            m_cache.insertMemory(outcome.key, *outcome.image);
        }

        const auto it = m_tasks.find(outcome.key);
        if (it == m_tasks.end()) {
            continue;
        }

        // Remove first so that a callback may start a fresh task for the same key.
        const Task task = std::move(it->second);
        m_tasks.erase(it);

        SMLOG_DEBUG() << "Tile " << outcome.key << (outcome.isSuccess() ? " loaded" : " failed")
                      << (outcome.fromDisk ? " from disk" : "") << " in "
                      << toMillis(Clock::now() - task.started) << " ms after "
                      << outcome.attempts << " attempt(s)";

        for (const Waiter &waiter : task.waiters) {
            if (const auto alive = waiter.lifetime.lock()) {
                waiter.callback(outcome);
            }
        }
    }
    return batch.size();
}

void FetchQueue::shutdown()
{
    if (isShutdown()) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock{m_jobMutex};
        m_stopping = true;
        m_jobs.clear();
    }
    m_jobCv.notify_all();
    for (std::thread &t : m_workers) {
        t.join();
    }
    m_workers.clear();
    SMLOG_DEBUG() << "Tile fetch workers stopped with " << m_tasks.size() << " task(s) pending";
}

void FetchQueue::enqueue(Job job)
{
    {
        std::lock_guard<std::mutex> lock{m_jobMutex};
        if (m_stopping) {
            return;
        }
        m_jobs.emplace_back(std::move(job));
    }
    m_jobCv.notify_one();
}

std::optional<FetchQueue::Job> FetchQueue::takeJob()
{
    std::unique_lock<std::mutex> lock{m_jobMutex};
    while (!m_stopping) {
        const auto now = Clock::now();
        auto best = m_jobs.end();
        std::optional<Clock::time_point> earliest;

        for (auto it = m_jobs.begin(); it != m_jobs.end(); ++it) {
            if (it->notBefore > now) {
                if (!earliest || it->notBefore < *earliest) {
                    earliest = it->notBefore;
                }
                continue;
            }
            if (best == m_jobs.end()) {
                best = it;
                if (!m_settings.prioritizeVisible || it->priority == FetchPriorityEnum::VISIBLE) {
                    break;
                }
            } else if (it->priority == FetchPriorityEnum::VISIBLE) {
                best = it;
                break;
            }
        }

        if (best != m_jobs.end()) {
            Job job = std::move(*best);
            m_jobs.erase(best);
            return job;
        }

        if (earliest) {
            m_jobCv.wait_until(lock, *earliest);
        } else {
            m_jobCv.wait(lock);
        }
    }
    return std::nullopt;
}

void FetchQueue::workerLoop()
{
    while (std::optional<Job> job = takeJob()) {
        const TileKey key = job->key;
        const int attempts = job->attempt + 1;
        try {
            process(std::move(*job));
        } catch (const std::exception &ex) {
            SMLOG_ERROR() << "Exception while fetching " << key << ": " << ex.what();
            FetchOutcome outcome;
            outcome.key = key;
            outcome.attempts = attempts;
            outcome.error = TileError{TileErrorEnum::FETCH_ERROR, QString::fromUtf8(ex.what())};
            complete(std::move(outcome));
        }
    }
}

void FetchQueue::process(Job job)
{
    const int attempt = job.attempt + 1;

    FetchOutcome outcome;
    outcome.key = job.key;
    outcome.attempts = attempt;

    if (job.attempt == 0) {
        if (auto image = m_cache.loadFromDisk(job.key)) {
            outcome.image = std::move(image);
            outcome.fromDisk = true;
            outcome.attempts = 0;
            complete(std::move(outcome));
            return;
        }
    }

    const FetchResult result = deref(job.source).fetch(job.key.address);
    switch (result.status) {
    case FetchStatusEnum::OK:
        if (auto image = decodeTileImage(result.bytes)) {
            std::ignore = m_cache.storeOnDisk(job.key, result.bytes);
            outcome.image = std::move(image);
        } else {
            outcome.error = TileError{TileErrorEnum::DECODE_ERROR,
                                      QStringLiteral("undecodable tile data (%1 bytes)")
                                          .arg(result.bytes.size())};
        }
        break;

    case FetchStatusEnum::NOT_FOUND:
        outcome.error = TileError{TileErrorEnum::NOT_FOUND, result.message};
        break;

    case FetchStatusEnum::TRANSIENT:
        if (attempt < m_settings.maxAttempts) {
            const auto delay = computeBackoff(m_settings, attempt);
            SMLOG_DEBUG() << "Attempt " << attempt << " for " << job.key << " failed ("
                          << result.message << "); retrying in " << delay.count() << " ms";
            job.attempt = attempt;
            job.notBefore = Clock::now() + delay;
            enqueue(std::move(job));
            return;
        }
        outcome.error = TileError{TileErrorEnum::FETCH_ERROR, result.message};
        break;
    }

    if (outcome.error) {
        SMLOG_WARNING() << "Fetching " << job.key << " failed after " << attempt
                        << " attempt(s): " << getName(outcome.error->kind) << ": "
                        << outcome.error->message;
    }
    complete(std::move(outcome));
}

void FetchQueue::complete(FetchOutcome outcome)
{
    std::lock_guard<std::mutex> lock{m_doneMutex};
    m_done.emplace_back(std::move(outcome));
}
