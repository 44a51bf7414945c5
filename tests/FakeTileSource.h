#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../src/tiles/TileSource.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <QBuffer>
#include <QByteArray>
#include <QColor>
#include <QImage>

/// Tile source whose answers are scripted per address, attempt by attempt.
///
/// Unscripted addresses return a valid PNG. A gated address blocks its
/// fetch until release() is called.
class NODISCARD FakeTileSource final : public ITileSource
{
private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::map<TileAddress, std::deque<FetchResult>> m_script;
    std::vector<TileAddress> m_calls;
    std::optional<TileAddress> m_gate;
    bool m_released = false;
    int m_delayMs = 0;
    int m_active = 0;
    int m_maxActive = 0;

public:
    explicit FakeTileSource(const QString &name = QStringLiteral("fake"))
        : ITileSource{TileSourceId::fromTemplate(QStringLiteral("https://") + name
                                                 + QStringLiteral(".test/{z}/{x}/{y}.png"))}
    {}
    ~FakeTileSource() final = default;
    DELETE_CTORS_AND_ASSIGN_OPS(FakeTileSource);

public:
    NODISCARD static QByteArray makePng(const QColor &color = Qt::darkGreen)
    {
        QImage image{16, 16, QImage::Format_ARGB32};
        image.fill(color);
        QByteArray bytes;
        QBuffer buffer{&bytes};
        buffer.open(QIODevice::WriteOnly);
        image.save(&buffer, "PNG");
        return bytes;
    }

    void script(const TileAddress &addr, std::vector<FetchResult> results)
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        auto &queue = m_script[addr];
        for (auto &r : results) {
            queue.push_back(std::move(r));
        }
    }

    void gate(const TileAddress &addr)
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        m_gate = addr;
        m_released = false;
    }

    void release()
    {
        {
            std::lock_guard<std::mutex> lock{m_mutex};
            m_released = true;
        }
        m_cv.notify_all();
    }

    void setDelayMs(const int ms)
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        m_delayMs = ms;
    }

    NODISCARD int getCallCount() const
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        return static_cast<int>(m_calls.size());
    }

    NODISCARD int getCallCount(const TileAddress &addr) const
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        return static_cast<int>(std::count(m_calls.begin(), m_calls.end(), addr));
    }

    NODISCARD std::vector<TileAddress> getCalls() const
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        return m_calls;
    }

    NODISCARD int getMaxActive() const
    {
        std::lock_guard<std::mutex> lock{m_mutex};
        return m_maxActive;
    }

private:
    NODISCARD FetchResult virt_fetch(const TileAddress &addr) final
    {
        int delayMs = 0;
        FetchResult result = FetchResult::ok(makePng());
        {
            std::unique_lock<std::mutex> lock{m_mutex};
            m_calls.push_back(addr);
            ++m_active;
            m_maxActive = std::max(m_maxActive, m_active);
            if (m_gate && *m_gate == addr) {
                m_cv.wait(lock, [this]() { return m_released; });
            }
            auto it = m_script.find(addr);
            if (it != m_script.end() && !it->second.empty()) {
                result = std::move(it->second.front());
                it->second.pop_front();
            }
            delayMs = m_delayMs;
        }
        if (delayMs > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{delayMs});
        }
        {
            std::lock_guard<std::mutex> lock{m_mutex};
            --m_active;
        }
        return result;
    }

    NODISCARD QString virt_describe(const TileAddress &addr) const final
    {
        return QStringLiteral("fake:%1/%2/%3").arg(addr.zoom).arg(addr.x).arg(addr.y);
    }
};
