#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "TileKey.h"

#include <mutex>
#include <optional>

#include <QByteArray>
#include <QString>
#include <QtGlobal>

/// Durable store of encoded tiles: <root>/<sourceId>/<z>/<x>/<y>.tile
///
/// Safe to call from several worker threads. Files are written atomically
/// and their modification time doubles as the last-access time.
class NODISCARD DiskTileCache final
{
public:
    struct NODISCARD Settings final
    {
        QString rootDirectory;
        qint64 budgetBytes = 512 * 1024 * 1024;
        int maxAgeDays = 30;
    };

    static constexpr int WRITES_PER_SWEEP = 256;

private:
    const Settings m_settings;
    mutable std::mutex m_mutex;
    /// Bytes on disk; -1 until the first sweep.
    qint64 m_bytesUsed = -1;
    int m_writesSinceSweep = 0;

public:
    explicit DiskTileCache(Settings settings);
    ~DiskTileCache() = default;
    DELETE_CTORS_AND_ASSIGN_OPS(DiskTileCache);

public:
    NODISCARD const Settings &getSettings() const { return m_settings; }
    NODISCARD QString pathFor(const TileKey &key) const;

    /// Expired files count as misses and are removed. A hit refreshes the file's age.
    NODISCARD std::optional<QByteArray> read(const TileKey &key) const;
    /// Returns false if the file could not be written.
    bool write(const TileKey &key, const QByteArray &bytes);
    bool remove(const TileKey &key);

    /// Removes every tile of one source.
    void clear(const TileSourceId &source);
    void clearAll();

    /// Drops expired files, then the oldest ones until the budget holds.
    void sweep();
    NODISCARD qint64 getBytesUsed();

private:
    void sweep_locked();
};
