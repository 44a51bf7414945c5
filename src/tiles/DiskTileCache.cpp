// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "DiskTileCache.h"

#include "../global/logging.h"

#include <algorithm>
#include <utility>
#include <vector>

#include <QDateTime>
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

namespace { // anonymous

const QString TILE_SUFFIX = QStringLiteral(".tile");

NODISCARD QDateTime expiryCutoff(const int maxAgeDays)
{
    return QDateTime::currentDateTimeUtc().addDays(-static_cast<qint64>(maxAgeDays));
}

NODISCARD bool isExpired(const QFileInfo &info, const int maxAgeDays)
{
    return info.lastModified().toUTC() < expiryCutoff(maxAgeDays);
}

struct NODISCARD FileRecord final
{
    QString path;
    qint64 size = 0;
    QDateTime lastAccess;
};

} // namespace

DiskTileCache::DiskTileCache(Settings settings)
    : m_settings{std::move(settings)}
{
    if (QDir{}.mkpath(m_settings.rootDirectory)) {
        SMLOG_INFO() << "Disk tile cache at " << m_settings.rootDirectory << " (budget "
                     << m_settings.budgetBytes << " bytes, max age " << m_settings.maxAgeDays
                     << " days)";
    } else {
        SMLOG_WARNING() << "Unable to create tile cache directory " << m_settings.rootDirectory;
    }
}

QString DiskTileCache::pathFor(const TileKey &key) const
{
    const TileAddress &a = key.address;
    return QStringLiteral("%1/%2/%3/%4/%5%6")
        .arg(m_settings.rootDirectory,
             key.source.toQString(),
             QString::number(a.zoom),
             QString::number(a.x),
             QString::number(a.y),
             TILE_SUFFIX);
}

std::optional<QByteArray> DiskTileCache::read(const TileKey &key) const
{
    const QString path = pathFor(key);
    const QFileInfo info{path};
    if (!info.isFile()) {
        return std::nullopt;
    }
    if (isExpired(info, m_settings.maxAgeDays)) {
        SMLOG_DEBUG() << "Expired tile " << key;
        QFile::remove(path);
        return std::nullopt;
    }

    QFile file{path};
    if (!file.open(QIODevice::ReadOnly)) {
        SMLOG_WARNING() << "Unable to read " << path << ": " << file.errorString();
        return std::nullopt;
    }
    QByteArray bytes = file.readAll();
    if (!file.setFileTime(QDateTime::currentDateTimeUtc(), QFileDevice::FileModificationTime)) {
        SMLOG_DEBUG() << "Unable to refresh access time of " << path;
    }
    return bytes;
}

bool DiskTileCache::write(const TileKey &key, const QByteArray &bytes)
{
    const QString path = pathFor(key);
    if (!QDir{}.mkpath(QFileInfo{path}.absolutePath())) {
        SMLOG_WARNING() << "Unable to create directory for " << path;
        return false;
    }

    const qint64 previous = QFileInfo{path}.exists() ? QFileInfo{path}.size() : 0;

    // QSaveFile writes a temporary file and renames it on commit.
    QSaveFile file{path};
    if (!file.open(QIODevice::WriteOnly)) {
        SMLOG_WARNING() << "Unable to write " << path << ": " << file.errorString();
        return false;
    }
    if (file.write(bytes) != bytes.size() || !file.commit()) {
        SMLOG_WARNING() << "Unable to write " << path << ": " << file.errorString();
        return false;
    }

    std::lock_guard<std::mutex> lock{m_mutex};
    if (m_bytesUsed >= 0) {
        m_bytesUsed += static_cast<qint64>(bytes.size()) - previous;
    }
    ++m_writesSinceSweep;
    if (m_bytesUsed < 0 || m_bytesUsed > m_settings.budgetBytes
        || m_writesSinceSweep >= WRITES_PER_SWEEP) {
        sweep_locked();
    }
    return true;
}

bool DiskTileCache::remove(const TileKey &key)
{
    const QString path = pathFor(key);
    const QFileInfo info{path};
    if (!info.isFile()) {
        return false;
    }
    const qint64 size = info.size();
    if (!QFile::remove(path)) {
        return false;
    }
    std::lock_guard<std::mutex> lock{m_mutex};
    if (m_bytesUsed >= 0) {
        m_bytesUsed = std::max<qint64>(0, m_bytesUsed - size);
    }
    return true;
}

void DiskTileCache::clear(const TileSourceId &source)
{
    std::lock_guard<std::mutex> lock{m_mutex};
    QDir dir{m_settings.rootDirectory + QLatin1Char('/') + source.toQString()};
    if (dir.exists() && !dir.removeRecursively()) {
        SMLOG_WARNING() << "Unable to clear " << dir.path();
    }
    m_bytesUsed = -1;
}

void DiskTileCache::clearAll()
{
    std::lock_guard<std::mutex> lock{m_mutex};
    QDir dir{m_settings.rootDirectory};
    if (dir.exists() && !dir.removeRecursively()) {
        SMLOG_WARNING() << "Unable to clear " << dir.path();
    }
    if (!QDir{}.mkpath(m_settings.rootDirectory)) {
        SMLOG_WARNING() << "Unable to recreate " << m_settings.rootDirectory;
    }
    m_bytesUsed = 0;
    m_writesSinceSweep = 0;
}

void DiskTileCache::sweep()
{
    std::lock_guard<std::mutex> lock{m_mutex};
    sweep_locked();
}

qint64 DiskTileCache::getBytesUsed()
{
    std::lock_guard<std::mutex> lock{m_mutex};
    if (m_bytesUsed < 0) {
        sweep_locked();
    }
    return m_bytesUsed;
}

void DiskTileCache::sweep_locked()
{
    m_writesSinceSweep = 0;

    std::vector<FileRecord> files;
    qint64 total = 0;
    size_t expired = 0;

    QDirIterator it{m_settings.rootDirectory,
                    QStringList{QStringLiteral("*") + TILE_SUFFIX},
                    QDir::Files,
                    QDirIterator::Subdirectories};
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo info = it.fileInfo();
        if (isExpired(info, m_settings.maxAgeDays)) {
            if (QFile::remove(path)) {
                ++expired;
                continue;
            }
        }
        total += info.size();
        files.push_back(FileRecord{path, info.size(), info.lastModified()});
    }

    size_t evicted = 0;
    if (total > m_settings.budgetBytes) {
        std::sort(files.begin(), files.end(), [](const FileRecord &a, const FileRecord &b) {
            return a.lastAccess < b.lastAccess;
        });
        for (const FileRecord &rec : files) {
            if (total <= m_settings.budgetBytes) {
                break;
            }
            if (QFile::remove(rec.path)) {
                total -= rec.size;
                ++evicted;
            }
        }
    }

    m_bytesUsed = total;
    if (expired != 0 || evicted != 0) {
        SMLOG_DEBUG() << "Disk cache sweep removed " << expired << " expired and " << evicted
                      << " old tiles; " << total << " bytes remain";
    }
}
