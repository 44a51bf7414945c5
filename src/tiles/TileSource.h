#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "../geo/TileAddress.h"
#include "../global/RuleOf5.h"
#include "../global/macros.h"
#include "TileKey.h"

#include <memory>

#include <QByteArray>
#include <QString>

/// How a single fetch attempt ended.
enum class NODISCARD FetchStatusEnum {
    /// Bytes were delivered; they may still fail to decode.
    OK,
    /// Network error, timeout, HTTP 5xx or 429. Worth another attempt.
    TRANSIENT,
    /// HTTP 404/410, any other 4xx, a malformed URL or a missing file.
    NOT_FOUND
};

NODISCARD const char *getName(FetchStatusEnum status);

struct NODISCARD FetchResult final
{
    FetchStatusEnum status = FetchStatusEnum::TRANSIENT;
    QByteArray bytes;
    QString message;

    NODISCARD static FetchResult ok(QByteArray bytes);
    NODISCARD static FetchResult transient(QString message);
    NODISCARD static FetchResult notFound(QString message);
};

/// Maps an HTTP status (0 when no response arrived) onto a fetch status.
NODISCARD FetchStatusEnum classifyHttpStatus(int httpStatus, bool networkError);

/// Resolves a tile address to raw encoded bytes.
///
/// fetch() runs on worker threads, possibly several at once, so
/// implementations must be thread-safe. Exactly one GET or file read
/// happens per call.
class NODISCARD ITileSource
{
private:
    TileSourceId m_id;
    int m_minZoom = 0;
    int m_maxZoom = 19;

public:
    explicit ITileSource(TileSourceId id);
    virtual ~ITileSource();
    DELETE_CTORS_AND_ASSIGN_OPS(ITileSource);

public:
    NODISCARD const TileSourceId &getId() const { return m_id; }
    NODISCARD int getMinZoom() const { return m_minZoom; }
    NODISCARD int getMaxZoom() const { return m_maxZoom; }
    void setZoomRange(int minZoom, int maxZoom);

    NODISCARD FetchResult fetch(const TileAddress &addr) { return virt_fetch(addr); }
    NODISCARD QString describe(const TileAddress &addr) const { return virt_describe(addr); }

private:
    NODISCARD virtual FetchResult virt_fetch(const TileAddress &addr) = 0;
    NODISCARD virtual QString virt_describe(const TileAddress &addr) const = 0;
};

/// Tiles served over HTTP(S).
class NODISCARD RemoteTileSource final : public ITileSource
{
public:
    struct NODISCARD Settings final
    {
        QString userAgent = QStringLiteral("SlippyMapper/1.0");
        int requestTimeoutMs = 10000;
    };

private:
    const QString m_template;
    const Settings m_settings;

public:
    RemoteTileSource(QString urlTemplate, Settings settings);
    ~RemoteTileSource() final;
    DELETE_CTORS_AND_ASSIGN_OPS(RemoteTileSource);

private:
    NODISCARD FetchResult virt_fetch(const TileAddress &addr) final;
    NODISCARD QString virt_describe(const TileAddress &addr) const final;
};

/// Tiles read from a directory tree, e.g. "/data/tiles/{z}/{x}/{y}.png".
class NODISCARD LocalTileSource final : public ITileSource
{
private:
    const QString m_pathTemplate;

public:
    explicit LocalTileSource(const QString &pathTemplate);
    ~LocalTileSource() final;
    DELETE_CTORS_AND_ASSIGN_OPS(LocalTileSource);

private:
    NODISCARD FetchResult virt_fetch(const TileAddress &addr) final;
    NODISCARD QString virt_describe(const TileAddress &addr) const final;
};

/// Remote for http(s) templates, local for everything else.
NODISCARD std::shared_ptr<ITileSource> createTileSource(const QString &tileTemplate,
                                                        const RemoteTileSource::Settings &settings);
