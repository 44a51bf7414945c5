// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TileSource.h"

#include "../global/UrlUtils.h"
#include "../global/logging.h"

#include <algorithm>
#include <utility>

#include <QEventLoop>
#include <QFile>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>

const char *getName(const FetchStatusEnum status)
{
    switch (status) {
    case FetchStatusEnum::OK:
        return "ok";
    case FetchStatusEnum::TRANSIENT:
        return "transient";
    case FetchStatusEnum::NOT_FOUND:
        return "not found";
    }
    return "unknown";
}

FetchResult FetchResult::ok(QByteArray bytes)
{
    return FetchResult{FetchStatusEnum::OK, std::move(bytes), QString()};
}

FetchResult FetchResult::transient(QString message)
{
    return FetchResult{FetchStatusEnum::TRANSIENT, QByteArray(), std::move(message)};
}

FetchResult FetchResult::notFound(QString message)
{
    return FetchResult{FetchStatusEnum::NOT_FOUND, QByteArray(), std::move(message)};
}

FetchStatusEnum classifyHttpStatus(const int httpStatus, const bool networkError)
{
    if (httpStatus <= 0) {
        // No response at all: DNS, refused connection, reset, TLS failure...
        return FetchStatusEnum::TRANSIENT;
    }
    if (httpStatus >= 200 && httpStatus < 300) {
        // A 2xx with an error means the body was cut off.
        return networkError ? FetchStatusEnum::TRANSIENT : FetchStatusEnum::OK;
    }
    if (httpStatus == 429 || httpStatus >= 500) {
        return FetchStatusEnum::TRANSIENT;
    }
    return FetchStatusEnum::NOT_FOUND;
}

ITileSource::ITileSource(TileSourceId id)
    : m_id{std::move(id)}
{}

ITileSource::~ITileSource() = default;

void ITileSource::setZoomRange(int minZoom, int maxZoom)
{
    minZoom = std::clamp(minZoom, 0, MAX_TILE_ZOOM);
    maxZoom = std::clamp(maxZoom, 0, MAX_TILE_ZOOM);
    m_minZoom = std::min(minZoom, maxZoom);
    m_maxZoom = std::max(minZoom, maxZoom);
}

RemoteTileSource::RemoteTileSource(QString urlTemplate, Settings settings)
    : ITileSource{TileSourceId::fromTemplate(urlTemplate)}
    , m_template{std::move(urlTemplate)}
    , m_settings{std::move(settings)}
{}

RemoteTileSource::~RemoteTileSource() = default;

QString RemoteTileSource::virt_describe(const TileAddress &addr) const
{
    return smqt::expandTileTemplate(m_template, addr.zoom, addr.x, addr.y);
}

FetchResult RemoteTileSource::virt_fetch(const TileAddress &addr)
{
    if (!addr.isValid()) {
        return FetchResult::notFound(QStringLiteral("invalid tile address"));
    }

    const QString expanded = virt_describe(addr);
    const QUrl url{expanded, QUrl::StrictMode};
    if (!url.isValid() || url.host().isEmpty()) {
        return FetchResult::notFound(QStringLiteral("malformed URL: ") + expanded);
    }

    QNetworkRequest request{url};
    request.setHeader(QNetworkRequest::UserAgentHeader, m_settings.userAgent);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);

    // Worker threads have no event loop of their own; run one just for this request.
    QNetworkAccessManager manager;
    const std::unique_ptr<QNetworkReply> reply{manager.get(request)};

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;
    QObject::connect(&timer, &QTimer::timeout, &loop, [&timedOut, &reply]() {
        timedOut = true;
        reply->abort();
    });
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);

    timer.start(std::max(1, m_settings.requestTimeoutMs));
    if (!reply->isFinished()) {
        loop.exec(QEventLoop::ExcludeUserInputEvents);
    }
    timer.stop();

    if (timedOut) {
        return FetchResult::transient(
            QStringLiteral("timed out after %1 ms").arg(m_settings.requestTimeoutMs));
    }

    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const bool networkError = reply->error() != QNetworkReply::NoError;

    switch (classifyHttpStatus(httpStatus, networkError)) {
    case FetchStatusEnum::OK:
        return FetchResult::ok(reply->readAll());
    case FetchStatusEnum::TRANSIENT:
        return FetchResult::transient(
            QStringLiteral("HTTP %1: %2").arg(httpStatus).arg(reply->errorString()));
    case FetchStatusEnum::NOT_FOUND:
        break;
    }
    return FetchResult::notFound(
        QStringLiteral("HTTP %1: %2").arg(httpStatus).arg(reply->errorString()));
}

LocalTileSource::LocalTileSource(const QString &pathTemplate)
    : ITileSource{TileSourceId::fromTemplate(pathTemplate)}
    , m_pathTemplate{smqt::toLocalPathTemplate(pathTemplate)}
{}

LocalTileSource::~LocalTileSource() = default;

QString LocalTileSource::virt_describe(const TileAddress &addr) const
{
    return smqt::expandTileTemplate(m_pathTemplate, addr.zoom, addr.x, addr.y);
}

FetchResult LocalTileSource::virt_fetch(const TileAddress &addr)
{
    if (!addr.isValid()) {
        return FetchResult::notFound(QStringLiteral("invalid tile address"));
    }

    const QString path = virt_describe(addr);
    QFile file{path};
    if (!file.exists()) {
        return FetchResult::notFound(QStringLiteral("no such file: ") + path);
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return FetchResult::transient(path + QStringLiteral(": ") + file.errorString());
    }
    return FetchResult::ok(file.readAll());
}

std::shared_ptr<ITileSource> createTileSource(const QString &tileTemplate,
                                              const RemoteTileSource::Settings &settings)
{
    if (smqt::isRemoteTemplate(tileTemplate)) {
        SMLOG_INFO() << "Using remote tile source " << tileTemplate;
        return std::make_shared<RemoteTileSource>(tileTemplate, settings);
    }
    SMLOG_INFO() << "Using local tile source " << tileTemplate;
    return std::make_shared<LocalTileSource>(tileTemplate);
}
