// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "UrlUtils.h"

#include <QDesktopServices>
#include <QUrl>

namespace smqt {

void openUrl(const QUrl &url)
{
    QDesktopServices::openUrl(url);
}

QString expandTileTemplate(const QString &tileTemplate, const int z, const int x, const int y)
{
    QString result = tileTemplate;
    result.replace(QStringLiteral("{z}"), QString::number(z));
    result.replace(QStringLiteral("{x}"), QString::number(x));
    result.replace(QStringLiteral("{y}"), QString::number(y));
    return result;
}

bool isRemoteTemplate(const QString &tileTemplate)
{
    return tileTemplate.startsWith(QStringLiteral("http://"), Qt::CaseInsensitive)
           || tileTemplate.startsWith(QStringLiteral("https://"), Qt::CaseInsensitive);
}

QString toLocalPathTemplate(const QString &tileTemplate)
{
    static const QString FILE_SCHEME = QStringLiteral("file://");
    if (tileTemplate.startsWith(FILE_SCHEME, Qt::CaseInsensitive)) {
        // QUrl would percent-encode the braces, so strip the scheme by hand.
        return tileTemplate.mid(FILE_SCHEME.size());
    }
    return tileTemplate;
}

QString templateHost(const QString &tileTemplate)
{
    // Placeholders are not valid in every URL component; parse a sample instead.
    const QUrl url{expandTileTemplate(tileTemplate, 0, 0, 0), QUrl::StrictMode};
    if (!url.isValid()) {
        return QString();
    }
    return url.host();
}

} // namespace smqt
