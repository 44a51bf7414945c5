// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "TileKey.h"

#include "../global/UrlUtils.h"

#include <QCryptographicHash>
#include <QDebug>

namespace { // anonymous

constexpr int HASH_HEX_DIGITS = 12;

NODISCARD QString makeSlug(const QString &tileTemplate)
{
    if (!smqt::isRemoteTemplate(tileTemplate)) {
        return QStringLiteral("local");
    }

    const QString host = smqt::templateHost(tileTemplate).toLower();
    QString slug;
    slug.reserve(host.size());
    for (const QChar c : host) {
        const bool keep = (c >= QLatin1Char('a') && c <= QLatin1Char('z'))
                          || (c >= QLatin1Char('0') && c <= QLatin1Char('9'))
                          || c == QLatin1Char('.') || c == QLatin1Char('-');
        slug.append(keep ? c : QLatin1Char('_'));
    }
    return slug.isEmpty() ? QStringLiteral("remote") : slug;
}

} // namespace

TileSourceId TileSourceId::fromTemplate(const QString &tileTemplate)
{
    const QByteArray digest = QCryptographicHash::hash(tileTemplate.toUtf8(),
                                                       QCryptographicHash::Sha1)
                                  .toHex()
                                  .left(HASH_HEX_DIGITS);
    return TileSourceId{makeSlug(tileTemplate) + QLatin1Char('-') + QString::fromLatin1(digest)};
}

std::ostream &operator<<(std::ostream &os, const TileKey &key)
{
    return os << key.source.toQString().toStdString() << "/" << key.address;
}

QDebug operator<<(QDebug os, const TileKey &key)
{
    const QDebugStateSaver saver{os};
    os.nospace().noquote() << key.source.toQString() << "/" << key.address;
    return os;
}
