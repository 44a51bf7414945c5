// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "logging.h"

#include <QByteArray>
#include <QDebug>
#include <QMessageLogger>
#include <QString>

namespace sm {

LogStream::LogStream(const LogLevelEnum level, const source_location &loc)
    : m_loc{loc}
    , m_level{level}
{}

LogStream::~LogStream()
{
    const QString msg = QString::fromStdString(m_os.str());
    const QMessageLogger logger{m_loc.file, m_loc.line, m_loc.function};
    switch (m_level) {
    case LogLevelEnum::DEBUG:
        logger.debug().noquote() << msg;
        break;
    case LogLevelEnum::INFO:
        logger.info().noquote() << msg;
        break;
    case LogLevelEnum::WARNING:
        logger.warning().noquote() << msg;
        break;
    case LogLevelEnum::ERROR:
        logger.critical().noquote() << msg;
        break;
    }
}

LogStream &LogStream::operator<<(const QString &value)
{
    m_os << value.toStdString();
    return *this;
}

LogStream &LogStream::operator<<(const QByteArray &value)
{
    m_os << value.toStdString();
    return *this;
}

LogStream &LogStream::operator<<(const bool value)
{
    m_os << (value ? "true" : "false");
    return *this;
}

} // namespace sm
