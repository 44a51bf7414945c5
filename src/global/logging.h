#pragma once
// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2026 The SlippyMapper Authors

#include "RuleOf5.h"
#include "macros.h"
#include "sm_source_location.h"

#include <sstream>
#include <string_view>

class QString;
class QByteArray;

namespace sm {

enum class NODISCARD LogLevelEnum { DEBUG, INFO, WARNING, ERROR };

/// Collects a message with std::ostream syntax and hands it to Qt's
/// message handler (qDebug/qInfo/qWarning/qCritical) when destroyed.
class NODISCARD LogStream final
{
private:
    std::ostringstream m_os;
    source_location m_loc;
    LogLevelEnum m_level;

public:
    explicit LogStream(LogLevelEnum level, const source_location &loc);
    ~LogStream();
    DELETE_CTORS_AND_ASSIGN_OPS(LogStream);

public:
    template<typename T>
    LogStream &operator<<(const T &value)
    {
        m_os << value;
        return *this;
    }
    LogStream &operator<<(const QString &value);
    LogStream &operator<<(const QByteArray &value);
    LogStream &operator<<(bool value);
};

} // namespace sm

#define SMLOG_DEBUG() (::sm::LogStream{::sm::LogLevelEnum::DEBUG, SM_SOURCE_LOCATION()})
#define SMLOG_INFO() (::sm::LogStream{::sm::LogLevelEnum::INFO, SM_SOURCE_LOCATION()})
#define SMLOG_WARNING() (::sm::LogStream{::sm::LogLevelEnum::WARNING, SM_SOURCE_LOCATION()})
#define SMLOG_ERROR() (::sm::LogStream{::sm::LogLevelEnum::ERROR, SM_SOURCE_LOCATION()})
