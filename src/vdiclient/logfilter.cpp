/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 */

#include "logfilter.h"
#include <QMutexLocker>

QtMessageHandler LogFilter::s_originalHandler = nullptr;
QtMsgType LogFilter::s_minimumLevel = QtWarningMsg;
QMutex LogFilter::s_mutex;

void LogFilter::Install(QtMsgType minimumLevel)
{
    QMutexLocker locker(&LogFilter::s_mutex);
    LogFilter::s_minimumLevel = minimumLevel;
    if (!LogFilter::s_originalHandler)
        LogFilter::s_originalHandler = qInstallMessageHandler(LogFilter::messageHandler);
}

void LogFilter::Uninstall()
{
    QMutexLocker locker(&LogFilter::s_mutex);
    if (LogFilter::s_originalHandler)
    {
        qInstallMessageHandler(LogFilter::s_originalHandler);
        LogFilter::s_originalHandler = nullptr;
    }
}

int LogFilter::Severity(QtMsgType type)
{
    switch (type)
    {
        case QtDebugMsg:
            return 0;
        case QtInfoMsg:
            return 1;
        case QtWarningMsg:
            return 2;
        case QtCriticalMsg:
            return 3;
        case QtFatalMsg:
            return 4;
    }
    return 0;
}

QtMsgType LogFilter::MinimumLevel()
{
    QMutexLocker locker(&LogFilter::s_mutex);
    return LogFilter::s_minimumLevel;
}

void LogFilter::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    QtMsgType minimumLevel;
    QtMessageHandler handler;
    {
        QMutexLocker locker(&LogFilter::s_mutex);
        minimumLevel = LogFilter::s_minimumLevel;
        handler = LogFilter::s_originalHandler;
    }

    // Fatal messages always pass, qFatal aborts afterwards anyway
    if (type != QtFatalMsg && LogFilter::Severity(type) < LogFilter::Severity(minimumLevel))
        return;

    // Called without the lock, the chained handler may log again
    if (handler)
        handler(type, context, msg);
}
