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

#include "displayviewer.h"
#include "vdierror.h"
#include <QDebug>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace Vdi
{
    const char* const RemoteViewerLauncher::DEFAULT_PROGRAM = "remote-viewer";

    DisplayViewer::~DisplayViewer()
    {
    }

    RemoteViewerLauncher::RemoteViewerLauncher(const QString& program, bool kiosk, bool fullscreen)
        : m_program(program)
        , m_kiosk(kiosk)
        , m_fullscreen(fullscreen)
    {
    }

    QString RemoteViewerLauncher::FindViewer(const QString& configured)
    {
        if (!configured.isEmpty())
        {
            QFileInfo info(configured);
            if (info.exists() && info.isExecutable())
                return configured;

            QString found = QStandardPaths::findExecutable(configured);
            if (!found.isEmpty())
                return found;

            throw ViewerError(ViewerError::NotFound, QString("Viewer %1 not found or not executable").arg(configured));
        }

        QString found = QStandardPaths::findExecutable(DEFAULT_PROGRAM);
#ifdef Q_OS_WIN
        if (found.isEmpty())
        {
            found = QStandardPaths::findExecutable(DEFAULT_PROGRAM,
                                                   QStringList() << qEnvironmentVariable("PROGRAMFILES") + "\\VirtViewer\\bin");
        }
#endif
        if (found.isEmpty())
        {
            throw ViewerError(ViewerError::NotFound,
                              "virt-viewer not found. Please install:\n"
                              "Windows: https://virt-manager.org/download/\n"
                              "Linux: apt install virt-viewer");
        }
        return found;
    }

    QStringList RemoteViewerLauncher::Arguments() const
    {
        QStringList arguments;
        if (this->m_kiosk)
            arguments << "--kiosk" << "--kiosk-quit" << "on-disconnect";
        else if (this->m_fullscreen)
            arguments << "--full-screen";

        // Read the connection file from stdin
        arguments << "-";
        return arguments;
    }

    void RemoteViewerLauncher::Run(const QByteArray& config)
    {
        QProcess process;
        process.setProcessChannelMode(QProcess::ForwardedChannels);

        qDebug() << "RemoteViewerLauncher: Launching" << this->m_program << this->Arguments();
        process.start(this->m_program, this->Arguments());
        if (!process.waitForStarted(START_TIMEOUT_MS))
        {
            throw ViewerError(ViewerError::LaunchFailed,
                              QString("Failed to launch %1: %2").arg(this->m_program, process.errorString()));
        }

        process.write(config);
        process.closeWriteChannel();

        // The session lasts as long as the user keeps the viewer open
        process.waitForFinished(-1);
        qInfo() << "RemoteViewerLauncher: Viewer exited with code" << process.exitCode();
    }
}
