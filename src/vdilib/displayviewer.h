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

#ifndef DISPLAYVIEWER_H
#define DISPLAYVIEWER_H

#include "vdilib_global.h"
#include <QByteArray>
#include <QString>
#include <QStringList>

namespace Vdi
{
    /**
     * @brief External program that renders the display session
     */
    class VDILIB_EXPORT DisplayViewer
    {
        public:
            virtual ~DisplayViewer();

            /**
             * @brief Hand the configuration over and block until the viewer exits
             *
             * Throws ViewerError(LaunchFailed) when the viewer cannot be started.
             */
            virtual void Run(const QByteArray& config) = 0;
    };

    /**
     * @brief Runs remote-viewer, feeding the configuration through stdin
     */
    class VDILIB_EXPORT RemoteViewerLauncher : public DisplayViewer
    {
        public:
            static const char* const DEFAULT_PROGRAM;
            static const int START_TIMEOUT_MS = 10 * 1000;

            RemoteViewerLauncher(const QString& program, bool kiosk, bool fullscreen);

            /**
             * @brief Locate the viewer binary, throws ViewerError(NotFound)
             * @param configured Explicit path from the configuration, may be empty
             */
            static QString FindViewer(const QString& configured = QString());

            void Run(const QByteArray& config) override;

            QString Program() const { return this->m_program; }
            QStringList Arguments() const;

        private:
            QString m_program;
            bool m_kiosk;
            bool m_fullscreen;
    };
}

#endif // DISPLAYVIEWER_H
