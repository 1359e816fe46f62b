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

#ifndef GUESTMENU_H
#define GUESTMENU_H

#include "vdilib/pve/guestrecord.h"
#include <QList>
#include <QString>
#include <QTextStream>

namespace Vdi
{
    class Orchestrator;
}

/**
 * @brief Numbered guest list on the terminal
 *
 * Enter a number to connect, r to refresh, p to run the password reset
 * command, q to quit.
 */
class GuestMenu
{
    public:
        struct Command
        {
            enum Action
            {
                Connect,
                Refresh,
                PasswordReset,
                Quit,
                Invalid
            };

            Action action = Invalid;
            int index = -1;
        };

        GuestMenu(Vdi::Orchestrator& orchestrator, QTextStream& in, QTextStream& out);

        /**
         * @brief Interactive loop, returns when the user quits or input ends
         */
        void Run();

        static QString StatusGlyph(const Vdi::GuestRecord& guest);
        static QString FormatGuestLine(const Vdi::GuestRecord& guest);
        static void PrintGuests(QTextStream& out, const QList<Vdi::GuestRecord>& guests);

        /**
         * @brief Interpret one line of input against a list of guestCount entries
         */
        static Command ParseCommand(const QString& input, int guestCount);

        /**
         * @brief Connect to one guest outside the menu and report the outcome
         * @return Process exit status, 1 when the connection failed
         */
        static int ConnectAndReport(Vdi::Orchestrator& orchestrator, const Vdi::GuestRecord& guest, QTextStream& out);

        /**
         * @brief Handle a guest requested on the command line or the host-set's auto-connect guest
         * @param connectVmid Guest id from the command line, 0 when not given
         * @param exitCode Process exit status, set when this returns true
         * @return false when the interactive menu should run
         */
        static bool ConnectOnStartup(Vdi::Orchestrator& orchestrator, int connectVmid, QTextStream& out, int& exitCode);

    private:
        void printHeader();
        void connectTo(const Vdi::GuestRecord& guest);
        void runPasswordReset();

        Vdi::Orchestrator& m_orchestrator;
        QTextStream& m_in;
        QTextStream& m_out;
};

#endif // GUESTMENU_H
