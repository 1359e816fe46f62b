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

#include "guestmenu.h"
#include "vdilib/orchestrator.h"
#include "vdilib/vdierror.h"
#include <QDebug>
#include <QProcess>

GuestMenu::GuestMenu(Vdi::Orchestrator& orchestrator, QTextStream& in, QTextStream& out)
    : m_orchestrator(orchestrator)
    , m_in(in)
    , m_out(out)
{
}

QString GuestMenu::StatusGlyph(const Vdi::GuestRecord& guest)
{
    if (guest.IsSuspendLocked())
        return QString::fromUtf8("⏸");
    if (guest.IsRunning())
        return QString::fromUtf8("●");
    return QString::fromUtf8("○");
}

QString GuestMenu::FormatGuestLine(const Vdi::GuestRecord& guest)
{
    return QString("%1 %2 (ID: %3) [%4]")
        .arg(StatusGlyph(guest), guest.Name())
        .arg(guest.Vmid())
        .arg(guest.DisplayState());
}

void GuestMenu::PrintGuests(QTextStream& out, const QList<Vdi::GuestRecord>& guests)
{
    for (int i = 0; i < guests.size(); ++i)
        out << QString("%1. ").arg(i + 1, 3) << FormatGuestLine(guests.at(i)) << "\n";
    out.flush();
}

GuestMenu::Command GuestMenu::ParseCommand(const QString& input, int guestCount)
{
    Command command;
    const QString trimmed = input.trimmed().toLower();

    if (trimmed == "q")
        command.action = Command::Quit;
    else if (trimmed == "r" || trimmed.isEmpty())
        command.action = Command::Refresh;
    else if (trimmed == "p")
        command.action = Command::PasswordReset;
    else
    {
        bool ok = false;
        int number = trimmed.toInt(&ok);
        if (ok && number >= 1 && number <= guestCount)
        {
            command.action = Command::Connect;
            command.index = number - 1;
        }
    }

    return command;
}

void GuestMenu::printHeader()
{
    const QString title = this->m_orchestrator.GetConfig().Title();
    this->m_out << "\n" << title << "\n" << QString(title.length(), '=') << "\n";

    QString help = "Enter a number to connect, 'r' to refresh";
    if (!this->m_orchestrator.GetHostSet().PasswordResetCommand().isEmpty())
        help += ", 'p' to reset password";
    help += ", 'q' to quit";
    this->m_out << help << "\n\n";
}

void GuestMenu::Run()
{
    while (true)
    {
        QList<Vdi::GuestRecord> guests;
        try
        {
            guests = this->m_orchestrator.ListGuests();
        } catch (const std::exception& ex)
        {
            this->m_out << "Error: " << ex.what() << "\n";
        }

        this->printHeader();
        if (guests.isEmpty())
            this->m_out << "No VMs available.\n";
        PrintGuests(this->m_out, guests);

        this->m_out << "> ";
        this->m_out.flush();

        QString line;
        if (!this->m_in.readLineInto(&line))
            return;

        Command command = ParseCommand(line, guests.size());
        switch (command.action)
        {
            case Command::Quit:
                return;
            case Command::Refresh:
                break;
            case Command::PasswordReset:
                this->runPasswordReset();
                break;
            case Command::Connect:
                this->connectTo(guests.at(command.index));
                break;
            case Command::Invalid:
                this->m_out << "Unknown choice: " << line.trimmed() << "\n";
                break;
        }
    }
}

int GuestMenu::ConnectAndReport(Vdi::Orchestrator& orchestrator, const Vdi::GuestRecord& guest, QTextStream& out)
{
    out << "Connecting to VM " << guest.Name() << " (ID: " << guest.Vmid() << ")\n";
    out.flush();
    try
    {
        orchestrator.Connect(guest);
    } catch (const Vdi::VdiError& ex)
    {
        qCritical() << "GuestMenu: Connection to" << guest.Name() << "failed:" << ex.message();
        out << "Error: " << ex.message() << "\n";
        out.flush();
        return 1;
    }
    return 0;
}

bool GuestMenu::ConnectOnStartup(Vdi::Orchestrator& orchestrator, int connectVmid, QTextStream& out, int& exitCode)
{
    if (connectVmid > 0)
    {
        Vdi::GuestRecord guest;
        if (!orchestrator.FindGuest(connectVmid, guest))
        {
            out << "Error: VM " << connectVmid << " not found\n";
            out.flush();
            exitCode = 1;
            return true;
        }
        exitCode = ConnectAndReport(orchestrator, guest, out);
        return true;
    }

    const Vdi::HostSet& hostSet = orchestrator.GetHostSet();
    if (!hostSet.HasAutoConnectGuest())
        return false;

    Vdi::GuestRecord guest;
    if (!orchestrator.FindAutoConnectGuest(guest))
    {
        out << "Auto VM ID " << hostSet.AutoConnectGuest() << " not found!\n";
        out.flush();
        return false;
    }

    exitCode = ConnectAndReport(orchestrator, guest, out);
    return true;
}

void GuestMenu::connectTo(const Vdi::GuestRecord& guest)
{
    this->m_out << "Connecting to " << guest.Name() << "...\n";
    this->m_out.flush();

    try
    {
        this->m_orchestrator.Connect(guest);
        this->m_out << "Connection closed.\n";
    } catch (const Vdi::VdiError& ex)
    {
        qCritical() << "GuestMenu: Connection to" << guest.Name() << "failed:" << ex.message();
        this->m_out << "Error: " << ex.message() << "\n";
    }
}

void GuestMenu::runPasswordReset()
{
    QStringList arguments = QProcess::splitCommand(this->m_orchestrator.GetHostSet().PasswordResetCommand());
    if (arguments.isEmpty())
    {
        this->m_out << "No password reset command configured.\n";
        return;
    }

    const QString program = arguments.takeFirst();
    this->m_out.flush();
    int exitCode = QProcess::execute(program, arguments);
    if (exitCode < 0)
        this->m_out << "Error: Failed to run " << program << "\n";
    else if (exitCode != 0)
        qWarning() << "GuestMenu: Password reset command exited with code" << exitCode;
}
