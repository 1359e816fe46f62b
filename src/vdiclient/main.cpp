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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include "globals.h"
#include "guestmenu.h"
#include "logfilter.h"
#include "vdilib/config/vdiconfig.h"
#include "vdilib/displayviewer.h"
#include "vdilib/orchestrator.h"
#include "vdilib/vdierror.h"
#include "vdilib/pve/network/httpstransport.h"

#ifdef Q_OS_UNIX
#include <termios.h>
#include <unistd.h>
#endif

static QString promptLine(QTextStream& in, QTextStream& out, const QString& prompt, bool secret)
{
    out << prompt;
    out.flush();

#ifdef Q_OS_UNIX
    termios saved;
    bool restore = false;
    if (secret && isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &saved) == 0)
    {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        restore = tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
    }
#else
    Q_UNUSED(secret);
#endif

    QString line = in.readLine();

#ifdef Q_OS_UNIX
    if (restore)
    {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
        out << "\n";
    }
#endif

    return line;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(VDICLIENT_APP_NAME);
    QCoreApplication::setApplicationVersion(VDICLIENT_VERSION);
    QCoreApplication::setOrganizationName(VDICLIENT_ORG_NAME);

    QCommandLineParser parser;
    parser.setApplicationDescription("Proxmox VDI client");

    QCommandLineOption configOption(QStringList() << "c" << "config", "Configuration file path.", "path");
    QCommandLineOption hostSetOption(QStringList() << "s" << "hostset", "Host set to log in to.", "name");
    QCommandLineOption listOption(QStringList() << "l" << "list", "Print the available VMs and exit.");
    QCommandLineOption connectOption(QStringList() << "connect", "Connect to the VM with this id and exit.", "vmid");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Print debug output.");
    QCommandLineOption versionOption(QStringList() << "V" << "version", "Print version and exit.");
    parser.addOption(configOption);
    parser.addOption(hostSetOption);
    parser.addOption(listOption);
    parser.addOption(connectOption);
    parser.addOption(verboseOption);
    parser.addOption(versionOption);
    parser.addHelpOption();

    parser.process(app);

    QTextStream out(stdout);
    QTextStream in(stdin);

    if (parser.isSet(versionOption))
    {
        out << app.applicationName() << " " << app.applicationVersion() << "\n";
        return 0;
    }

    LogFilter::Install(parser.isSet(verboseOption) ? QtDebugMsg : QtWarningMsg);

    int connectVmid = 0;
    if (parser.isSet(connectOption))
    {
        bool ok = false;
        connectVmid = parser.value(connectOption).toInt(&ok);
        if (!ok || connectVmid <= 0)
        {
            out << "Error: Invalid VM id " << parser.value(connectOption) << "\n";
            return 1;
        }
    }

    Vdi::VdiConfig config;
    QString viewerPath;
    try
    {
        config = Vdi::ConfigLoader::LoadFile(Vdi::ConfigLoader::FindConfigFile(parser.value(configOption)));
        if (!parser.isSet(listOption))
            viewerPath = Vdi::RemoteViewerLauncher::FindViewer(config.ViewerPath());
    } catch (const Vdi::VdiError& ex)
    {
        out << "Error: " << ex.message() << "\n";
        return 1;
    }

    Vdi::RemoteViewerLauncher viewer(viewerPath, config.Kiosk(), config.Fullscreen());

    try
    {
        Vdi::Orchestrator orchestrator(config, parser.value(hostSetOption), &Vdi::HttpsTransport::Create, &viewer);

        const Vdi::HostSet& hostSet = orchestrator.GetHostSet();
        if (!hostSet.UsesApiToken())
        {
            QString password = promptLine(in, out, QString("Password for %1: ").arg(hostSet.Principal()), true);
            QString otp;
            if (hostSet.TwoFactor())
                otp = promptLine(in, out, "One-time code: ", false).trimmed();
            orchestrator.Resolver().SetPassword(password, otp);
        }

        out << "Authenticating...\n";
        out.flush();
        orchestrator.Authenticate();
        out << "Authentication successful!\n";

        if (parser.isSet(listOption))
        {
            GuestMenu::PrintGuests(out, orchestrator.ListGuests());
            return 0;
        }

        int exitCode = 0;
        if (GuestMenu::ConnectOnStartup(orchestrator, connectVmid, out, exitCode))
            return exitCode;

        GuestMenu menu(orchestrator, in, out);
        menu.Run();
    } catch (const Vdi::VdiError& ex)
    {
        qCritical() << "main:" << ex.message();
        out << "Error: " << ex.message() << "\n";
        return 1;
    } catch (const std::exception& ex)
    {
        out << "Error: " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
