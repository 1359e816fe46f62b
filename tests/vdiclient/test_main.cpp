#include <QtTest>
#include <QThread>
#include "guestmenu.h"
#include "logfilter.h"
#include "vdilib/displayviewer.h"
#include "vdilib/orchestrator.h"
#include "../vdilib/test_helpers.h"

class RecordingViewer : public Vdi::DisplayViewer
{
    public:
        void Run(const QByteArray& config) override { this->configs.append(config); }

        QList<QByteArray> configs;
};

static Vdi::GuestRecord makeRecord(int vmid, const QString& name, const QString& status, const QString& lock = QString())
{
    bool ok = false;
    return Vdi::GuestRecord::FromResource(MakeGuest(vmid, name, "pve1", "qemu", status, lock), &ok);
}

static Vdi::VdiConfig menuConfig()
{
    Vdi::HostSet hostSet("lab");
    hostSet.AddHost("pve1", 8006);
    hostSet.SetUser("alice");
    hostSet.SetTokenName("vdi");
    hostSet.SetTokenValue("secret");

    Vdi::VdiConfig config;
    config.SetTitle("Lab Desktops");
    config.AddHostSet(hostSet);
    return config;
}

static Vdi::VdiConfig autoConnectConfig(int autoVmid)
{
    Vdi::VdiConfig config = menuConfig();
    Vdi::HostSet hostSet = config.GetHostSet("lab");
    hostSet.SetAutoConnectGuest(autoVmid);
    config.AddHostSet(hostSet);
    return config;
}

static void scriptGuestListing(FakeApiTransport* host, const QVariantList& guests)
{
    QVariantList nodes = QVariantList() << MakeNode("pve1", "online");
    // Login check, then the nodes and guests of one listing
    host->AddReply("GET", "cluster/resources", Vdi::ApiReply::Success(nodes));
    host->AddReply("GET", "cluster/resources", Vdi::ApiReply::Success(nodes));
    host->AddReply("GET", "cluster/resources", Vdi::ApiReply::Success(guests));
}

static QStringList s_capturedMessages;

static void captureMessage(QtMsgType type, const QMessageLogContext&, const QString& msg)
{
    s_capturedMessages.append(QString("%1:%2").arg(LogFilter::Severity(type)).arg(msg));
}

class VdiClientTests : public QObject
{
    Q_OBJECT

private slots:
    void statusGlyphs()
    {
        QCOMPARE(GuestMenu::StatusGlyph(makeRecord(1, "a", "running")), QString::fromUtf8("●"));
        QCOMPARE(GuestMenu::StatusGlyph(makeRecord(2, "b", "running", "suspended")), QString::fromUtf8("⏸"));
        QCOMPARE(GuestMenu::StatusGlyph(makeRecord(3, "c", "stopped")), QString::fromUtf8("○"));
    }

    void guestLine()
    {
        QCOMPARE(GuestMenu::FormatGuestLine(makeRecord(104, "win11-desk", "running", "suspending")),
                 QString::fromUtf8("⏸ win11-desk (ID: 104) [suspending]"));
        QCOMPARE(GuestMenu::FormatGuestLine(makeRecord(101, "Accounting", "stopped")),
                 QString::fromUtf8("○ Accounting (ID: 101) [stopped]"));
    }

    void parseCommands()
    {
        QCOMPARE(GuestMenu::ParseCommand("q", 3).action, GuestMenu::Command::Quit);
        QCOMPARE(GuestMenu::ParseCommand(" Q \n", 3).action, GuestMenu::Command::Quit);
        QCOMPARE(GuestMenu::ParseCommand("r", 3).action, GuestMenu::Command::Refresh);
        QCOMPARE(GuestMenu::ParseCommand("", 3).action, GuestMenu::Command::Refresh);
        QCOMPARE(GuestMenu::ParseCommand("p", 3).action, GuestMenu::Command::PasswordReset);

        GuestMenu::Command connect = GuestMenu::ParseCommand("2", 3);
        QCOMPARE(connect.action, GuestMenu::Command::Connect);
        QCOMPARE(connect.index, 1);

        QCOMPARE(GuestMenu::ParseCommand("0", 3).action, GuestMenu::Command::Invalid);
        QCOMPARE(GuestMenu::ParseCommand("4", 3).action, GuestMenu::Command::Invalid);
        QCOMPARE(GuestMenu::ParseCommand("x", 3).action, GuestMenu::Command::Invalid);
    }

    void printNumberedList()
    {
        QString text;
        QTextStream out(&text);
        GuestMenu::PrintGuests(out, QList<Vdi::GuestRecord>() << makeRecord(1, "a", "running") << makeRecord(2, "b", "stopped"));

        const QStringList lines = text.split('\n', Qt::SkipEmptyParts);
        QCOMPARE(lines.size(), 2);
        QVERIFY(lines.at(0).endsWith(QString::fromUtf8("1. ● a (ID: 1) [running]")));
        QVERIFY(lines.at(1).endsWith(QString::fromUtf8("2. ○ b (ID: 2) [stopped]")));
    }

    void menuConnectsAndQuits()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> host = cluster.AddHost("pve1");
        QVariantList nodes = QVariantList() << MakeNode("pve1", "online");
        host->AddReply("GET", "cluster/resources", Vdi::ApiReply::Success(nodes));
        host->AddReply("GET", "cluster/resources", Vdi::ApiReply::Success(nodes));
        host->AddReply("GET", "cluster/resources",
                       Vdi::ApiReply::Success(QVariantList() << MakeGuest(100, "desk", "pve1", "qemu", "running")));
        // Listing after the viewer closed: nodes then guests again
        host->AddReply("GET", "cluster/resources", Vdi::ApiReply::Success(nodes));
        host->AddReply("GET", "cluster/resources",
                       Vdi::ApiReply::Success(QVariantList() << MakeGuest(100, "desk", "pve1", "qemu", "running")));
        host->AddReply("POST", "nodes/pve1/qemu/100/spiceproxy", Vdi::ApiReply::Success(QVariantMap{{"type", "spice"}}));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(menuConfig(), QString(), cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        QString input = "7\n1\nq\n";
        QString output;
        QTextStream in(&input);
        QTextStream out(&output);
        GuestMenu menu(orchestrator, in, out);
        menu.Run();

        QCOMPARE(viewer.configs.size(), 1);
        QVERIFY(output.contains("Lab Desktops"));
        QVERIFY(output.contains("Unknown choice: 7"));
        QVERIFY(output.contains("Connecting to desk..."));
        QVERIFY(output.contains("Connection closed."));
        QVERIFY(!output.contains("'p'"));
    }

    void menuReportsListingErrors()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> host = cluster.AddHost("pve1");
        host->AddReply("GET", "cluster/resources", Vdi::ApiReply::Success(QVariantList()));
        host->AddReply("GET", "cluster/resources", Vdi::ApiReply::HttpFailure(500, "HTTP error 500"));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(menuConfig(), QString(), cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        QString input = "q\n";
        QString output;
        QTextStream in(&input);
        QTextStream out(&output);
        GuestMenu menu(orchestrator, in, out);
        menu.Run();

        QVERIFY(output.contains("Error: Failed to get VMs: HTTP error 500"));
        QVERIFY(output.contains("No VMs available."));
    }

    void failedAutoConnectExitsWithError()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> host = cluster.AddHost("pve1");
        scriptGuestListing(host.data(), QVariantList() << MakeGuest(100, "desk", "pve1", "qemu", "running"));
        host->AddReply("POST", "nodes/pve1/qemu/100/spiceproxy", Vdi::ApiReply::HttpFailure(500, "HTTP error 500"));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(autoConnectConfig(100), QString(), cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        QString output;
        QTextStream out(&output);
        int exitCode = 0;
        QVERIFY(GuestMenu::ConnectOnStartup(orchestrator, 0, out, exitCode));
        QCOMPARE(exitCode, 1);
        QVERIFY(viewer.configs.isEmpty());
        QVERIFY(output.contains("Connecting to VM desk (ID: 100)"));
        QVERIFY(output.contains("Error: "));
    }

    void successfulAutoConnectExitsCleanly()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> host = cluster.AddHost("pve1");
        scriptGuestListing(host.data(), QVariantList() << MakeGuest(100, "desk", "pve1", "qemu", "running"));
        host->AddReply("POST", "nodes/pve1/qemu/100/spiceproxy", Vdi::ApiReply::Success(QVariantMap{{"type", "spice"}}));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(autoConnectConfig(100), QString(), cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        QString output;
        QTextStream out(&output);
        int exitCode = -1;
        QVERIFY(GuestMenu::ConnectOnStartup(orchestrator, 0, out, exitCode));
        QCOMPARE(exitCode, 0);
        QCOMPARE(viewer.configs.size(), 1);
    }

    void missingAutoConnectGuestFallsBackToMenu()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> host = cluster.AddHost("pve1");
        scriptGuestListing(host.data(), QVariantList() << MakeGuest(100, "desk", "pve1", "qemu", "running"));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(autoConnectConfig(555), QString(), cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        QString output;
        QTextStream out(&output);
        int exitCode = -1;
        QVERIFY(!GuestMenu::ConnectOnStartup(orchestrator, 0, out, exitCode));
        QCOMPARE(exitCode, -1);
        QVERIFY(output.contains("Auto VM ID 555 not found!"));
        QVERIFY(viewer.configs.isEmpty());
    }

    void requestedGuestMissingExitsWithError()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> host = cluster.AddHost("pve1");
        scriptGuestListing(host.data(), QVariantList() << MakeGuest(100, "desk", "pve1", "qemu", "running"));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(autoConnectConfig(100), QString(), cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        QString output;
        QTextStream out(&output);
        int exitCode = 0;
        QVERIFY(GuestMenu::ConnectOnStartup(orchestrator, 999, out, exitCode));
        QCOMPARE(exitCode, 1);
        QVERIFY(output.contains("Error: VM 999 not found"));
        QVERIFY(viewer.configs.isEmpty());
    }

    void noStartupTargetRunsMenu()
    {
        FakeCluster cluster;
        cluster.AddHost("pve1")->AddReply("GET", "cluster/resources",
                                          Vdi::ApiReply::Success(QVariantList() << MakeNode("pve1", "online")));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(menuConfig(), QString(), cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        QString output;
        QTextStream out(&output);
        int exitCode = -1;
        QVERIFY(!GuestMenu::ConnectOnStartup(orchestrator, 0, out, exitCode));
        QVERIFY(output.isEmpty());
    }

    void filterDropsMessagesBelowMinimum()
    {
        s_capturedMessages.clear();
        QtMessageHandler previous = qInstallMessageHandler(captureMessage);
        LogFilter::Install(QtWarningMsg);

        QThread* worker = QThread::create([]() {
            qDebug() << "worker debug";
            qWarning() << "worker warning";
        });
        worker->start();
        QVERIFY(worker->wait(5000));
        delete worker;

        qInfo() << "main info";
        qCritical() << "main critical";

        LogFilter::Uninstall();
        qInstallMessageHandler(previous);

        QCOMPARE(s_capturedMessages.size(), 2);
        QVERIFY(s_capturedMessages.at(0).startsWith("2:"));
        QVERIFY(s_capturedMessages.at(0).contains("worker warning"));
        QVERIFY(s_capturedMessages.at(1).startsWith("3:"));
        QVERIFY(s_capturedMessages.at(1).contains("main critical"));
    }

    void logSeverityOrder()
    {
        QVERIFY(LogFilter::Severity(QtDebugMsg) < LogFilter::Severity(QtInfoMsg));
        QVERIFY(LogFilter::Severity(QtInfoMsg) < LogFilter::Severity(QtWarningMsg));
        QVERIFY(LogFilter::Severity(QtWarningMsg) < LogFilter::Severity(QtCriticalMsg));

        LogFilter::Install(QtInfoMsg);
        QCOMPARE(LogFilter::MinimumLevel(), QtInfoMsg);
        LogFilter::Uninstall();
    }
};

QTEST_APPLESS_MAIN(VdiClientTests)
#include "test_main.moc"
