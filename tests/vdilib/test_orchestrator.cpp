#include <QtTest>
#include "vdilib/orchestrator.h"
#include "vdilib/displayviewer.h"
#include "vdilib/vdierror.h"
#include "vdilib/pve/session.h"
#include "test_helpers.h"

static const char* const RESOURCES = "cluster/resources";
static const char* const UPID = "UPID:pve2:00001234:00AB:6530F1A2:qmstart:101:alice@pve:";

class RecordingViewer : public Vdi::DisplayViewer
{
    public:
        void Run(const QByteArray& config) override { this->configs.append(config); }

        QList<QByteArray> configs;
};

static Vdi::VdiConfig makeConfig()
{
    Vdi::HostSet lab("lab");
    lab.AddHost("pve1", 8006);
    lab.AddHost("pve2", 8006);
    lab.SetUser("alice");
    lab.SetTokenName("vdi");
    lab.SetTokenValue("secret");

    Vdi::HostSet other("other");
    other.AddHost("pve9", 8006);
    other.SetUser("bob");
    other.SetTokenName("vdi");
    other.SetTokenValue("secret");
    other.SetAutoConnectGuest(101);

    Vdi::VdiConfig config;
    config.AddHostSet(lab);
    config.AddHostSet(other);
    config.AddProxyRedirect("10.0.0.12:3128", "vdi.example.org:443");
    config.AddExtraParameter("title", "Lab desk");
    return config;
}

static void keepOrder(QList<Vdi::HostEndpoint>& pool)
{
    Q_UNUSED(pool);
}

static void scriptInventory(const QSharedPointer<FakeApiTransport>& host)
{
    QVariantList nodes = QVariantList() << MakeNode("pve1", "offline") << MakeNode("pve2", "online");
    QVariantList vms = QVariantList() << MakeGuest(101, "desk", "pve2", "qemu", "stopped")
                                      << MakeGuest(102, "build", "pve2", "lxc", "running")
                                      << MakeGuest(103, "lost", "pve1", "qemu", "running");

    // Login check, then node and vm listing
    host->AddReply("GET", RESOURCES, Vdi::ApiReply::Success(nodes));
    host->AddReply("GET", RESOURCES, Vdi::ApiReply::Success(nodes));
    host->AddReply("GET", RESOURCES, Vdi::ApiReply::Success(vms));
}

static void scriptStart(const QSharedPointer<FakeApiTransport>& host)
{
    QVariantMap ticket;
    ticket.insert("type", "spice");
    ticket.insert("proxy", "http://10.0.0.12:3128");
    ticket.insert("title", "VM 101 - desk");
    ticket.insert("password", "pw");

    host->AddReply("POST", "nodes/pve2/qemu/101/status/start", Vdi::ApiReply::Success(UPID));
    host->AddReply("GET", TaskStatusPath("pve2", UPID), Vdi::ApiReply::Success(QVariantMap{{"status", "running"}}));
    host->AddReply("GET", TaskStatusPath("pve2", UPID),
                   Vdi::ApiReply::Success(QVariantMap{{"status", "stopped"}, {"exitstatus", "OK"}}));
    host->AddReply("POST", "nodes/pve2/qemu/101/spiceproxy", Vdi::ApiReply::Success(ticket));
}

class OrchestratorTests : public QObject
{
    Q_OBJECT

private slots:
    void connectsEndToEnd()
    {
        FakeCluster cluster;
        cluster.AddHost("pve1");
        QSharedPointer<FakeApiTransport> pve2 = cluster.AddHost("pve2");
        scriptInventory(pve2);
        scriptStart(pve2);

        RecordingViewer viewer;
        RecordingSleeper sleeper;
        Vdi::Orchestrator orchestrator(makeConfig(), QString(), cluster.Factory(), &viewer, &sleeper);
        orchestrator.Resolver().SetShuffleFunction(keepOrder);

        QCOMPARE(orchestrator.GetHostSet().Name(), QString("lab"));
        QVERIFY(!orchestrator.IsAuthenticated());

        orchestrator.Authenticate();
        QVERIFY(orchestrator.IsAuthenticated());
        QCOMPARE(orchestrator.GetSession()->GetHostname(), QString("pve2"));

        QList<Vdi::GuestRecord> guests = orchestrator.ListGuests();
        QCOMPARE(guests.size(), 2);
        QCOMPARE(guests.at(0).Name(), QString("build"));
        QCOMPARE(guests.at(1).Name(), QString("desk"));

        orchestrator.Connect(guests.at(1));
        QCOMPARE(orchestrator.LastLifecycleState(), Vdi::LifecycleCoordinator::Running);
        QCOMPARE(sleeper.sleeps.size(), 2);
        QCOMPARE(viewer.configs.size(), 1);
        QCOMPARE(viewer.configs.first(), QByteArray("[virt-viewer]\n"
                                                    "password=pw\n"
                                                    "proxy=http://vdi.example.org:443\n"
                                                    "title=Lab desk\n"
                                                    "type=spice\n"));
    }

    void runningGuestSkipsStart()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> host = cluster.AddHost("pve1");
        host->AddReply("GET", RESOURCES, Vdi::ApiReply::Success(QVariantList()));
        host->AddReply("POST", "nodes/pve2/lxc/102/spiceproxy", Vdi::ApiReply::Success(QVariantMap{{"type", "spice"}}));

        RecordingViewer viewer;
        RecordingSleeper sleeper;
        Vdi::HostSet single("single");
        single.AddHost("pve1", 8006);
        single.SetUser("alice");
        single.SetTokenName("vdi");
        single.SetTokenValue("secret");
        Vdi::VdiConfig config;
        config.AddHostSet(single);

        Vdi::Orchestrator orchestrator(config, "single", cluster.Factory(), &viewer, &sleeper);
        orchestrator.Authenticate();

        bool ok = false;
        Vdi::GuestRecord guest = Vdi::GuestRecord::FromResource(MakeGuest(102, "build", "pve2", "lxc", "running"), &ok);
        QVERIFY(ok);
        orchestrator.Connect(guest);

        QCOMPARE(viewer.configs.size(), 1);
        QCOMPARE(host->CountRequests("POST", "nodes/pve2/lxc/102/status/start"), 0);
        QVERIFY(sleeper.sleeps.isEmpty());
    }

    void lifecycleFailureSkipsViewer()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> pve2 = cluster.AddHost("pve2");
        scriptInventory(pve2);
        pve2->AddReply("POST", "nodes/pve2/qemu/101/status/start", Vdi::ApiReply::HttpFailure(403, "HTTP error 403"));

        RecordingViewer viewer;
        RecordingSleeper sleeper;
        Vdi::Orchestrator orchestrator(makeConfig(), "lab", cluster.Factory(), &viewer, &sleeper);
        orchestrator.Resolver().SetShuffleFunction(keepOrder);
        orchestrator.Authenticate();

        Vdi::GuestRecord guest;
        QVERIFY(orchestrator.FindGuest(101, guest));
        try
        {
            orchestrator.Connect(guest);
            QFAIL("expected LifecycleError");
        } catch (const Vdi::LifecycleError& ex)
        {
            QCOMPARE(ex.kind(), Vdi::LifecycleError::StartRejected);
        }
        QVERIFY(viewer.configs.isEmpty());
        QCOMPARE(orchestrator.LastLifecycleState(), Vdi::LifecycleCoordinator::Failed);
    }

    void autoConnectGuest()
    {
        FakeCluster cluster;
        scriptInventory(cluster.AddHost("pve9"));

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(makeConfig(), "other", cluster.Factory(), &viewer);
        orchestrator.Authenticate();

        Vdi::GuestRecord guest;
        QVERIFY(orchestrator.FindAutoConnectGuest(guest));
        QCOMPARE(guest.Vmid(), 101);
    }

    void autoConnectGuestMissing()
    {
        FakeCluster cluster;
        QSharedPointer<FakeApiTransport> pve2 = cluster.AddHost("pve2");
        scriptInventory(pve2);

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(makeConfig(), "lab", cluster.Factory(), &viewer);
        orchestrator.Resolver().SetShuffleFunction(keepOrder);
        orchestrator.Authenticate();

        // lab has no auto-connect id
        Vdi::GuestRecord guest;
        QVERIFY(!orchestrator.FindAutoConnectGuest(guest));
        QVERIFY(!orchestrator.FindGuest(103, guest));
    }

    void unknownHostSetIsConfigError()
    {
        FakeCluster cluster;
        RecordingViewer viewer;
        try
        {
            Vdi::Orchestrator orchestrator(makeConfig(), "missing", cluster.Factory(), &viewer);
            QFAIL("expected ConfigError");
        } catch (const Vdi::ConfigError& ex)
        {
            QVERIFY(ex.message().contains("missing"));
        }
    }

    void listingRequiresLogin()
    {
        FakeCluster cluster;
        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(makeConfig(), QString(), cluster.Factory(), &viewer);
        try
        {
            orchestrator.ListGuests();
            QFAIL("expected std::runtime_error");
        } catch (const std::runtime_error&)
        {
        }
    }

    void failedLoginLeavesNoSession()
    {
        FakeCluster cluster;
        cluster.AddHost("pve1");
        cluster.AddHost("pve2");

        RecordingViewer viewer;
        Vdi::Orchestrator orchestrator(makeConfig(), QString(), cluster.Factory(), &viewer);
        try
        {
            orchestrator.Authenticate();
            QFAIL("expected AuthError");
        } catch (const Vdi::AuthError& ex)
        {
            QCOMPARE(ex.kind(), Vdi::AuthError::PoolExhausted);
        }
        QVERIFY(!orchestrator.IsAuthenticated());
    }
};

QTEST_APPLESS_MAIN(OrchestratorTests)
#include "test_orchestrator.moc"
