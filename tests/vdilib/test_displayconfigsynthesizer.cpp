#include <QtTest>
#include "vdilib/displayconfigsynthesizer.h"
#include "vdilib/vdierror.h"
#include "vdilib/pve/guestrecord.h"
#include "vdilib/pve/session.h"
#include "test_helpers.h"

static QVariantMap spiceTicket()
{
    QVariantMap ticket;
    ticket.insert("type", "spice");
    ticket.insert("host", "pvespiceproxy:6530f1a2:100:pve1::a1b2c3");
    ticket.insert("password", "ticket-password");
    ticket.insert("proxy", "http://10.0.0.11:3128");
    ticket.insert("tls-port", 61000);
    ticket.insert("delete-this-file", 1);
    ticket.insert("secure-attention", "Ctrl+Alt+Ins");
    ticket.insert("title", "VM 100 - desk");
    return ticket;
}

static QStringList configLines(const QByteArray& config)
{
    return QString::fromUtf8(config).split('\n', Qt::SkipEmptyParts);
}

class DisplayConfigSynthesizerTests : public QObject
{
    Q_OBJECT

private slots:
    void redirectsMappedProxy()
    {
        Vdi::ProxyRedirectTable redirects;
        redirects.insert("px1.example.com:3128", "public.example.com:443");
        Vdi::DisplayConfigSynthesizer synthesizer(redirects, Vdi::ParameterList());

        QVariantMap ticket;
        ticket.insert("proxy", "https://px1.example.com:3128");
        ticket.insert("port", "5900");

        const QStringList lines = configLines(synthesizer.BuildConfig(ticket));
        QVERIFY(lines.contains("proxy=http://public.example.com:443"));
        QVERIFY(lines.contains("port=5900"));
    }

    void unmappedProxyIsUnchanged()
    {
        Vdi::ProxyRedirectTable redirects;
        redirects.insert("px1.example.com:3128", "public.example.com:443");
        Vdi::DisplayConfigSynthesizer synthesizer(redirects, Vdi::ParameterList());

        QVariantMap ticket;
        ticket.insert("proxy", "http://px2.example.com:3128");

        QVERIFY(configLines(synthesizer.BuildConfig(ticket)).contains("proxy=http://px2.example.com:3128"));
    }

    void proxyLookupIgnoresSchemeAndCase()
    {
        QCOMPARE(Vdi::DisplayConfigSynthesizer::ProxyLookupKey("HTTPS://PX1.Example.com:3128"), QString("px1.example.com:3128"));
        QCOMPARE(Vdi::DisplayConfigSynthesizer::ProxyLookupKey("http://10.0.0.11:3128"), QString("10.0.0.11:3128"));
        QCOMPARE(Vdi::DisplayConfigSynthesizer::ProxyLookupKey("px1:3128"), QString("px1:3128"));

        Vdi::ProxyRedirectTable redirects;
        redirects.insert("10.0.0.11:3128", "vdi.example.org:8443");
        Vdi::DisplayConfigSynthesizer synthesizer(redirects, Vdi::ParameterList());
        QCOMPARE(synthesizer.RewriteProxy("http://10.0.0.11:3128"), QString("http://vdi.example.org:8443"));
    }

    void extraParametersWin()
    {
        Vdi::ParameterList extras;
        extras << qMakePair(QString("title"), QString("X")) << qMakePair(QString("fullscreen"), QString("1"));
        Vdi::DisplayConfigSynthesizer synthesizer(Vdi::ProxyRedirectTable(), extras);

        QVariantMap ticket;
        ticket.insert("title", "Y");
        ticket.insert("type", "spice");

        const QStringList lines = configLines(synthesizer.BuildConfig(ticket));
        QVERIFY(lines.contains("title=X"));
        QVERIFY(!lines.contains("title=Y"));
        QCOMPARE(lines.filter("title=").size(), 1);
        QCOMPARE(lines.last(), QString("fullscreen=1"));
    }

    void fullTicketLayout()
    {
        Vdi::ProxyRedirectTable redirects;
        redirects.insert("10.0.0.11:3128", "vdi.example.org:8443");
        Vdi::ParameterList extras;
        extras << qMakePair(QString("secure-attention"), QString("Ctrl+Alt+Del"))
               << qMakePair(QString("toggle-fullscreen"), QString("Shift+F11"));
        Vdi::DisplayConfigSynthesizer synthesizer(redirects, extras);

        const QByteArray expected =
            "[virt-viewer]\n"
            "delete-this-file=1\n"
            "host=pvespiceproxy:6530f1a2:100:pve1::a1b2c3\n"
            "password=ticket-password\n"
            "proxy=http://vdi.example.org:8443\n"
            "secure-attention=Ctrl+Alt+Del\n"
            "title=VM 100 - desk\n"
            "tls-port=61000\n"
            "type=spice\n"
            "toggle-fullscreen=Shift+F11\n";
        QCOMPARE(synthesizer.BuildConfig(spiceTicket()), expected);
    }

    void numbersFromJsonStayIntegral()
    {
        Vdi::DisplayConfigSynthesizer synthesizer(Vdi::ProxyRedirectTable(), Vdi::ParameterList());

        QVariantMap ticket;
        ticket.insert("tls-port", 61000.0);
        ticket.insert("enabled", true);
        ticket.insert("empty", QVariant());

        const QStringList lines = configLines(synthesizer.BuildConfig(ticket));
        QVERIFY(lines.contains("tls-port=61000"));
        QVERIFY(lines.contains("enabled=1"));
        QVERIFY(lines.contains("empty="));
    }

    void hugeNumbersKeepTheirExponent()
    {
        Vdi::DisplayConfigSynthesizer synthesizer(Vdi::ProxyRedirectTable(), Vdi::ParameterList());

        QVariantMap ticket;
        ticket.insert("huge", 1e20);
        ticket.insert("negative", -1e300);
        ticket.insert("largest-exact", 9007199254740991.0);

        const QStringList lines = configLines(synthesizer.BuildConfig(ticket));
        QCOMPARE(lines.filter("huge=").size(), 1);
        QVERIFY(lines.filter("huge=").first().startsWith("huge=1e"));
        QVERIFY(lines.filter("negative=").first().startsWith("negative=-1e"));
        QVERIFY(lines.contains("largest-exact=9007199254740991"));
    }

    void outputIsDeterministic()
    {
        Vdi::ProxyRedirectTable redirects;
        redirects.insert("10.0.0.11:3128", "vdi.example.org:8443");
        Vdi::ParameterList extras;
        extras << qMakePair(QString("title"), QString("Desk"));

        Vdi::DisplayConfigSynthesizer first(redirects, extras);
        Vdi::DisplayConfigSynthesizer second(redirects, extras);
        QCOMPARE(first.BuildConfig(spiceTicket()), first.BuildConfig(spiceTicket()));
        QCOMPARE(first.BuildConfig(spiceTicket()), second.BuildConfig(spiceTicket()));
    }

    void malformedTicketsAreRejected()
    {
        Vdi::DisplayConfigSynthesizer synthesizer(Vdi::ProxyRedirectTable(), Vdi::ParameterList());

        QList<QVariantMap> tickets;
        tickets << QVariantMap();
        tickets << QVariantMap{{"password", "line\nbreak"}};
        tickets << QVariantMap{{"bad=key", "value"}};
        tickets << QVariantMap{{"[section]", "value"}};

        for (const QVariantMap& ticket : tickets)
        {
            try
            {
                synthesizer.BuildConfig(ticket);
                QFAIL("expected SynthesisError");
            } catch (const Vdi::SynthesisError& ex)
            {
                QCOMPARE(ex.kind(), Vdi::SynthesisError::MalformedTicket);
            }
        }
    }

    void fetchTicketUsesSpiceProxyPath()
    {
        QSharedPointer<FakeApiTransport> transport(new FakeApiTransport("pve1"));
        QSharedPointer<Vdi::Session> session(Vdi::Session::FromToken(transport, "alice@pve", "vdi", "secret"));
        transport->AddReply("POST", "nodes/pve1/lxc/200/spiceproxy", Vdi::ApiReply::Success(spiceTicket()));

        Vdi::GuestRecord guest;
        guest.SetVmid(200);
        guest.SetName("builder");
        guest.SetNode("pve1");
        guest.SetKind(Vdi::GuestRecord::Lxc);

        QVariantMap ticket = Vdi::DisplayConfigSynthesizer::FetchTicket(session.data(), guest);
        QCOMPARE(ticket.value("type").toString(), QString("spice"));
        QCOMPARE(transport->Requests().first().method, Vdi::ApiRequest::Post);
    }

    void fetchTicketFailureIsUnavailable()
    {
        QSharedPointer<FakeApiTransport> transport(new FakeApiTransport("pve1"));
        QSharedPointer<Vdi::Session> session(Vdi::Session::FromToken(transport, "alice@pve", "vdi", "secret"));
        transport->AddReply("POST", "nodes/pve1/qemu/100/spiceproxy", Vdi::ApiReply::HttpFailure(500, "HTTP error 500"));

        Vdi::GuestRecord guest;
        guest.SetVmid(100);
        guest.SetName("desk");
        guest.SetNode("pve1");

        try
        {
            Vdi::DisplayConfigSynthesizer::FetchTicket(session.data(), guest);
            QFAIL("expected SynthesisError");
        } catch (const Vdi::SynthesisError& ex)
        {
            QCOMPARE(ex.kind(), Vdi::SynthesisError::TicketUnavailable);
        }
    }
};

QTEST_APPLESS_MAIN(DisplayConfigSynthesizerTests)
#include "test_displayconfigsynthesizer.moc"
