#include <QtTest>
#include "vdilib/pve/network/httpstransport.h"
#include "vdilib/pve/network/portknocker.h"
#include "vdilib/pve/session.h"
#include "test_helpers.h"

class ApiTransportTests : public QObject
{
    Q_OBJECT

private slots:
    void replyFromBody()
    {
        Vdi::ApiReply ok = Vdi::ApiReply::FromBody(200, "{\"data\": [{\"node\": \"pve1\"}]}");
        QVERIFY(ok.IsOk());
        QCOMPARE(ok.data.toList().size(), 1);

        Vdi::ApiReply nullData = Vdi::ApiReply::FromBody(200, "{\"data\": null}");
        QVERIFY(nullData.IsOk());
        QVERIFY(nullData.data.isNull());

        Vdi::ApiReply unauthorized = Vdi::ApiReply::FromBody(401, "");
        QCOMPARE(unauthorized.outcome, Vdi::ApiReply::HttpError);
        QVERIFY(unauthorized.IsCredentialRejection());

        Vdi::ApiReply serverError = Vdi::ApiReply::FromBody(500, "{\"data\": null}");
        QVERIFY(!serverError.IsOk());
        QVERIFY(!serverError.IsCredentialRejection());
        QCOMPARE(serverError.httpStatus, 500);

        Vdi::ApiReply garbage = Vdi::ApiReply::FromBody(200, "<html>proxy error</html>");
        QCOMPARE(garbage.outcome, Vdi::ApiReply::HttpError);
        QCOMPARE(garbage.httpStatus, 0);

        Vdi::ApiReply noData = Vdi::ApiReply::FromBody(200, "{\"errors\": {}}");
        QCOMPARE(noData.outcome, Vdi::ApiReply::HttpError);

        QVERIFY(!Vdi::ApiReply::Unreachable("timeout").IsCredentialRejection());
    }

    void encodesPairs()
    {
        QList<QPair<QString, QString>> pairs;
        pairs << qMakePair(QString("username"), QString("alice@pve"))
              << qMakePair(QString("password"), QString("p&ss w=rd"));
        QCOMPARE(Vdi::HttpsTransport::EncodePairs(pairs), QByteArray("username=alice%40pve&password=p%26ss%20w%3Drd"));
        QVERIFY(Vdi::HttpsTransport::EncodePairs({}).isEmpty());
    }

    void buildsGetRequest()
    {
        Vdi::HttpsTransport transport("pve1.lab", 8006, true);
        Vdi::ApiRequest request = Vdi::ApiRequest::MakeGet("cluster/resources");
        request.query << qMakePair(QString("type"), QString("vm"));
        request.headers.insert("Authorization", "PVEAPIToken=alice@pve!vdi=secret");

        const QByteArray http = transport.BuildHttpRequest(request);
        QVERIFY(http.startsWith("GET /api2/json/cluster/resources?type=vm HTTP/1.1\r\n"));
        QVERIFY(http.contains("\r\nHost: pve1.lab:8006\r\n"));
        QVERIFY(http.contains("\r\nAuthorization: PVEAPIToken=alice@pve!vdi=secret\r\n"));
        QVERIFY(http.contains("\r\nConnection: close\r\n"));
        QVERIFY(!http.contains("Content-Length"));
        QVERIFY(http.endsWith("\r\n\r\n"));
    }

    void buildsPostRequest()
    {
        Vdi::HttpsTransport transport("pve1.lab", 0, false);
        QCOMPARE(transport.GetPort(), 8006);

        Vdi::ApiRequest request = Vdi::ApiRequest::MakePost("access/ticket");
        request.form << qMakePair(QString("username"), QString("alice@pve"))
                     << qMakePair(QString("password"), QString("secret"));

        const QByteArray http = transport.BuildHttpRequest(request);
        const QByteArray body = "username=alice%40pve&password=secret";
        QVERIFY(http.startsWith("POST /api2/json/access/ticket HTTP/1.1\r\n"));
        QVERIFY(http.contains("\r\nContent-Type: application/x-www-form-urlencoded\r\n"));
        QVERIFY(http.contains("\r\nContent-Length: " + QByteArray::number(body.size()) + "\r\n"));
        QVERIFY(http.endsWith("\r\n\r\n" + body));
    }

    void decodesChunkedBody()
    {
        bool ok = false;
        QByteArray decoded = Vdi::HttpsTransport::DecodeChunkedBody("7\r\n{\"data\"\r\n6;ext=1\r\n: null\r\n1\r\n}\r\n0\r\n\r\n", &ok);
        QVERIFY(ok);
        QCOMPARE(decoded, QByteArray("{\"data\": null}"));

        Vdi::HttpsTransport::DecodeChunkedBody("a\r\nshort\r\n", &ok);
        QVERIFY(!ok);

        Vdi::HttpsTransport::DecodeChunkedBody("zz\r\nabc\r\n0\r\n\r\n", &ok);
        QVERIFY(!ok);

        // Sizes near INT_MAX must not wrap past the end of the buffer
        decoded = Vdi::HttpsTransport::DecodeChunkedBody("7fffffff\r\nabc\r\n0\r\n\r\n", &ok);
        QVERIFY(!ok);
        QVERIFY(decoded.isEmpty());

        decoded = Vdi::HttpsTransport::DecodeChunkedBody("3\r\nabc\r\n7ffffffe\r\nxy\r\n0\r\n\r\n", &ok);
        QVERIFY(!ok);
        QCOMPARE(decoded, QByteArray("abc"));
    }

    void tokenSessionSignsEveryRequest()
    {
        QSharedPointer<FakeApiTransport> transport(new FakeApiTransport("pve1"));
        QScopedPointer<Vdi::Session> session(Vdi::Session::FromToken(transport, "alice@pve", "vdi", "0f1e"));

        QCOMPARE(Vdi::Session::BuildTokenHeader("alice@pve", "vdi", "0f1e"), QString("PVEAPIToken=alice@pve!vdi=0f1e"));

        session->Get("cluster/resources");
        session->Post("nodes/pve1/qemu/100/status/start", {}, 28000);
        QCOMPARE(transport->Requests().size(), 2);
        for (const Vdi::ApiRequest& request : transport->Requests())
        {
            QCOMPARE(request.headers.value("Authorization"), QString("PVEAPIToken=alice@pve!vdi=0f1e"));
            QVERIFY(!request.headers.contains("Cookie"));
        }
        QCOMPARE(transport->Requests().last().timeoutMs, 28000);
        QCOMPARE(session->GetHostname(), QString("pve1"));
        QCOMPARE(session->GetPort(), 8006);
    }

    void knockStepFromVariant()
    {
        Vdi::KnockStep step;
        QVERIFY(Vdi::KnockStep::FromVariant(QVariant(7000), step));
        QCOMPARE(step.port, 7000);
        QCOMPARE(step.protocol, Vdi::KnockStep::Tcp);

        QVERIFY(Vdi::KnockStep::FromVariant(QVariantMap{{"port", 8000}, {"protocol", "UDP"}}, step));
        QCOMPARE(step.port, 8000);
        QCOMPARE(step.protocol, Vdi::KnockStep::Udp);

        QVERIFY(!Vdi::KnockStep::FromVariant(QVariant(0), step));
        QVERIFY(!Vdi::KnockStep::FromVariant(QVariant(65536), step));
        QVERIFY(!Vdi::KnockStep::FromVariant(QVariant("abc"), step));
        QVERIFY(!Vdi::KnockStep::FromVariant(QVariantMap{{"port", 22}, {"protocol", "sctp"}}, step));
    }

    void knockerCountsDeliveredKnocks()
    {
        QList<int> ports;
        Vdi::PortKnocker knocker([&ports](const QString& host, const Vdi::KnockStep& step) {
            Q_UNUSED(host);
            ports.append(step.port);
            return step.port != 2;
        });

        QList<Vdi::KnockStep> sequence;
        for (int port = 1; port <= 3; ++port)
        {
            Vdi::KnockStep step;
            step.port = port;
            sequence.append(step);
        }

        QCOMPARE(knocker.Knock("pve1", sequence), 2);
        QCOMPARE(ports, QList<int>({1, 2, 3}));
        QCOMPARE(knocker.Knock("pve1", QList<Vdi::KnockStep>()), 0);
    }
};

QTEST_APPLESS_MAIN(ApiTransportTests)
#include "test_apitransport.moc"
