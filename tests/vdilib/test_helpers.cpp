/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#include "test_helpers.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QUrl>

FakeApiTransport::FakeApiTransport(const QString& hostname, int port)
    : m_hostname(hostname)
    , m_port(port)
{
}

void FakeApiTransport::AddReply(const QString& method, const QString& path, const Vdi::ApiReply& reply)
{
    this->m_replies[method + " " + path].append(reply);
}

Vdi::ApiReply FakeApiTransport::Send(const Vdi::ApiRequest& request)
{
    this->m_requests.append(request);

    const QString key = request.MethodName() + " " + request.path;
    auto it = this->m_replies.find(key);
    if (it == this->m_replies.end() || it.value().isEmpty())
        return Vdi::ApiReply::Unreachable("No scripted reply for " + key);

    if (it.value().size() > 1)
        return it.value().takeFirst();
    return it.value().first();
}

int FakeApiTransport::CountRequests(const QString& method, const QString& path) const
{
    int count = 0;
    for (const Vdi::ApiRequest& request : this->m_requests)
    {
        if (request.MethodName() == method && request.path == path)
            ++count;
    }
    return count;
}

QSharedPointer<FakeApiTransport> FakeCluster::AddHost(const QString& hostname, int port)
{
    QSharedPointer<FakeApiTransport> transport(new FakeApiTransport(hostname, port));
    this->m_hosts.insert(hostname, transport);
    return transport;
}

Vdi::TransportFactory FakeCluster::Factory()
{
    QMap<QString, QSharedPointer<FakeApiTransport>> hosts = this->m_hosts;
    QSharedPointer<QStringList> contacted = this->m_contacted;
    return [hosts, contacted](const QString& hostname, int port, bool verifyTls) -> QSharedPointer<Vdi::ApiTransport> {
        Q_UNUSED(port);
        Q_UNUSED(verifyTls);
        contacted->append(hostname);
        return hosts.value(hostname);
    };
}

QVariantMap MakeNode(const QString& node, const QString& status)
{
    QVariantMap map;
    map.insert("node", node);
    map.insert("status", status);
    map.insert("type", "node");
    return map;
}

QVariantMap MakeGuest(int vmid, const QString& name, const QString& node, const QString& type,
                      const QString& status, const QString& lock, bool isTemplate)
{
    QVariantMap map;
    map.insert("vmid", vmid);
    map.insert("name", name);
    map.insert("node", node);
    map.insert("type", type);
    map.insert("status", status);
    if (!lock.isEmpty())
        map.insert("lock", lock);
    map.insert("template", isTemplate ? 1 : 0);
    return map;
}

QString TaskStatusPath(const QString& node, const QString& upid)
{
    return QString("nodes/%1/tasks/%2/status")
        .arg(QString::fromUtf8(QUrl::toPercentEncoding(node)), QString::fromUtf8(QUrl::toPercentEncoding(upid)));
}

QVariant LoadJsonResource(const QString& resourcePath)
{
    QFile file(resourcePath);
    if (!file.open(QIODevice::ReadOnly))
    {
        qWarning() << "LoadJsonResource: failed to open resource" << resourcePath;
        const QString fileName = QFileInfo(resourcePath).fileName();
        const QStringList fallbacks = {
            QDir::current().filePath("../tests/testdata/" + fileName),
            QDir::current().filePath("../../tests/testdata/" + fileName),
            QDir::current().filePath("../../../tests/testdata/" + fileName)
        };

        for (const QString& fallback : fallbacks)
        {
            file.setFileName(fallback);
            if (file.open(QIODevice::ReadOnly))
                break;
        }
    }

    if (!file.isOpen())
    {
        qWarning() << "LoadJsonResource: failed to open any path";
        return QVariant();
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError)
    {
        qWarning() << "LoadJsonResource: parse error" << parseError.errorString();
        return QVariant();
    }

    return doc.toVariant();
}
