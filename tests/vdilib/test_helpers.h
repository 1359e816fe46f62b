/*
 * Copyright (c) 2025, Petr Bena <petr@bena.rocks>
 * All rights reserved.
 */

#ifndef VDILIB_TEST_HELPERS_H
#define VDILIB_TEST_HELPERS_H

#include "vdilib/pve/network/apitransport.h"
#include "vdilib/utils/sleeper.h"
#include <QList>
#include <QMap>
#include <QSharedPointer>
#include <QString>
#include <QStringList>
#include <QVariant>

/**
 * Transport that answers from a script instead of the network.
 *
 * Replies are keyed by "METHOD path". Several replies for one key are
 * handed out in order, the last one repeats. Unscripted calls are unreachable.
 */
class FakeApiTransport : public Vdi::ApiTransport
{
    public:
        explicit FakeApiTransport(const QString& hostname = "pve1", int port = 8006);

        void AddReply(const QString& method, const QString& path, const Vdi::ApiReply& reply);

        Vdi::ApiReply Send(const Vdi::ApiRequest& request) override;

        QString GetHostname() const override { return this->m_hostname; }
        int GetPort() const override { return this->m_port; }

        const QList<Vdi::ApiRequest>& Requests() const { return this->m_requests; }
        int CountRequests(const QString& method, const QString& path) const;

    private:
        QString m_hostname;
        int m_port;
        QMap<QString, QList<Vdi::ApiReply>> m_replies;
        QList<Vdi::ApiRequest> m_requests;
};

/**
 * Hands out FakeApiTransport instances per host and records every host asked for.
 */
class FakeCluster
{
    public:
        QSharedPointer<FakeApiTransport> AddHost(const QString& hostname, int port = 8006);

        Vdi::TransportFactory Factory();

        QStringList ContactedHosts() const { return *this->m_contacted; }
        QSharedPointer<FakeApiTransport> Host(const QString& hostname) const { return this->m_hosts.value(hostname); }

    private:
        QMap<QString, QSharedPointer<FakeApiTransport>> m_hosts;
        QSharedPointer<QStringList> m_contacted = QSharedPointer<QStringList>(new QStringList);
};

class RecordingSleeper : public Vdi::Sleeper
{
    public:
        void Sleep(int ms) override { this->sleeps.append(ms); }

        QList<int> sleeps;
};

QVariantMap MakeNode(const QString& node, const QString& status);
QVariantMap MakeGuest(int vmid, const QString& name, const QString& node, const QString& type = "qemu",
                      const QString& status = "stopped", const QString& lock = QString(), bool isTemplate = false);

QString TaskStatusPath(const QString& node, const QString& upid);

QVariant LoadJsonResource(const QString& resourcePath);

#endif // VDILIB_TEST_HELPERS_H
