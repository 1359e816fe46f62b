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

#include "portknocker.h"
#include <QDebug>
#include <QHostAddress>
#include <QHostInfo>
#include <QTcpSocket>
#include <QUdpSocket>

namespace Vdi
{
    PortKnocker::PortKnocker()
        : m_knock(&PortKnocker::SendKnock)
    {
    }

    PortKnocker::PortKnocker(KnockFunction knock)
        : m_knock(knock)
    {
    }

    int PortKnocker::Knock(const QString& host, const QList<KnockStep>& sequence) const
    {
        int delivered = 0;
        for (const KnockStep& step : sequence)
        {
            if (this->m_knock(host, step))
                ++delivered;
        }

        if (!sequence.isEmpty())
            qDebug() << "PortKnocker: Knocked" << host << delivered << "/" << sequence.size();
        return delivered;
    }

    bool PortKnocker::SendKnock(const QString& host, const KnockStep& step)
    {
        if (step.protocol == KnockStep::Udp)
        {
            QHostInfo info = QHostInfo::fromName(host);
            if (info.error() != QHostInfo::NoError || info.addresses().isEmpty())
            {
                qWarning() << "PortKnocker: Cannot resolve" << host << info.errorString();
                return false;
            }

            QUdpSocket socket;
            qint64 sent = socket.writeDatagram(QByteArray(), info.addresses().first(),
                                               static_cast<quint16>(step.port));
            if (sent < 0)
            {
                qWarning() << "PortKnocker: UDP knock on" << step.port << "failed:" << socket.errorString();
                return false;
            }
            return true;
        }

        QTcpSocket socket;
        socket.connectToHost(host, static_cast<quint16>(step.port));
        bool connected = socket.waitForConnected(TCP_KNOCK_TIMEOUT_MS);
        if (connected)
        {
            socket.disconnectFromHost();
            if (socket.state() != QAbstractSocket::UnconnectedState)
                socket.waitForDisconnected(TCP_KNOCK_TIMEOUT_MS);
        } else if (socket.error() == QAbstractSocket::HostNotFoundError)
        {
            qWarning() << "PortKnocker: Cannot resolve" << host;
            socket.abort();
            return false;
        } else
        {
            // A closed or filtered port still registers the knock
            qDebug() << "PortKnocker: TCP knock on" << step.port << ":" << socket.errorString();
            socket.abort();
        }
        return true;
    }
}
