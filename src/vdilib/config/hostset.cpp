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

#include "hostset.h"
#include <QVariantMap>

namespace Vdi
{
    const char* const HostSet::DEFAULT_BACKEND = "pve";

    bool KnockStep::FromVariant(const QVariant& value, KnockStep& step)
    {
        QVariant portValue = value;
        QString protocol = "tcp";

        if (value.userType() == QMetaType::QVariantMap)
        {
            QVariantMap map = value.toMap();
            portValue = map.value("port");
            protocol = map.value("protocol", "tcp").toString().toLower();
        }

        bool ok = false;
        int port = portValue.toInt(&ok);
        if (!ok || port <= 0 || port > 65535)
            return false;

        if (protocol == "tcp")
            step.protocol = Tcp;
        else if (protocol == "udp")
            step.protocol = Udp;
        else
            return false;

        step.port = port;
        return true;
    }

    HostSet::HostSet()
        : m_backend(DEFAULT_BACKEND),
          m_twoFactor(false),
          m_verifyTls(true),
          m_autoVmid(0)
    {
    }

    HostSet::HostSet(const QString& name)
        : HostSet()
    {
        this->m_name = name;
    }

    void HostSet::AddHost(const QString& host, int port)
    {
        HostEndpoint endpoint;
        endpoint.host = host;
        endpoint.port = port;
        this->m_hostPool.append(endpoint);
    }

    QString HostSet::Principal() const
    {
        if (this->m_user.isEmpty())
            return QString();
        return this->m_user + "@" + this->m_backend;
    }

    bool HostSet::UsesApiToken() const
    {
        return !this->m_tokenName.isEmpty() && !this->m_tokenValue.isEmpty();
    }
}
