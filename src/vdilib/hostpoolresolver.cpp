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

#include "hostpoolresolver.h"
#include "vdierror.h"
#include "pve/session.h"
#include "pve/pveapi/pveapi_Access.h"
#include "pve/pveapi/pveapi_Cluster.h"
#include <QDebug>
#include <QRandomGenerator>
#include <QVariantMap>

namespace Vdi
{
    HostPoolResolver::HostPoolResolver(TransportFactory transportFactory)
        : m_transportFactory(transportFactory)
        , m_shuffle(&HostPoolResolver::RandomShuffle)
    {
    }

    void HostPoolResolver::SetPassword(const QString& password, const QString& otp)
    {
        this->m_password = password;
        this->m_otp = otp;
    }

    void HostPoolResolver::RandomShuffle(QList<HostEndpoint>& pool)
    {
        // Fisher-Yates
        for (int i = pool.size() - 1; i > 0; --i)
        {
            int j = static_cast<int>(QRandomGenerator::global()->bounded(i + 1));
            if (i != j)
                pool.swapItemsAt(i, j);
        }
    }

    QSharedPointer<Session> HostPoolResolver::Authenticate(const HostSet& hostSet)
    {
        if (hostSet.Principal().isEmpty())
            throw AuthError(AuthError::CredentialRejected,
                            QString("Authentication failed: no user configured for host-set %1").arg(hostSet.Name()));

        if (!hostSet.UsesApiToken() && this->m_password.isEmpty())
            throw AuthError(AuthError::CredentialRejected,
                            QString("Authentication failed: no API token or password for %1").arg(hostSet.Principal()));

        QList<HostEndpoint> pool = hostSet.HostPool();
        if (this->m_shuffle)
            this->m_shuffle(pool);
        this->m_lastOrder = pool;

        QString lastError;
        for (const HostEndpoint& endpoint : pool)
        {
            AuthAttempt attempt = this->TryHost(hostSet, endpoint);
            switch (attempt.outcome)
            {
                case AuthAttempt::Success:
                    qInfo() << "HostPoolResolver: Authenticated to" << endpoint.ToString()
                            << "as" << hostSet.Principal();
                    return attempt.session;

                case AuthAttempt::CredentialRejected:
                    qWarning() << "HostPoolResolver: Credentials rejected by" << endpoint.ToString();
                    throw AuthError(AuthError::CredentialRejected,
                                    QString("Authentication failed: %1").arg(attempt.error));

                case AuthAttempt::HostUnreachable:
                    qWarning() << "HostPoolResolver: Host" << endpoint.ToString() << "unreachable:" << attempt.error;
                    lastError = attempt.error;
                    break;
            }
        }

        QString message = "Unable to connect to any host in the pool";
        if (!lastError.isEmpty())
            message += QString(" (last error: %1)").arg(lastError);
        throw AuthError(AuthError::PoolExhausted, message);
    }

    HostPoolResolver::AuthAttempt HostPoolResolver::TryHost(const HostSet& hostSet, const HostEndpoint& endpoint)
    {
        if (!hostSet.KnockSequence().isEmpty())
            this->m_knocker.Knock(endpoint.host, hostSet.KnockSequence());

        QSharedPointer<ApiTransport> transport = this->m_transportFactory(endpoint.host, endpoint.port, hostSet.VerifyTls());
        if (!transport)
        {
            AuthAttempt attempt;
            attempt.outcome = AuthAttempt::HostUnreachable;
            attempt.endpoint = endpoint;
            attempt.error = "No transport for " + endpoint.ToString();
            return attempt;
        }

        if (hostSet.UsesApiToken())
            return this->tryToken(hostSet, endpoint, transport);
        return this->tryTicket(hostSet, endpoint, transport);
    }

    HostPoolResolver::AuthAttempt HostPoolResolver::tryToken(const HostSet& hostSet, const HostEndpoint& endpoint,
                                                             const QSharedPointer<ApiTransport>& transport)
    {
        AuthAttempt attempt;
        attempt.endpoint = endpoint;

        QSharedPointer<Session> session(Session::FromToken(transport, hostSet.Principal(),
                                                           hostSet.TokenName(), hostSet.TokenValue()));

        // Check the login with a cheap authenticated call
        ApiReply reply = PveAPI::Cluster::GetResources(session.data(), PveAPI::Cluster::RESOURCE_NODE);
        if (reply.IsOk())
        {
            attempt.outcome = AuthAttempt::Success;
            attempt.session = session;
        } else if (reply.IsCredentialRejection())
        {
            attempt.outcome = AuthAttempt::CredentialRejected;
            attempt.error = QString("%1 (HTTP %2)").arg(reply.error).arg(reply.httpStatus);
        } else
        {
            attempt.outcome = AuthAttempt::HostUnreachable;
            attempt.error = reply.error;
        }
        return attempt;
    }

    HostPoolResolver::AuthAttempt HostPoolResolver::tryTicket(const HostSet& hostSet, const HostEndpoint& endpoint,
                                                              const QSharedPointer<ApiTransport>& transport)
    {
        AuthAttempt attempt;
        attempt.endpoint = endpoint;

        ApiReply reply = PveAPI::Access::CreateTicket(transport.data(), hostSet.Principal(),
                                                      this->m_password, this->m_otp);
        if (reply.IsCredentialRejection())
        {
            attempt.outcome = AuthAttempt::CredentialRejected;
            attempt.error = QString("invalid user name or password (HTTP %1)").arg(reply.httpStatus);
            return attempt;
        }
        if (!reply.IsOk())
        {
            attempt.outcome = AuthAttempt::HostUnreachable;
            attempt.error = reply.error;
            return attempt;
        }

        const QVariantMap data = reply.data.toMap();
        if (data.value("NeedTFA").toBool())
        {
            attempt.outcome = AuthAttempt::CredentialRejected;
            attempt.error = "two-factor code required";
            return attempt;
        }

        const QString ticket = data.value("ticket").toString();
        if (ticket.isEmpty())
        {
            attempt.outcome = AuthAttempt::HostUnreachable;
            attempt.error = "ticket missing from login reply";
            return attempt;
        }

        attempt.outcome = AuthAttempt::Success;
        attempt.session = QSharedPointer<Session>(Session::FromTicket(transport, hostSet.Principal(), ticket,
                                                                      data.value("CSRFPreventionToken").toString()));
        return attempt;
    }
}
