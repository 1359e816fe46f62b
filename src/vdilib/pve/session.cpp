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

#include "session.h"
#include <QDebug>

namespace Vdi
{
    class Session::Private
    {
        public:
            QSharedPointer<ApiTransport> transport;
            AuthMode mode = ApiToken;
            QString principal;
            QString authorization; // token mode
            QString ticket;        // ticket mode
            QString csrfToken;     // ticket mode, POST only
    };

    Session::Session(const QSharedPointer<ApiTransport>& transport, AuthMode mode, const QString& principal)
        : d(new Private)
    {
        this->d->transport = transport;
        this->d->mode = mode;
        this->d->principal = principal;
    }

    Session::~Session()
    {
        delete this->d;
    }

    Session* Session::FromToken(const QSharedPointer<ApiTransport>& transport,
                                const QString& principal,
                                const QString& tokenName,
                                const QString& tokenValue)
    {
        Session* session = new Session(transport, ApiToken, principal);
        session->d->authorization = BuildTokenHeader(principal, tokenName, tokenValue);
        return session;
    }

    Session* Session::FromTicket(const QSharedPointer<ApiTransport>& transport,
                                 const QString& principal,
                                 const QString& ticket,
                                 const QString& csrfToken)
    {
        Session* session = new Session(transport, Ticket, principal);
        session->d->ticket = ticket;
        session->d->csrfToken = csrfToken;
        qDebug() << "Session: Opened ticket session for" << principal << "ticket" << ticket.left(12) + "...";
        return session;
    }

    QString Session::BuildTokenHeader(const QString& principal, const QString& tokenName, const QString& tokenValue)
    {
        return QString("PVEAPIToken=%1!%2=%3").arg(principal, tokenName, tokenValue);
    }

    ApiReply Session::Send(ApiRequest request)
    {
        if (this->d->mode == ApiToken)
        {
            request.headers.insert("Authorization", this->d->authorization);
        } else
        {
            request.headers.insert("Cookie", "PVEAuthCookie=" + this->d->ticket);
            if (request.method == ApiRequest::Post && !this->d->csrfToken.isEmpty())
                request.headers.insert("CSRFPreventionToken", this->d->csrfToken);
        }

        return this->d->transport->Send(request);
    }

    ApiReply Session::Get(const QString& path, const QList<QPair<QString, QString>>& query)
    {
        ApiRequest request = ApiRequest::MakeGet(path);
        request.query = query;
        return this->Send(request);
    }

    ApiReply Session::Post(const QString& path, const QList<QPair<QString, QString>>& form, int timeoutMs)
    {
        ApiRequest request = ApiRequest::MakePost(path);
        request.form = form;
        request.timeoutMs = timeoutMs;
        return this->Send(request);
    }

    Session::AuthMode Session::GetAuthMode() const
    {
        return this->d->mode;
    }

    QString Session::GetPrincipal() const
    {
        return this->d->principal;
    }

    QString Session::GetHostname() const
    {
        return this->d->transport->GetHostname();
    }

    int Session::GetPort() const
    {
        return this->d->transport->GetPort();
    }

    ApiTransport* Session::GetTransport() const
    {
        return this->d->transport.data();
    }
}
