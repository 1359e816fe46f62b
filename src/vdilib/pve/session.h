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

#ifndef VDI_SESSION_H
#define VDI_SESSION_H

#include "../vdilib_global.h"
#include "network/apitransport.h"
#include <QSharedPointer>
#include <QString>

namespace Vdi
{
    /**
     * @brief Authenticated handle bound to exactly one API endpoint
     *
     * Produced by HostPoolResolver once a pool member accepted the credentials.
     * Every request sent through it carries either the API token header or the
     * ticket cookie (plus CSRF header on POST), depending on how it was opened.
     *
     * A session is single-owner and is not safe for concurrent use.
     */
    class VDILIB_EXPORT Session
    {
        public:
            enum AuthMode
            {
                ApiToken,
                Ticket
            };

            static Session* FromToken(const QSharedPointer<ApiTransport>& transport,
                                      const QString& principal,
                                      const QString& tokenName,
                                      const QString& tokenValue);

            static Session* FromTicket(const QSharedPointer<ApiTransport>& transport,
                                       const QString& principal,
                                       const QString& ticket,
                                       const QString& csrfToken);

            ~Session();

            ApiReply Get(const QString& path, const QList<QPair<QString, QString>>& query = {});
            ApiReply Post(const QString& path, const QList<QPair<QString, QString>>& form = {},
                          int timeoutMs = ApiRequest::DEFAULT_TIMEOUT_MS);

            /**
             * @brief Send a prepared request after attaching the credentials
             */
            ApiReply Send(ApiRequest request);

            AuthMode GetAuthMode() const;
            QString GetPrincipal() const;
            QString GetHostname() const;
            int GetPort() const;
            ApiTransport* GetTransport() const;

            /**
             * @brief Value of the Authorization header used in token mode
             */
            static QString BuildTokenHeader(const QString& principal, const QString& tokenName, const QString& tokenValue);

        private:
            Session(const QSharedPointer<ApiTransport>& transport, AuthMode mode, const QString& principal);
            Q_DISABLE_COPY(Session)

            class Private;
            Private* d;
    };
}

#endif // VDI_SESSION_H
