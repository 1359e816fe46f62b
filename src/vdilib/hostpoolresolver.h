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

#ifndef HOSTPOOLRESOLVER_H
#define HOSTPOOLRESOLVER_H

#include "vdilib_global.h"
#include "config/hostset.h"
#include "pve/network/apitransport.h"
#include "pve/network/portknocker.h"
#include <QList>
#include <QSharedPointer>
#include <QString>
#include <functional>

namespace Vdi
{
    class Session;

    /**
     * @brief Authenticates against one member of a host-set's pool
     *
     * The pool is shuffled on every call so repeated runs spread the load.
     * Members are tried strictly one after another: an unreachable member is
     * skipped, a rejected credential stops the search at once since it would
     * be rejected everywhere.
     */
    class VDILIB_EXPORT HostPoolResolver
    {
        public:
            struct AuthAttempt
            {
                enum Outcome
                {
                    Success,
                    HostUnreachable,
                    CredentialRejected
                };

                Outcome outcome = HostUnreachable;
                HostEndpoint endpoint;
                QSharedPointer<Session> session;
                QString error;
            };

            using ShuffleFunction = std::function<void(QList<HostEndpoint>& pool)>;

            explicit HostPoolResolver(TransportFactory transportFactory);

            void SetShuffleFunction(ShuffleFunction shuffle) { this->m_shuffle = shuffle; }
            void SetPortKnocker(const PortKnocker& knocker) { this->m_knocker = knocker; }

            /**
             * @brief Password and optional one-time code for host-sets without an API token
             */
            void SetPassword(const QString& password, const QString& otp = QString());

            /**
             * @brief Open a session on the first pool member that answers
             *
             * Throws AuthError(CredentialRejected) when a member rejects the
             * credentials, AuthError(PoolExhausted) when no member could be reached.
             */
            QSharedPointer<Session> Authenticate(const HostSet& hostSet);

            /**
             * @brief One authentication attempt against one pool member
             */
            AuthAttempt TryHost(const HostSet& hostSet, const HostEndpoint& endpoint);

            /**
             * @brief Pool order used by the last Authenticate() call
             */
            QList<HostEndpoint> LastPoolOrder() const { return this->m_lastOrder; }

            static void RandomShuffle(QList<HostEndpoint>& pool);

        private:
            AuthAttempt tryToken(const HostSet& hostSet, const HostEndpoint& endpoint,
                                 const QSharedPointer<ApiTransport>& transport);
            AuthAttempt tryTicket(const HostSet& hostSet, const HostEndpoint& endpoint,
                                  const QSharedPointer<ApiTransport>& transport);

            TransportFactory m_transportFactory;
            ShuffleFunction m_shuffle;
            PortKnocker m_knocker;
            QString m_password;
            QString m_otp;
            QList<HostEndpoint> m_lastOrder;
    };
}

#endif // HOSTPOOLRESOLVER_H
