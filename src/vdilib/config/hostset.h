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

#ifndef HOSTSET_H
#define HOSTSET_H

#include "../vdilib_global.h"
#include <QList>
#include <QString>
#include <QVariant>

namespace Vdi
{
    struct HostEndpoint
    {
        QString host;
        int port = 8006;

        QString ToString() const { return QString("%1:%2").arg(this->host).arg(this->port); }
        bool operator==(const HostEndpoint& other) const
        {
            return this->host == other.host && this->port == other.port;
        }
    };

    struct KnockStep
    {
        enum Protocol
        {
            Tcp,
            Udp
        };

        int port = 0;
        Protocol protocol = Tcp;

        /**
         * @brief Parse one knock_seq entry, a bare port or {"port": N, "protocol": "tcp"|"udp"}
         * @return false when the entry is not usable
         */
        static bool FromVariant(const QVariant& value, KnockStep& step);
    };

    /**
     * @brief Named group of redundant API endpoints sharing one credential profile
     *
     * Built once from configuration. Only the pool ordering changes afterwards,
     * which is done on a copy by HostPoolResolver.
     */
    class VDILIB_EXPORT HostSet
    {
        public:
            static const char* const DEFAULT_BACKEND;

            HostSet();
            explicit HostSet(const QString& name);

            QString Name() const { return this->m_name; }
            void SetName(const QString& name) { this->m_name = name; }

            const QList<HostEndpoint>& HostPool() const { return this->m_hostPool; }
            void SetHostPool(const QList<HostEndpoint>& pool) { this->m_hostPool = pool; }
            void AddHost(const QString& host, int port);

            QString Backend() const { return this->m_backend; }
            void SetBackend(const QString& backend) { this->m_backend = backend; }

            QString User() const { return this->m_user; }
            void SetUser(const QString& user) { this->m_user = user; }

            QString TokenName() const { return this->m_tokenName; }
            void SetTokenName(const QString& tokenName) { this->m_tokenName = tokenName; }

            QString TokenValue() const { return this->m_tokenValue; }
            void SetTokenValue(const QString& tokenValue) { this->m_tokenValue = tokenValue; }

            bool TwoFactor() const { return this->m_twoFactor; }
            void SetTwoFactor(bool twoFactor) { this->m_twoFactor = twoFactor; }

            bool VerifyTls() const { return this->m_verifyTls; }
            void SetVerifyTls(bool verify) { this->m_verifyTls = verify; }

            QString PasswordResetCommand() const { return this->m_passwordResetCommand; }
            void SetPasswordResetCommand(const QString& command) { this->m_passwordResetCommand = command; }

            bool HasAutoConnectGuest() const { return this->m_autoVmid > 0; }
            int AutoConnectGuest() const { return this->m_autoVmid; }
            void SetAutoConnectGuest(int vmid) { this->m_autoVmid = vmid; }

            const QList<KnockStep>& KnockSequence() const { return this->m_knockSequence; }
            void SetKnockSequence(const QList<KnockStep>& sequence) { this->m_knockSequence = sequence; }

            /**
             * @brief user@backend, the principal presented to the API
             */
            QString Principal() const;

            /**
             * @brief True when both token name and value are configured
             */
            bool UsesApiToken() const;

        private:
            QString m_name;
            QList<HostEndpoint> m_hostPool;
            QString m_backend;
            QString m_user;
            QString m_tokenName;
            QString m_tokenValue;
            bool m_twoFactor;
            bool m_verifyTls;
            QString m_passwordResetCommand;
            int m_autoVmid;
            QList<KnockStep> m_knockSequence;
    };
}

#endif // HOSTSET_H
