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

#ifndef HTTPSTRANSPORT_H
#define HTTPSTRANSPORT_H

#include "apitransport.h"
#include <QElapsedTimer>
#include <QMap>

class QSslSocket;

namespace Vdi
{
    /**
     * @brief Blocking HTTPS transport for the cluster REST API
     *
     * Every request opens its own TLS connection (Connection: close), writes the
     * request and reads the complete reply on the calling thread. All waits are
     * bounded by the request's timeout, so a dead host turns into a
     * NetworkError rather than a hang.
     */
    class VDILIB_EXPORT HttpsTransport : public ApiTransport
    {
        public:
            static const int DEFAULT_PORT = 8006;

            HttpsTransport(const QString& hostname, int port, bool verifyTls);
            ~HttpsTransport() override;

            ApiReply Send(const ApiRequest& request) override;

            QString GetHostname() const override { return this->m_hostname; }
            int GetPort() const override { return this->m_port; }
            bool VerifiesTls() const { return this->m_verifyTls; }

            /**
             * @brief Factory suitable for HostPoolResolver
             */
            static QSharedPointer<ApiTransport> Create(const QString& hostname, int port, bool verifyTls);

            /**
             * @brief Serialize the request line, headers and body
             */
            QByteArray BuildHttpRequest(const ApiRequest& request) const;

            static QByteArray EncodePairs(const QList<QPair<QString, QString>>& pairs);
            static QByteArray DecodeChunkedBody(const QByteArray& chunked, bool* ok = nullptr);

        private:
            bool connectToHost(QSslSocket* socket, const QElapsedTimer& timer, int timeoutMs);
            bool readHttpResponse(QSslSocket* socket, const QElapsedTimer& timer, int timeoutMs,
                                  int& statusCode, QByteArray& body);
            static int remaining(const QElapsedTimer& timer, int timeoutMs);

            QString m_hostname;
            int m_port;
            bool m_verifyTls;
            QString m_lastError;
    };
}

#endif // HTTPSTRANSPORT_H
