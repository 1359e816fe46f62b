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

#ifndef APITRANSPORT_H
#define APITRANSPORT_H

#include "../../vdilib_global.h"
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QPair>
#include <QSharedPointer>
#include <QString>
#include <QVariant>
#include <functional>

namespace Vdi
{
    /**
     * @brief One REST call against the cluster API
     *
     * Paths are relative to the /api2/json/ root, e.g. "cluster/resources".
     */
    struct ApiRequest
    {
        enum Method
        {
            Get,
            Post
        };

        static const int DEFAULT_TIMEOUT_MS = 30 * 1000;

        Method method = Get;
        QString path;
        QList<QPair<QString, QString>> query;
        QList<QPair<QString, QString>> form;
        QMap<QString, QString> headers;
        int timeoutMs = DEFAULT_TIMEOUT_MS;

        static ApiRequest MakeGet(const QString& path);
        static ApiRequest MakePost(const QString& path);

        QString MethodName() const;
    };

    /**
     * @brief Result of one REST exchange
     *
     * Transport never throws. NetworkError means the host could not be reached
     * or did not answer in time, HttpError means the server answered with a
     * non-2xx status or with a body that is not {"data": ...}.
     */
    struct ApiReply
    {
        enum Outcome
        {
            Ok,
            NetworkError,
            HttpError
        };

        Outcome outcome = NetworkError;
        int httpStatus = 0;
        QVariant data;
        QString error;

        bool IsOk() const { return this->outcome == Ok; }
        bool IsCredentialRejection() const;

        static ApiReply Success(const QVariant& data, int httpStatus = 200);
        static ApiReply Unreachable(const QString& error);
        static ApiReply HttpFailure(int httpStatus, const QString& error);
        static ApiReply FromBody(int httpStatus, const QByteArray& body);
    };

    class VDILIB_EXPORT ApiTransport
    {
        public:
            virtual ~ApiTransport();

            virtual ApiReply Send(const ApiRequest& request) = 0;

            virtual QString GetHostname() const = 0;
            virtual int GetPort() const = 0;
    };

    using TransportFactory = std::function<QSharedPointer<ApiTransport>(const QString& hostname, int port, bool verifyTls)>;
}

#endif // APITRANSPORT_H
