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

#include "apitransport.h"
#include <QJsonDocument>
#include <QJsonObject>

namespace Vdi
{
    ApiRequest ApiRequest::MakeGet(const QString& path)
    {
        ApiRequest request;
        request.method = Get;
        request.path = path;
        return request;
    }

    ApiRequest ApiRequest::MakePost(const QString& path)
    {
        ApiRequest request;
        request.method = Post;
        request.path = path;
        return request;
    }

    QString ApiRequest::MethodName() const
    {
        return this->method == Post ? QStringLiteral("POST") : QStringLiteral("GET");
    }

    bool ApiReply::IsCredentialRejection() const
    {
        // 401 on every call, 403 on the login check when the token lacks rights
        return this->outcome == HttpError && (this->httpStatus == 401 || this->httpStatus == 403);
    }

    ApiReply ApiReply::Success(const QVariant& data, int httpStatus)
    {
        ApiReply reply;
        reply.outcome = Ok;
        reply.httpStatus = httpStatus;
        reply.data = data;
        return reply;
    }

    ApiReply ApiReply::Unreachable(const QString& error)
    {
        ApiReply reply;
        reply.outcome = NetworkError;
        reply.error = error;
        return reply;
    }

    ApiReply ApiReply::HttpFailure(int httpStatus, const QString& error)
    {
        ApiReply reply;
        reply.outcome = HttpError;
        reply.httpStatus = httpStatus;
        reply.error = error;
        return reply;
    }

    ApiReply ApiReply::FromBody(int httpStatus, const QByteArray& body)
    {
        if (httpStatus < 200 || httpStatus >= 300)
            return HttpFailure(httpStatus, QString("HTTP error %1").arg(httpStatus));

        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
        if (parseError.error != QJsonParseError::NoError)
        {
            return HttpFailure(0, QString("JSON parse error: %1 at offset %2")
                                      .arg(parseError.errorString())
                                      .arg(parseError.offset));
        }

        if (!doc.isObject() || !doc.object().contains("data"))
            return HttpFailure(0, "Malformed reply: missing 'data' member");

        return Success(doc.object().value("data").toVariant(), httpStatus);
    }

    ApiTransport::~ApiTransport()
    {
    }
}
