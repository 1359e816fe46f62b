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

#include "httpstransport.h"
#include <QDebug>
#include <QSslConfiguration>
#include <QSslSocket>
#include <QUrl>

namespace Vdi
{
    HttpsTransport::HttpsTransport(const QString& hostname, int port, bool verifyTls)
        : m_hostname(hostname)
        , m_port(port > 0 ? port : DEFAULT_PORT)
        , m_verifyTls(verifyTls)
    {
    }

    HttpsTransport::~HttpsTransport()
    {
    }

    QSharedPointer<ApiTransport> HttpsTransport::Create(const QString& hostname, int port, bool verifyTls)
    {
        return QSharedPointer<ApiTransport>(new HttpsTransport(hostname, port, verifyTls));
    }

    int HttpsTransport::remaining(const QElapsedTimer& timer, int timeoutMs)
    {
        qint64 left = timeoutMs - timer.elapsed();
        return left > 0 ? static_cast<int>(left) : 0;
    }

    QByteArray HttpsTransport::EncodePairs(const QList<QPair<QString, QString>>& pairs)
    {
        QByteArray encoded;
        for (const QPair<QString, QString>& pair : pairs)
        {
            if (!encoded.isEmpty())
                encoded += '&';
            encoded += QUrl::toPercentEncoding(pair.first);
            encoded += '=';
            encoded += QUrl::toPercentEncoding(pair.second);
        }
        return encoded;
    }

    QByteArray HttpsTransport::BuildHttpRequest(const ApiRequest& request) const
    {
        QByteArray target = "/api2/json/" + request.path.toUtf8();
        if (!request.query.isEmpty())
            target += "?" + EncodePairs(request.query);

        QByteArray body;
        if (request.method == ApiRequest::Post)
            body = EncodePairs(request.form);

        QByteArray httpRequest;
        httpRequest += request.MethodName().toLatin1() + " " + target + " HTTP/1.1\r\n";
        httpRequest += "Host: " + this->m_hostname.toUtf8() + ":" + QByteArray::number(this->m_port) + "\r\n";
        httpRequest += "User-Agent: vdiclient/1.0\r\n";
        httpRequest += "Accept: application/json\r\n";
        for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
            httpRequest += it.key().toLatin1() + ": " + it.value().toUtf8() + "\r\n";
        if (request.method == ApiRequest::Post)
        {
            httpRequest += "Content-Type: application/x-www-form-urlencoded\r\n";
            httpRequest += "Content-Length: " + QByteArray::number(body.size()) + "\r\n";
        }
        httpRequest += "Connection: close\r\n";
        httpRequest += "\r\n";
        httpRequest += body;
        return httpRequest;
    }

    QByteArray HttpsTransport::DecodeChunkedBody(const QByteArray& chunked, bool* ok)
    {
        QByteArray decoded;
        int pos = 0;
        if (ok)
            *ok = false;

        while (pos < chunked.size())
        {
            int lineEnd = chunked.indexOf("\r\n", pos);
            if (lineEnd < 0)
                return decoded;

            // Chunk extensions after ';' are ignored
            QByteArray sizeField = chunked.mid(pos, lineEnd - pos);
            int semicolon = sizeField.indexOf(';');
            if (semicolon >= 0)
                sizeField.truncate(semicolon);

            bool sizeOk = false;
            int chunkSize = sizeField.trimmed().toInt(&sizeOk, 16);
            if (!sizeOk || chunkSize < 0)
                return decoded;

            pos = lineEnd + 2;
            if (chunkSize == 0)
            {
                if (ok)
                    *ok = true;
                return decoded;
            }

            // Chunk data plus its trailing CRLF must be present
            if (chunkSize > chunked.size() - pos - 2)
                return decoded;

            decoded += chunked.mid(pos, chunkSize);
            pos += chunkSize + 2;
        }

        return decoded;
    }

    bool HttpsTransport::connectToHost(QSslSocket* socket, const QElapsedTimer& timer, int timeoutMs)
    {
        QSslConfiguration sslConfig = socket->sslConfiguration();
        sslConfig.setPeerVerifyMode(this->m_verifyTls ? QSslSocket::VerifyPeer : QSslSocket::VerifyNone);
        socket->setSslConfiguration(sslConfig);

        socket->connectToHostEncrypted(this->m_hostname, static_cast<quint16>(this->m_port));

        if (!socket->waitForConnected(remaining(timer, timeoutMs)))
        {
            this->m_lastError = QString("Failed to connect to %1:%2: %3")
                                    .arg(this->m_hostname).arg(this->m_port).arg(socket->errorString());
            return false;
        }

        if (!socket->waitForEncrypted(remaining(timer, timeoutMs)))
        {
            this->m_lastError = QString("Failed to establish SSL connection: %1").arg(socket->errorString());
            return false;
        }

        return true;
    }

    bool HttpsTransport::readHttpResponse(QSslSocket* socket, const QElapsedTimer& timer, int timeoutMs,
                                          int& statusCode, QByteArray& body)
    {
        // Read status line
        while (!socket->canReadLine())
        {
            if (!socket->waitForReadyRead(remaining(timer, timeoutMs)))
            {
                this->m_lastError = "Timeout waiting for HTTP response";
                return false;
            }
        }

        QString statusStr = QString::fromLatin1(socket->readLine()).trimmed();
        QStringList parts = statusStr.split(' ');
        if (parts.size() < 2 || !parts[0].startsWith("HTTP/"))
        {
            this->m_lastError = QString("Invalid HTTP response: %1").arg(statusStr);
            return false;
        }
        statusCode = parts[1].toInt();

        // Read headers, stored with lowercase keys for case-insensitive lookup
        QMap<QString, QString> headers;
        while (true)
        {
            if (!socket->canReadLine() && !socket->waitForReadyRead(remaining(timer, timeoutMs)))
            {
                this->m_lastError = "Timeout reading HTTP headers";
                return false;
            }
            if (!socket->canReadLine())
                continue;

            QByteArray line = socket->readLine();
            if (line == "\r\n" || line == "\n")
                break;

            int colonPos = line.indexOf(':');
            if (colonPos > 0)
            {
                QString headerName = QString::fromLatin1(line.left(colonPos)).trimmed();
                QString headerValue = QString::fromLatin1(line.mid(colonPos + 1)).trimmed();
                headers[headerName.toLower()] = headerValue;
            }
        }

        bool hasLength = false;
        int contentLength = headers.value("content-length").toInt(&hasLength);
        bool chunked = headers.value("transfer-encoding").contains("chunked", Qt::CaseInsensitive);

        QByteArray raw;
        if (hasLength && !chunked)
        {
            while (raw.size() < contentLength)
            {
                if (socket->bytesAvailable() > 0 || socket->waitForReadyRead(remaining(timer, timeoutMs)))
                {
                    raw += socket->read(contentLength - raw.size());
                } else
                {
                    this->m_lastError = "Timeout reading response body";
                    return false;
                }
            }
        } else
        {
            // Connection: close, read until the peer hangs up
            raw += socket->readAll();
            while (socket->state() == QAbstractSocket::ConnectedState
                   && socket->waitForReadyRead(remaining(timer, timeoutMs)))
            {
                raw += socket->readAll();
            }
            raw += socket->readAll();
        }

        if (chunked)
        {
            bool ok = false;
            body = DecodeChunkedBody(raw, &ok);
            if (!ok)
            {
                this->m_lastError = "Truncated chunked response body";
                return false;
            }
        } else
        {
            body = raw;
        }

        return true;
    }

    ApiReply HttpsTransport::Send(const ApiRequest& request)
    {
        this->m_lastError.clear();

        QElapsedTimer timer;
        timer.start();

        qDebug() << "HttpsTransport:" << request.MethodName() << this->m_hostname + ":" + QString::number(this->m_port)
                 << request.path;

        QSslSocket socket;
        if (!this->connectToHost(&socket, timer, request.timeoutMs))
        {
            qWarning() << "HttpsTransport:" << this->m_lastError;
            return ApiReply::Unreachable(this->m_lastError);
        }

        QByteArray httpRequest = this->BuildHttpRequest(request);
        qint64 written = socket.write(httpRequest);
        if (written != httpRequest.size())
        {
            this->m_lastError = "Failed to write complete request";
            qWarning() << "HttpsTransport:" << this->m_lastError;
            return ApiReply::Unreachable(this->m_lastError);
        }

        while (socket.bytesToWrite() > 0)
        {
            if (!socket.waitForBytesWritten(remaining(timer, request.timeoutMs)))
            {
                this->m_lastError = QString("Timeout waiting for bytes written: %1").arg(socket.errorString());
                qWarning() << "HttpsTransport:" << this->m_lastError;
                return ApiReply::Unreachable(this->m_lastError);
            }
        }

        int statusCode = 0;
        QByteArray body;
        if (!this->readHttpResponse(&socket, timer, request.timeoutMs, statusCode, body))
        {
            qWarning() << "HttpsTransport:" << this->m_lastError;
            socket.abort();
            return ApiReply::Unreachable(this->m_lastError);
        }

        socket.disconnectFromHost();
        if (socket.state() != QAbstractSocket::UnconnectedState)
            socket.waitForDisconnected(1000);

        qDebug() << "HttpsTransport: HTTP" << statusCode << "," << body.size() << "bytes";

        ApiReply reply = ApiReply::FromBody(statusCode, body);
        if (!reply.IsOk())
            qWarning() << "HttpsTransport:" << request.path << reply.error;
        return reply;
    }
}
