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

#include "pveapi_Guest.h"
#include "../session.h"
#include <QUrl>
#include <stdexcept>

namespace Vdi
{
    namespace PveAPI
    {
        QString Guest::GuestPath(const QString& node, const QString& kind, int vmid)
        {
            return QString("nodes/%1/%2/%3")
                .arg(QString::fromUtf8(QUrl::toPercentEncoding(node)), kind)
                .arg(vmid);
        }

        ApiReply Guest::Start(Session* session, const QString& node, const QString& kind, int vmid, int timeoutMs)
        {
            if (!session)
                throw std::runtime_error("Not connected to cluster");

            return session->Post(GuestPath(node, kind, vmid) + "/status/start", {}, timeoutMs);
        }

        ApiReply Guest::SpiceProxy(Session* session, const QString& node, const QString& kind, int vmid)
        {
            if (!session)
                throw std::runtime_error("Not connected to cluster");

            return session->Post(GuestPath(node, kind, vmid) + "/spiceproxy");
        }
    }
}
