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

#include "displayconfigsynthesizer.h"
#include "vdierror.h"
#include "pve/guestrecord.h"
#include "pve/session.h"
#include "pve/pveapi/pveapi_Guest.h"
#include <QDebug>
#include <cmath>

namespace Vdi
{
    // 2^53, doubles above it no longer hold every integer
    static const double MAX_EXACT_INTEGER = 9007199254740992.0;

    const char* const DisplayConfigSynthesizer::SECTION_NAME = "virt-viewer";
    const char* const DisplayConfigSynthesizer::PROXY_KEY = "proxy";

    DisplayConfigSynthesizer::DisplayConfigSynthesizer(const ProxyRedirectTable& redirects,
                                                       const ParameterList& extraParameters)
        : m_redirects(redirects)
        , m_extraParameters(extraParameters)
    {
    }

    QVariantMap DisplayConfigSynthesizer::FetchTicket(Session* session, const GuestRecord& guest)
    {
        if (!session)
            throw SynthesisError(SynthesisError::TicketUnavailable, "Failed to get display ticket: not connected");

        ApiReply reply = PveAPI::Guest::SpiceProxy(session, guest.Node(), guest.KindPath(), guest.Vmid());
        if (!reply.IsOk())
        {
            throw SynthesisError(SynthesisError::TicketUnavailable,
                                 QString("Failed to get display ticket for %1: %2").arg(guest.Name(), reply.error));
        }

        if (reply.data.userType() != QMetaType::QVariantMap)
        {
            throw SynthesisError(SynthesisError::MalformedTicket,
                                 QString("Display ticket for %1 is not a key/value set").arg(guest.Name()));
        }

        return reply.data.toMap();
    }

    QString DisplayConfigSynthesizer::ProxyLookupKey(const QString& proxy)
    {
        QString key = proxy;
        int schemeEnd = key.indexOf("://");
        if (schemeEnd >= 0)
            key = key.mid(schemeEnd + 3);
        return key.toLower();
    }

    QString DisplayConfigSynthesizer::RewriteProxy(const QString& proxy) const
    {
        const QString key = ProxyLookupKey(proxy);
        auto it = this->m_redirects.constFind(key);
        if (it == this->m_redirects.constEnd())
            return proxy;

        qDebug() << "DisplayConfigSynthesizer: Redirecting proxy" << key << "to" << it.value();
        return "http://" + it.value();
    }

    QString DisplayConfigSynthesizer::valueToString(const QVariant& value)
    {
        if (value.isNull())
            return QString();
        if (value.userType() == QMetaType::Bool)
            return value.toBool() ? "1" : "0";
        if (value.userType() == QMetaType::Double)
        {
            // JSON numbers arrive as double, ports must not become "5900.0"
            double number = value.toDouble();
            if (std::fabs(number) < MAX_EXACT_INTEGER && std::floor(number) == number)
                return QString::number(static_cast<qint64>(number));
        }
        return value.toString();
    }

    void DisplayConfigSynthesizer::validateEntry(const QString& key, const QString& value)
    {
        if (key.isEmpty() || key.contains('=') || key.contains('[') || key.contains(']')
            || key.contains('\n') || key.contains('\r'))
        {
            throw SynthesisError(SynthesisError::MalformedTicket,
                                 QString("Display ticket has an invalid key: %1").arg(key));
        }
        if (value.contains('\n') || value.contains('\r'))
        {
            throw SynthesisError(SynthesisError::MalformedTicket,
                                 QString("Display ticket value for %1 spans several lines").arg(key));
        }
    }

    QByteArray DisplayConfigSynthesizer::BuildConfig(const QVariantMap& ticket) const
    {
        if (ticket.isEmpty())
            throw SynthesisError(SynthesisError::MalformedTicket, "Display ticket is empty");

        ParameterList entries;
        for (auto it = ticket.constBegin(); it != ticket.constEnd(); ++it)
        {
            QString value = valueToString(it.value());
            if (it.key() == PROXY_KEY)
                value = this->RewriteProxy(value);

            validateEntry(it.key(), value);
            entries.append(qMakePair(it.key(), value));
        }

        for (const QPair<QString, QString>& extra : this->m_extraParameters)
        {
            validateEntry(extra.first, extra.second);

            bool replaced = false;
            for (QPair<QString, QString>& entry : entries)
            {
                if (entry.first == extra.first)
                {
                    entry.second = extra.second;
                    replaced = true;
                    break;
                }
            }
            if (!replaced)
                entries.append(extra);
        }

        QByteArray config;
        config += "[" + QByteArray(SECTION_NAME) + "]\n";
        for (const QPair<QString, QString>& entry : entries)
            config += entry.first.toUtf8() + "=" + entry.second.toUtf8() + "\n";
        return config;
    }
}
