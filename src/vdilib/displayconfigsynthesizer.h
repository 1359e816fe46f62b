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

#ifndef DISPLAYCONFIGSYNTHESIZER_H
#define DISPLAYCONFIGSYNTHESIZER_H

#include "vdilib_global.h"
#include "config/vdiconfig.h"
#include <QByteArray>
#include <QString>
#include <QVariantMap>

namespace Vdi
{
    class Session;
    class GuestRecord;

    /**
     * @brief Turns a display ticket into a virt-viewer configuration file
     *
     * Ticket fields are copied verbatim into the [virt-viewer] section except
     * "proxy", whose host[:port] is looked up (scheme stripped, lower-cased) in
     * the redirect table and replaced by http://<replacement> on a hit.
     * Operator parameters are applied last and always win.
     *
     * Pure transformation, identical inputs give byte-identical output.
     */
    class VDILIB_EXPORT DisplayConfigSynthesizer
    {
        public:
            static const char* const SECTION_NAME;
            static const char* const PROXY_KEY;

            DisplayConfigSynthesizer(const ProxyRedirectTable& redirects, const ParameterList& extraParameters);

            /**
             * @brief Build the viewer configuration, throws SynthesisError on a malformed ticket
             */
            QByteArray BuildConfig(const QVariantMap& ticket) const;

            /**
             * @brief Request the display ticket for a guest, throws SynthesisError(TicketUnavailable)
             */
            static QVariantMap FetchTicket(Session* session, const GuestRecord& guest);

            /**
             * @brief Redirect table lookup key for a proxy value: scheme stripped, lower-cased
             */
            static QString ProxyLookupKey(const QString& proxy);

            QString RewriteProxy(const QString& proxy) const;

        private:
            static QString valueToString(const QVariant& value);
            static void validateEntry(const QString& key, const QString& value);

            ProxyRedirectTable m_redirects;
            ParameterList m_extraParameters;
    };
}

#endif // DISPLAYCONFIGSYNTHESIZER_H
