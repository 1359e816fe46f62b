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

#ifndef VDICONFIG_H
#define VDICONFIG_H

#include "../vdilib_global.h"
#include "hostset.h"
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>
#include <QStringList>

namespace Vdi
{
    // Lower-cased proxy host[:port] -> replacement host:port
    using ProxyRedirectTable = QMap<QString, QString>;

    // Ordered key/value pairs, order is preserved in the viewer configuration
    using ParameterList = QList<QPair<QString, QString>>;

    /**
     * @brief Process wide launcher configuration
     *
     * Loaded once at startup by ConfigLoader and read-only afterwards.
     */
    class VDILIB_EXPORT VdiConfig
    {
        public:
            static const char* const GUEST_TYPE_BOTH;

            VdiConfig();

            QString Title() const { return this->m_title; }
            void SetTitle(const QString& title) { this->m_title = title; }

            bool Kiosk() const { return this->m_kiosk; }
            void SetKiosk(bool kiosk) { this->m_kiosk = kiosk; }

            bool Fullscreen() const { return this->m_fullscreen; }
            void SetFullscreen(bool fullscreen) { this->m_fullscreen = fullscreen; }

            QString GuestType() const { return this->m_guestType; }
            void SetGuestType(const QString& guestType) { this->m_guestType = guestType; }

            QString ViewerPath() const { return this->m_viewerPath; }
            void SetViewerPath(const QString& path) { this->m_viewerPath = path; }

            QStringList HostSetNames() const { return this->m_hostSetNames; }
            bool HasHostSet(const QString& name) const { return this->m_hostSets.contains(name); }
            HostSet GetHostSet(const QString& name) const { return this->m_hostSets.value(name); }
            void AddHostSet(const HostSet& hostSet);

            /**
             * @brief Host-set used when none is selected: the first one configured
             */
            QString DefaultHostSet() const;

            const ProxyRedirectTable& ProxyRedirects() const { return this->m_proxyRedirects; }
            void AddProxyRedirect(const QString& proxy, const QString& replacement);

            const ParameterList& ExtraParameters() const { return this->m_extraParameters; }
            void AddExtraParameter(const QString& key, const QString& value);

        private:
            QString m_title;
            bool m_kiosk;
            bool m_fullscreen;
            QString m_guestType;
            QString m_viewerPath;
            QStringList m_hostSetNames;
            QMap<QString, HostSet> m_hostSets;
            ProxyRedirectTable m_proxyRedirects;
            ParameterList m_extraParameters;
    };

    /**
     * @brief Reads the INI style launcher configuration
     *
     * Supports the [Hosts.<name>] layout as well as the legacy single host-set
     * [Authentication] + [Hosts] layout. Every problem is reported as ConfigError.
     */
    class VDILIB_EXPORT ConfigLoader
    {
        public:
            struct IniSection
            {
                QString name;
                QList<QPair<QString, QString>> entries;

                bool Contains(const QString& key) const;
                QString Value(const QString& key, const QString& defaultValue = QString()) const;
            };

            static QStringList DefaultLocations();

            /**
             * @brief Resolve the file to load
             * @param explicitPath Path given on the command line, may be empty
             * @return Existing file path, throws ConfigError when none is found
             */
            static QString FindConfigFile(const QString& explicitPath = QString());

            static VdiConfig LoadFile(const QString& path);
            static VdiConfig LoadFromString(const QString& text);

            /**
             * @brief Split INI text into sections, keys are lower-cased
             *
             * Lines starting with '#' or ';' are comments, indented lines continue
             * the previous value.
             */
            static QList<IniSection> ParseIni(const QString& text);

            static bool ParseBool(const QString& section, const QString& key, const QString& value);

        private:
            ConfigLoader() = delete;

            static HostSet parseHostSet(const IniSection& section, const QString& name);
            static HostSet parseLegacyHostSet(const IniSection& auth, const IniSection* hosts);
            static void applyAuthSettings(HostSet& hostSet, const IniSection& section);
            static int parseInt(const QString& section, const QString& key, const QString& value);
    };
}

#endif // VDICONFIG_H
