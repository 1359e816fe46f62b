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

#include "vdiconfig.h"
#include "../vdierror.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>

namespace Vdi
{
    const char* const VdiConfig::GUEST_TYPE_BOTH = "both";

    VdiConfig::VdiConfig()
        : m_title("VDI Login"),
          m_kiosk(false),
          m_fullscreen(true),
          m_guestType(GUEST_TYPE_BOTH)
    {
    }

    void VdiConfig::AddHostSet(const HostSet& hostSet)
    {
        if (!this->m_hostSets.contains(hostSet.Name()))
            this->m_hostSetNames.append(hostSet.Name());
        this->m_hostSets.insert(hostSet.Name(), hostSet);
    }

    QString VdiConfig::DefaultHostSet() const
    {
        return this->m_hostSetNames.isEmpty() ? QString() : this->m_hostSetNames.first();
    }

    void VdiConfig::AddProxyRedirect(const QString& proxy, const QString& replacement)
    {
        this->m_proxyRedirects.insert(proxy.toLower(), replacement);
    }

    void VdiConfig::AddExtraParameter(const QString& key, const QString& value)
    {
        for (QPair<QString, QString>& entry : this->m_extraParameters)
        {
            if (entry.first == key)
            {
                entry.second = value;
                return;
            }
        }
        this->m_extraParameters.append(qMakePair(key, value));
    }

    bool ConfigLoader::IniSection::Contains(const QString& key) const
    {
        for (const QPair<QString, QString>& entry : this->entries)
        {
            if (entry.first == key)
                return true;
        }
        return false;
    }

    QString ConfigLoader::IniSection::Value(const QString& key, const QString& defaultValue) const
    {
        for (const QPair<QString, QString>& entry : this->entries)
        {
            if (entry.first == key)
                return entry.second;
        }
        return defaultValue;
    }

    QStringList ConfigLoader::DefaultLocations()
    {
        QStringList locations;
#ifdef Q_OS_WIN
        locations << qEnvironmentVariable("APPDATA") + "\\VDIClient\\vdiclient.ini"
                  << qEnvironmentVariable("PROGRAMFILES") + "\\VDIClient\\vdiclient.ini"
                  << qEnvironmentVariable("PROGRAMFILES(x86)") + "\\VDIClient\\vdiclient.ini"
                  << "C:\\Program Files\\VDIClient\\vdiclient.ini";
#else
        locations << QDir::homePath() + "/.config/vdiclient/vdiclient.ini"
                  << "/etc/vdiclient/vdiclient.ini"
                  << "/usr/local/etc/vdiclient/vdiclient.ini"
                  << "./vdiclient.ini";
#endif
        return locations;
    }

    QString ConfigLoader::FindConfigFile(const QString& explicitPath)
    {
        if (!explicitPath.isEmpty())
        {
            if (!QFileInfo::exists(explicitPath))
                throw ConfigError(QString("Configuration file not found: %1").arg(explicitPath));
            return explicitPath;
        }

        for (const QString& location : DefaultLocations())
        {
            qDebug() << "ConfigLoader: Checking config" << location;
            if (QFileInfo::exists(location))
                return location;
        }

        throw ConfigError("Configuration file not found");
    }

    VdiConfig ConfigLoader::LoadFile(const QString& path)
    {
        QFile file(path);
        if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
            throw ConfigError(QString("Failed to open %1: %2").arg(path, file.errorString()));

        QTextStream stream(&file);
        const QString text = stream.readAll();
        file.close();

        qInfo() << "ConfigLoader: Loading" << path;
        return LoadFromString(text);
    }

    QList<ConfigLoader::IniSection> ConfigLoader::ParseIni(const QString& text)
    {
        QList<IniSection> sections;
        IniSection* current = nullptr;
        QPair<QString, QString>* lastEntry = nullptr;

        const QStringList lines = text.split('\n');
        for (int lineNo = 0; lineNo < lines.size(); ++lineNo)
        {
            QString line = lines[lineNo];
            if (line.endsWith('\r'))
                line.chop(1);

            const QString trimmed = line.trimmed();
            if (trimmed.isEmpty())
            {
                lastEntry = nullptr;
                continue;
            }
            if (trimmed.startsWith('#') || trimmed.startsWith(';'))
                continue;

            // Continuation of a multi-line value
            if (line.at(0).isSpace() && lastEntry)
            {
                lastEntry->second += "\n" + trimmed;
                continue;
            }

            if (trimmed.startsWith('[') && trimmed.endsWith(']'))
            {
                IniSection section;
                section.name = trimmed.mid(1, trimmed.length() - 2).trimmed();
                sections.append(section);
                current = &sections.last();
                lastEntry = nullptr;
                continue;
            }

            if (!current)
                throw ConfigError(QString("Line %1: key outside of any section").arg(lineNo + 1));

            const int eq = line.indexOf('=');
            if (eq <= 0)
                throw ConfigError(QString("Line %1: expected key = value in [%2]").arg(lineNo + 1).arg(current->name));

            const QString key = line.left(eq).trimmed().toLower();
            const QString value = line.mid(eq + 1).trimmed();

            bool replaced = false;
            for (QPair<QString, QString>& entry : current->entries)
            {
                if (entry.first == key)
                {
                    entry.second = value;
                    lastEntry = &entry;
                    replaced = true;
                    break;
                }
            }
            if (!replaced)
            {
                current->entries.append(qMakePair(key, value));
                lastEntry = &current->entries.last();
            }
        }

        return sections;
    }

    bool ConfigLoader::ParseBool(const QString& section, const QString& key, const QString& value)
    {
        const QString v = value.trimmed().toLower();
        if (v == "1" || v == "yes" || v == "true" || v == "on")
            return true;
        if (v == "0" || v == "no" || v == "false" || v == "off")
            return false;
        throw ConfigError(QString("[%1] %2: not a boolean: %3").arg(section, key, value));
    }

    int ConfigLoader::parseInt(const QString& section, const QString& key, const QString& value)
    {
        bool ok = false;
        int result = value.trimmed().toInt(&ok);
        if (!ok)
            throw ConfigError(QString("[%1] %2: not an integer: %3").arg(section, key, value));
        return result;
    }

    void ConfigLoader::applyAuthSettings(HostSet& hostSet, const IniSection& section)
    {
        if (section.Contains("auth_backend"))
            hostSet.SetBackend(section.Value("auth_backend"));
        if (section.Contains("user"))
            hostSet.SetUser(section.Value("user"));
        if (section.Contains("token_name"))
            hostSet.SetTokenName(section.Value("token_name"));
        if (section.Contains("token_value"))
            hostSet.SetTokenValue(section.Value("token_value"));
        if (section.Contains("auth_totp"))
            hostSet.SetTwoFactor(ParseBool(section.name, "auth_totp", section.Value("auth_totp")));
        if (section.Contains("tls_verify"))
            hostSet.SetVerifyTls(ParseBool(section.name, "tls_verify", section.Value("tls_verify")));
    }

    HostSet ConfigLoader::parseHostSet(const IniSection& section, const QString& name)
    {
        HostSet hostSet(name);

        if (!section.Contains("hostpool"))
            throw ConfigError(QString("Error parsing hostpool in section %1: missing hostpool").arg(section.name));

        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(section.Value("hostpool").toUtf8(), &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        {
            throw ConfigError(QString("Error parsing hostpool in section %1: %2")
                                  .arg(section.name,
                                       parseError.error != QJsonParseError::NoError
                                           ? parseError.errorString()
                                           : QString("expected a JSON object")));
        }

        const QJsonObject pool = doc.object();
        for (auto it = pool.constBegin(); it != pool.constEnd(); ++it)
        {
            bool ok = false;
            int port = it.value().toVariant().toInt(&ok);
            if (!ok || port <= 0 || port > 65535)
            {
                throw ConfigError(QString("Error parsing hostpool in section %1: invalid port for %2")
                                      .arg(section.name, it.key()));
            }
            hostSet.AddHost(it.key(), port);
        }

        if (hostSet.HostPool().isEmpty())
            throw ConfigError(QString("Error parsing hostpool in section %1: no hosts").arg(section.name));

        applyAuthSettings(hostSet, section);

        if (section.Contains("pwresetcmd"))
            hostSet.SetPasswordResetCommand(section.Value("pwresetcmd"));
        if (section.Contains("auto_vmid"))
            hostSet.SetAutoConnectGuest(parseInt(section.name, "auto_vmid", section.Value("auto_vmid")));

        if (section.Contains("knock_seq"))
        {
            QJsonDocument knock = QJsonDocument::fromJson(section.Value("knock_seq").toUtf8());
            if (knock.isArray())
            {
                QList<KnockStep> sequence;
                for (const QJsonValue& value : knock.array())
                {
                    KnockStep step;
                    if (KnockStep::FromVariant(value.toVariant(), step))
                        sequence.append(step);
                    else
                        qWarning() << "ConfigLoader: Ignoring knock_seq entry in" << section.name;
                }
                hostSet.SetKnockSequence(sequence);
            } else
            {
                qWarning() << "ConfigLoader: Ignoring invalid knock_seq in" << section.name;
            }
        }

        return hostSet;
    }

    HostSet ConfigLoader::parseLegacyHostSet(const IniSection& auth, const IniSection* hosts)
    {
        if (!hosts)
            throw ConfigError("No `Hosts` section found in legacy configuration!");

        HostSet hostSet("DEFAULT");
        for (const QPair<QString, QString>& entry : hosts->entries)
        {
            int port = parseInt(hosts->name, entry.first, entry.second);
            if (port <= 0 || port > 65535)
                throw ConfigError(QString("[Hosts] %1: invalid port %2").arg(entry.first).arg(port));
            hostSet.AddHost(entry.first, port);
        }

        if (hostSet.HostPool().isEmpty())
            throw ConfigError("No hosts listed in legacy `Hosts` section!");

        applyAuthSettings(hostSet, auth);
        return hostSet;
    }

    VdiConfig ConfigLoader::LoadFromString(const QString& text)
    {
        const QList<IniSection> sections = ParseIni(text);

        const IniSection* general = nullptr;
        const IniSection* authentication = nullptr;
        const IniSection* legacyHosts = nullptr;
        const IniSection* redirects = nullptr;
        const IniSection* extraParams = nullptr;

        for (const IniSection& section : sections)
        {
            if (section.name == "General")
                general = &section;
            else if (section.name == "Authentication")
                authentication = &section;
            else if (section.name == "Hosts")
                legacyHosts = &section;
            else if (section.name == "SpiceProxyRedirect")
                redirects = &section;
            else if (section.name == "AdditionalParameters")
                extraParams = &section;
        }

        if (!general)
            throw ConfigError("No `General` section found in configuration!");

        VdiConfig config;
        if (general->Contains("title"))
            config.SetTitle(general->Value("title"));
        if (general->Contains("kiosk"))
            config.SetKiosk(ParseBool(general->name, "kiosk", general->Value("kiosk")));
        if (general->Contains("fullscreen"))
            config.SetFullscreen(ParseBool(general->name, "fullscreen", general->Value("fullscreen")));
        if (general->Contains("guest_type"))
        {
            const QString guestType = general->Value("guest_type").toLower();
            if (guestType != "both" && guestType != "qemu" && guestType != "lxc")
                throw ConfigError(QString("[General] guest_type: expected both, qemu or lxc, got %1").arg(guestType));
            config.SetGuestType(guestType);
        }
        if (general->Contains("viewer"))
            config.SetViewerPath(general->Value("viewer"));

        if (authentication)
        {
            config.AddHostSet(parseLegacyHostSet(*authentication, legacyHosts));
        } else
        {
            for (const IniSection& section : sections)
            {
                if (!section.name.startsWith("Hosts."))
                    continue;
                const QString group = section.name.mid(QString("Hosts.").length());
                if (group.isEmpty())
                    throw ConfigError("Host-set section without a name: [Hosts.]");
                config.AddHostSet(parseHostSet(section, group));
            }
        }

        if (redirects)
        {
            for (const QPair<QString, QString>& entry : redirects->entries)
                config.AddProxyRedirect(entry.first, entry.second);
        }

        if (extraParams)
        {
            for (const QPair<QString, QString>& entry : extraParams->entries)
                config.AddExtraParameter(entry.first, entry.second);
        }

        if (config.HostSetNames().isEmpty())
            throw ConfigError("No host configurations found!");

        return config;
    }
}
