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

#include "orchestrator.h"
#include "displayconfigsynthesizer.h"
#include "displayviewer.h"
#include "sessiondirectory.h"
#include "vdierror.h"
#include "pve/session.h"
#include <QDebug>

namespace Vdi
{
    Orchestrator::Orchestrator(const VdiConfig& config, const QString& hostSetName, TransportFactory transportFactory,
                               DisplayViewer* viewer, Sleeper* sleeper)
        : m_config(config)
        , m_resolver(transportFactory)
        , m_viewer(viewer)
        , m_sleeper(sleeper)
        , m_lastState(LifecycleCoordinator::NotRunning)
    {
        const QString name = hostSetName.isEmpty() ? config.DefaultHostSet() : hostSetName;
        if (!config.HasHostSet(name))
            throw ConfigError(QString("Host set %1 is not configured").arg(name));

        this->m_hostSet = config.GetHostSet(name);
    }

    Session* Orchestrator::requireSession() const
    {
        if (!this->m_session)
            throw std::runtime_error("Not connected to a cluster");
        return this->m_session.data();
    }

    void Orchestrator::Authenticate()
    {
        this->m_session.reset();
        this->m_session = this->m_resolver.Authenticate(this->m_hostSet);
        qInfo() << "Orchestrator: Logged in to" << this->m_session->GetHostname() << "as" << this->m_hostSet.Principal();
    }

    QList<GuestRecord> Orchestrator::ListGuests() const
    {
        SessionDirectory directory(this->requireSession());
        return directory.ListGuests(this->m_config.GuestType());
    }

    bool Orchestrator::FindGuest(int vmid, GuestRecord& guest) const
    {
        SessionDirectory directory(this->requireSession());
        return directory.FindGuest(vmid, this->m_config.GuestType(), guest);
    }

    bool Orchestrator::FindAutoConnectGuest(GuestRecord& guest) const
    {
        if (!this->m_hostSet.HasAutoConnectGuest())
            return false;

        const int vmid = this->m_hostSet.AutoConnectGuest();
        if (!this->FindGuest(vmid, guest))
        {
            qWarning() << "Orchestrator: Auto-connect guest" << vmid << "not found";
            return false;
        }
        return true;
    }

    QByteArray Orchestrator::PrepareConnection(const GuestRecord& guest)
    {
        Session* session = this->requireSession();

        LifecycleCoordinator lifecycle(session, this->m_sleeper);
        lifecycle.SetPolicy(this->m_policy);
        lifecycle.SetCancelCallback(this->m_cancel);
        lifecycle.SetStateCallback([this](LifecycleCoordinator::State state) {
            this->m_lastState = state;
            if (this->m_stateCallback)
                this->m_stateCallback(state);
        });
        lifecycle.EnsureRunning(guest);

        const QVariantMap ticket = DisplayConfigSynthesizer::FetchTicket(session, guest);
        DisplayConfigSynthesizer synthesizer(this->m_config.ProxyRedirects(), this->m_config.ExtraParameters());
        return synthesizer.BuildConfig(ticket);
    }

    void Orchestrator::Connect(const GuestRecord& guest)
    {
        if (!this->m_viewer)
            throw ViewerError(ViewerError::NotFound, "No display viewer configured");

        const QByteArray config = this->PrepareConnection(guest);
        qInfo() << "Orchestrator: Opening display of" << guest.Name() << "(" << guest.Vmid() << ")";
        this->m_viewer->Run(config);
    }
}
