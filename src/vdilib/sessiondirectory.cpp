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

#include "sessiondirectory.h"
#include "vdierror.h"
#include "config/vdiconfig.h"
#include "pve/session.h"
#include "pve/pveapi/pveapi_Cluster.h"
#include <QDebug>
#include <QVariantMap>
#include <algorithm>

namespace Vdi
{
    SessionDirectory::SessionDirectory(Session* session)
        : m_session(session)
    {
    }

    QVariantList SessionDirectory::fetch(const QString& type) const
    {
        if (!this->m_session)
            throw DirectoryError("Failed to get VMs: not connected");

        ApiReply reply = PveAPI::Cluster::GetResources(this->m_session, type);
        if (!reply.IsOk())
            throw DirectoryError(QString("Failed to get VMs: %1").arg(reply.error));

        if (reply.data.userType() != QMetaType::QVariantList)
            throw DirectoryError(QString("Failed to get VMs: unexpected %1 listing").arg(type));

        return reply.data.toList();
    }

    QSet<QString> SessionDirectory::OnlineNodes(const QVariantList& nodes)
    {
        QSet<QString> online;
        for (const QVariant& value : nodes)
        {
            const QVariantMap node = value.toMap();
            if (node.value("status").toString() == "online")
                online.insert(node.value("node").toString());
        }
        return online;
    }

    QList<GuestRecord> SessionDirectory::FilterGuests(const QVariantList& resources, const QSet<QString>& onlineNodes,
                                                      const QString& guestTypeFilter)
    {
        QList<GuestRecord> guests;
        for (const QVariant& value : resources)
        {
            const QVariantMap resource = value.toMap();
            const QString node = resource.value("node").toString();

            if (!onlineNodes.contains(node))
            {
                qDebug() << "SessionDirectory: Skipping" << resource.value("vmid").toInt()
                         << "- node" << node << "not online";
                continue;
            }
            if (resource.value("template").toBool())
                continue;
            if (guestTypeFilter != VdiConfig::GUEST_TYPE_BOTH && resource.value("type").toString() != guestTypeFilter)
                continue;

            // Only records that survive the filters must be complete
            bool ok = false;
            GuestRecord guest = GuestRecord::FromResource(resource, &ok);
            if (!ok)
                throw DirectoryError("Failed to get VMs: incomplete guest record in cluster listing");

            guests.append(guest);
        }

        SortByName(guests);
        return guests;
    }

    void SessionDirectory::SortByName(QList<GuestRecord>& guests)
    {
        std::stable_sort(guests.begin(), guests.end(), [](const GuestRecord& a, const GuestRecord& b) {
            return a.Name() < b.Name();
        });
    }

    QList<GuestRecord> SessionDirectory::ListGuests(const QString& guestTypeFilter) const
    {
        const QSet<QString> online = OnlineNodes(this->fetch(PveAPI::Cluster::RESOURCE_NODE));
        const QVariantList resources = this->fetch(PveAPI::Cluster::RESOURCE_VM);

        QList<GuestRecord> guests = FilterGuests(resources, online, guestTypeFilter);
        qDebug() << "SessionDirectory:" << guests.size() << "of" << resources.size() << "guests listed,"
                 << online.size() << "nodes online";
        return guests;
    }

    bool SessionDirectory::FindGuest(int vmid, const QString& guestTypeFilter, GuestRecord& guest) const
    {
        const QList<GuestRecord> guests = this->ListGuests(guestTypeFilter);
        for (const GuestRecord& candidate : guests)
        {
            if (candidate.Vmid() == vmid)
            {
                guest = candidate;
                return true;
            }
        }
        return false;
    }
}
