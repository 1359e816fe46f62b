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

#include "guestrecord.h"

namespace Vdi
{
    const char* const GuestRecord::STATE_RUNNING = "running";

    GuestRecord::GuestRecord()
        : m_vmid(0),
          m_kind(Qemu),
          m_template(false)
    {
    }

    bool GuestRecord::KindFromString(const QString& value, Kind& kind)
    {
        if (value == "qemu")
        {
            kind = Qemu;
            return true;
        }
        if (value == "lxc")
        {
            kind = Lxc;
            return true;
        }
        return false;
    }

    QString GuestRecord::KindToString(Kind kind)
    {
        return kind == Lxc ? QStringLiteral("lxc") : QStringLiteral("qemu");
    }

    GuestRecord GuestRecord::FromResource(const QVariantMap& resource, bool* ok)
    {
        GuestRecord record;
        if (ok)
            *ok = false;

        bool vmidOk = false;
        record.m_vmid = resource.value("vmid").toInt(&vmidOk);
        if (!vmidOk)
            return record;

        if (!resource.contains("name") || !resource.contains("node") || !resource.contains("status"))
            return record;

        if (!KindFromString(resource.value("type").toString(), record.m_kind))
            return record;

        record.m_name = resource.value("name").toString();
        record.m_node = resource.value("node").toString();
        record.m_status = resource.value("status").toString();
        record.m_lock = resource.value("lock").toString();
        // The API reports template as 0/1
        record.m_template = resource.value("template").toBool();

        if (ok)
            *ok = true;
        return record;
    }

    bool GuestRecord::IsRunning() const
    {
        return this->m_status == STATE_RUNNING;
    }

    bool GuestRecord::IsSuspendLocked() const
    {
        return this->IsRunning() && (this->m_lock == "suspending" || this->m_lock == "suspended");
    }

    QString GuestRecord::DisplayState() const
    {
        if (this->IsSuspendLocked())
            return this->m_lock;
        return this->m_status;
    }
}
