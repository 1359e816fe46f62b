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

#ifndef GUESTRECORD_H
#define GUESTRECORD_H

#include "../vdilib_global.h"
#include <QString>
#include <QVariantMap>

namespace Vdi
{
    /**
     * @brief One virtual machine or container as listed by the cluster
     *
     * Built fresh from every directory query, never cached.
     */
    class VDILIB_EXPORT GuestRecord
    {
        public:
            enum Kind
            {
                Qemu,
                Lxc
            };

            static const char* const STATE_RUNNING;

            GuestRecord();

            /**
             * @brief Project a cluster/resources entry of type vm
             * @param resource Map with vmid, name, node, status, type and optional lock/template
             * @param ok Set to false when a required field is missing or invalid
             */
            static GuestRecord FromResource(const QVariantMap& resource, bool* ok = nullptr);

            static bool KindFromString(const QString& value, Kind& kind);
            static QString KindToString(Kind kind);

            int Vmid() const { return this->m_vmid; }
            void SetVmid(int vmid) { this->m_vmid = vmid; }

            QString Name() const { return this->m_name; }
            void SetName(const QString& name) { this->m_name = name; }

            QString Node() const { return this->m_node; }
            void SetNode(const QString& node) { this->m_node = node; }

            Kind GetKind() const { return this->m_kind; }
            void SetKind(Kind kind) { this->m_kind = kind; }

            /**
             * @brief API sub-path of the guest kind, "qemu" or "lxc"
             */
            QString KindPath() const { return KindToString(this->m_kind); }

            QString Status() const { return this->m_status; }
            void SetStatus(const QString& status) { this->m_status = status; }

            QString Lock() const { return this->m_lock; }
            void SetLock(const QString& lock) { this->m_lock = lock; }

            bool IsTemplate() const { return this->m_template; }
            void SetTemplate(bool isTemplate) { this->m_template = isTemplate; }

            bool IsRunning() const;

            /**
             * @brief True for a running guest whose lock is suspending or suspended
             */
            bool IsSuspendLocked() const;

            /**
             * @brief State shown to the user: the lock for suspend-locked guests, else the run state
             */
            QString DisplayState() const;

        private:
            int m_vmid;
            QString m_name;
            QString m_node;
            Kind m_kind;
            QString m_status;
            QString m_lock;
            bool m_template;
    };
}

#endif // GUESTRECORD_H
