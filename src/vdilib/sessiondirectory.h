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

#ifndef SESSIONDIRECTORY_H
#define SESSIONDIRECTORY_H

#include "vdilib_global.h"
#include "pve/guestrecord.h"
#include <QList>
#include <QSet>
#include <QString>
#include <QVariantList>

namespace Vdi
{
    class Session;

    /**
     * @brief Lists the guests a user can connect to
     *
     * A guest is kept only when its node is online, it is not a template and
     * its kind matches the configured filter ("both" matches everything).
     * The result is sorted by name, case-sensitively.
     */
    class VDILIB_EXPORT SessionDirectory
    {
        public:
            explicit SessionDirectory(Session* session);

            /**
             * @brief Query the cluster, throws DirectoryError when either query fails
             */
            QList<GuestRecord> ListGuests(const QString& guestTypeFilter) const;

            /**
             * @brief Find a guest by id among the listed guests
             * @return true and sets guest when found
             */
            bool FindGuest(int vmid, const QString& guestTypeFilter, GuestRecord& guest) const;

            static QSet<QString> OnlineNodes(const QVariantList& nodes);
            static QList<GuestRecord> FilterGuests(const QVariantList& resources, const QSet<QString>& onlineNodes,
                                                   const QString& guestTypeFilter);
            static void SortByName(QList<GuestRecord>& guests);

        private:
            QVariantList fetch(const QString& type) const;

            Session* m_session;
    };
}

#endif // SESSIONDIRECTORY_H
