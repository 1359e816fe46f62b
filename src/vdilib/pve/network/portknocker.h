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

#ifndef PORTKNOCKER_H
#define PORTKNOCKER_H

#include "../../vdilib_global.h"
#include "../../config/hostset.h"
#include <QList>
#include <QString>
#include <functional>

namespace Vdi
{
    /**
     * @brief Sends a port-knock sequence to a host before the API is contacted
     *
     * TCP knocks are short connect attempts, UDP knocks a single empty datagram.
     * A knock that is refused or times out is expected behaviour for a
     * firewalled host, so failures are only logged.
     */
    class VDILIB_EXPORT PortKnocker
    {
        public:
            static const int TCP_KNOCK_TIMEOUT_MS = 500;

            using KnockFunction = std::function<bool(const QString& host, const KnockStep& step)>;

            PortKnocker();
            explicit PortKnocker(KnockFunction knock);

            /**
             * @brief Knock every step of the sequence, in order
             * @return Number of knocks that were delivered
             */
            int Knock(const QString& host, const QList<KnockStep>& sequence) const;

            static bool SendKnock(const QString& host, const KnockStep& step);

        private:
            KnockFunction m_knock;
    };
}

#endif // PORTKNOCKER_H
