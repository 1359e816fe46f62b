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

#ifndef PVEAPI_ACCESS_H
#define PVEAPI_ACCESS_H

#include "../../vdilib_global.h"
#include "../network/apitransport.h"
#include <QString>

namespace Vdi
{
    namespace PveAPI
    {
        /// <summary>
        /// Static methods for password authentication (API path: access)
        /// </summary>
        class VDILIB_EXPORT Access
        {
            private:
                Access() = delete; // Static-only class

            public:
                /// <summary>
                /// Create an authentication ticket
                /// </summary>
                /// <param name="transport">Unauthenticated transport to one host</param>
                /// <param name="username">user@realm</param>
                /// <param name="password">Password</param>
                /// <param name="otp">One-time code, empty when two-factor is off</param>
                /// <returns>Reply whose data holds "ticket" and "CSRFPreventionToken"</returns>
                static ApiReply CreateTicket(ApiTransport* transport, const QString& username,
                                             const QString& password, const QString& otp = QString());
        };
    }
}

#endif // PVEAPI_ACCESS_H
