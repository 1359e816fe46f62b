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

#ifndef PVEAPI_CLUSTER_H
#define PVEAPI_CLUSTER_H

#include "../../vdilib_global.h"
#include "../network/apitransport.h"
#include <QString>

namespace Vdi
{
    class Session;

    namespace PveAPI
    {
        /// <summary>
        /// Static methods for cluster wide queries (API path: cluster)
        /// </summary>
        class VDILIB_EXPORT Cluster
        {
            private:
                Cluster() = delete; // Static-only class

            public:
                static const char* const RESOURCE_NODE;
                static const char* const RESOURCE_VM;

                /// <summary>
                /// List cluster resources of one type
                /// </summary>
                /// <param name="session">The session</param>
                /// <param name="type">Resource type filter ("node", "vm", "storage")</param>
                /// <returns>Reply whose data is a list of resource maps</returns>
                static ApiReply GetResources(Session* session, const QString& type);
        };
    }
}

#endif // PVEAPI_CLUSTER_H
