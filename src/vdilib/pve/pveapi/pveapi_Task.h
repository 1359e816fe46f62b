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

#ifndef PVEAPI_TASK_H
#define PVEAPI_TASK_H

#include "../../vdilib_global.h"
#include "../network/apitransport.h"
#include <QString>

namespace Vdi
{
    class Session;

    namespace PveAPI
    {
        /// <summary>
        /// Static methods for node task queries (API path: nodes/{node}/tasks)
        /// </summary>
        class VDILIB_EXPORT Task
        {
            private:
                Task() = delete; // Static-only class

            public:
                /// <summary>
                /// Read the status of a task
                /// </summary>
                /// <param name="session">The session</param>
                /// <param name="node">Node the task runs on</param>
                /// <param name="upid">Task id returned by the call that started it</param>
                /// <returns>Reply whose data is a map with "status" and, once stopped, "exitstatus"</returns>
                static ApiReply GetStatus(Session* session, const QString& node, const QString& upid);
        };
    }
}

#endif // PVEAPI_TASK_H
