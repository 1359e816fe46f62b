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

#ifndef LIFECYCLECOORDINATOR_H
#define LIFECYCLECOORDINATOR_H

#include "vdilib_global.h"
#include "pve/guestrecord.h"
#include <QString>
#include <functional>

namespace Vdi
{
    class Session;
    class Sleeper;

    /**
     * @brief Makes sure a guest is running before a display session is opened
     *
     * A stopped guest is started and its start task is polled at a fixed
     * interval for a bounded number of samples:
     *
     *   NotRunning -> StartRequested -> Polling -> Running | Failed | TimedOut | StatusUnavailable
     *
     * A failing status query only costs a sample. A task that stops with an
     * exit status other than "OK" fails at once. Running out of samples is a
     * timeout, reported separately from a failed start. StatusUnavailable is
     * only reached with ReportUnavailable, when the last sample cannot be read.
     */
    class VDILIB_EXPORT LifecycleCoordinator
    {
        public:
            enum State
            {
                NotRunning,
                StartRequested,
                Polling,
                Running,
                Failed,
                TimedOut,
                StatusUnavailable
            };

            // What a transient status failure on the very last sample turns into
            enum FinalSampleFailure
            {
                CountAsTimeout,
                ReportUnavailable
            };

            struct Policy
            {
                int maxSamples = 30;
                int pollIntervalMs = 1000;
                int startTimeoutMs = 28 * 1000;
                FinalSampleFailure finalSampleFailure = CountAsTimeout;
            };

            static const char* const EXIT_STATUS_OK;

            using CancelCallback = std::function<bool()>;
            using StateCallback = std::function<void(State state)>;

            explicit LifecycleCoordinator(Session* session, Sleeper* sleeper = nullptr);

            void SetPolicy(const Policy& policy) { this->m_policy = policy; }
            Policy GetPolicy() const { return this->m_policy; }

            void SetCancelCallback(CancelCallback cancel) { this->m_cancel = cancel; }
            void SetStateCallback(StateCallback callback) { this->m_stateCallback = callback; }

            /**
             * @brief Start the guest unless it already runs and wait for the start task
             *
             * No request is made for a guest whose state is already "running".
             * Throws LifecycleError on start rejection, failure, timeout or cancellation.
             */
            void EnsureRunning(const GuestRecord& guest);

            State GetState() const { return this->m_state; }
            int SamplesTaken() const { return this->m_samples; }
            QString JobId() const { return this->m_jobId; }

            static QString StateToString(State state);

        private:
            void setState(State state);
            bool cancelRequested() const;
            QString requestStart(const GuestRecord& guest);
            void pollUntilComplete(const GuestRecord& guest);

            Session* m_session;
            Sleeper* m_sleeper;
            Policy m_policy;
            CancelCallback m_cancel;
            StateCallback m_stateCallback;
            State m_state;
            int m_samples;
            QString m_jobId;
    };
}

#endif // LIFECYCLECOORDINATOR_H
