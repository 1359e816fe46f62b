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

#include "lifecyclecoordinator.h"
#include "vdierror.h"
#include "pve/session.h"
#include "pve/pveapi/pveapi_Guest.h"
#include "pve/pveapi/pveapi_Task.h"
#include "utils/sleeper.h"
#include <QDebug>
#include <QThread>
#include <QVariantMap>

namespace Vdi
{
    const char* const LifecycleCoordinator::EXIT_STATUS_OK = "OK";

    LifecycleCoordinator::LifecycleCoordinator(Session* session, Sleeper* sleeper)
        : m_session(session)
        , m_sleeper(sleeper ? sleeper : ThreadSleeper::Instance())
        , m_state(NotRunning)
        , m_samples(0)
    {
    }

    QString LifecycleCoordinator::StateToString(State state)
    {
        switch (state)
        {
            case NotRunning:
                return "NotRunning";
            case StartRequested:
                return "StartRequested";
            case Polling:
                return "Polling";
            case Running:
                return "Running";
            case Failed:
                return "Failed";
            case TimedOut:
                return "TimedOut";
            case StatusUnavailable:
                return "StatusUnavailable";
        }
        return QString();
    }

    void LifecycleCoordinator::setState(State state)
    {
        this->m_state = state;
        if (this->m_stateCallback)
            this->m_stateCallback(state);
    }

    bool LifecycleCoordinator::cancelRequested() const
    {
        if (QThread::currentThread()->isInterruptionRequested())
            return true;
        return this->m_cancel && this->m_cancel();
    }

    void LifecycleCoordinator::EnsureRunning(const GuestRecord& guest)
    {
        this->m_samples = 0;
        this->m_jobId.clear();

        if (guest.IsRunning())
        {
            this->setState(Running);
            return;
        }

        this->setState(NotRunning);
        qInfo() << "LifecycleCoordinator: Starting" << guest.Name() << "(" << guest.Vmid() << ") on" << guest.Node();

        this->m_jobId = this->requestStart(guest);
        this->pollUntilComplete(guest);
    }

    QString LifecycleCoordinator::requestStart(const GuestRecord& guest)
    {
        if (!this->m_session)
            throw LifecycleError(LifecycleError::StartRejected, "Failed to start VM: not connected");

        this->setState(StartRequested);
        ApiReply reply = PveAPI::Guest::Start(this->m_session, guest.Node(), guest.KindPath(), guest.Vmid(),
                                              this->m_policy.startTimeoutMs);
        if (!reply.IsOk())
        {
            this->setState(Failed);
            throw LifecycleError(LifecycleError::StartRejected,
                                 QString("Failed to start %1: %2").arg(guest.Name(), reply.error));
        }

        const QString jobId = reply.data.toString();
        if (jobId.isEmpty())
        {
            this->setState(Failed);
            throw LifecycleError(LifecycleError::StartRejected,
                                 QString("Failed to start %1: no task id returned").arg(guest.Name()));
        }

        qDebug() << "LifecycleCoordinator: Start task" << jobId;
        return jobId;
    }

    void LifecycleCoordinator::pollUntilComplete(const GuestRecord& guest)
    {
        this->setState(Polling);

        for (int sample = 1; sample <= this->m_policy.maxSamples; ++sample)
        {
            if (this->cancelRequested())
            {
                this->setState(Failed);
                throw LifecycleError(LifecycleError::Cancelled,
                                     QString("Start of %1 was cancelled").arg(guest.Name()));
            }

            this->m_sleeper->Sleep(this->m_policy.pollIntervalMs);
            this->m_samples = sample;

            ApiReply reply = PveAPI::Task::GetStatus(this->m_session, guest.Node(), this->m_jobId);
            if (!reply.IsOk() || reply.data.userType() != QMetaType::QVariantMap)
            {
                qWarning() << "LifecycleCoordinator: Status query" << sample << "failed:" << reply.error;
                if (sample == this->m_policy.maxSamples
                    && this->m_policy.finalSampleFailure == ReportUnavailable)
                {
                    this->setState(StatusUnavailable);
                    throw LifecycleError(LifecycleError::StatusUnavailable,
                                         QString("Status of %1 could not be read: %2").arg(guest.Name(), reply.error));
                }
                continue;
            }

            const QVariantMap status = reply.data.toMap();
            if (!status.contains("exitstatus"))
                continue;

            const QString exitStatus = status.value("exitstatus").toString();
            if (exitStatus != EXIT_STATUS_OK)
            {
                this->setState(Failed);
                throw LifecycleError(LifecycleError::Failed,
                                     QString("Failed to start %1: %2").arg(guest.Name(), exitStatus));
            }

            qInfo() << "LifecycleCoordinator:" << guest.Name() << "started after" << sample << "samples";
            this->setState(Running);
            return;
        }

        this->setState(TimedOut);
        throw LifecycleError(LifecycleError::TimedOut,
                             QString("%1 failed to start within %2 seconds")
                                 .arg(guest.Name())
                                 .arg(this->m_policy.maxSamples * this->m_policy.pollIntervalMs / 1000));
    }
}
