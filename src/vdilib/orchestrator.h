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

#ifndef ORCHESTRATOR_H
#define ORCHESTRATOR_H

#include "vdilib_global.h"
#include "config/vdiconfig.h"
#include "hostpoolresolver.h"
#include "lifecyclecoordinator.h"
#include "pve/guestrecord.h"
#include <QByteArray>
#include <QList>
#include <QSharedPointer>
#include <QString>

namespace Vdi
{
    class DisplayViewer;
    class Session;
    class Sleeper;

    /**
     * @brief Drives one host-set from login to viewer hand-off
     *
     *   authenticate -> list -> (auto-select) -> ensure running -> synthesize -> viewer
     *
     * Owns the authenticated session for its whole lifetime. Connect() is
     * synchronous and returns once the viewer has exited, so a front end can
     * suspend its own output around it. One orchestration at a time.
     */
    class VDILIB_EXPORT Orchestrator
    {
        public:
            /**
             * @param config Loaded configuration
             * @param hostSetName Host-set to use, empty selects the default one
             * @param transportFactory Creates transports for pool members
             * @param viewer Receives the synthesized configuration, not owned
             * @param sleeper Used by start polling, not owned, nullptr for real sleeps
             */
            Orchestrator(const VdiConfig& config, const QString& hostSetName, TransportFactory transportFactory,
                         DisplayViewer* viewer, Sleeper* sleeper = nullptr);

            const VdiConfig& GetConfig() const { return this->m_config; }
            const HostSet& GetHostSet() const { return this->m_hostSet; }
            HostPoolResolver& Resolver() { return this->m_resolver; }

            void SetLifecyclePolicy(const LifecycleCoordinator::Policy& policy) { this->m_policy = policy; }
            void SetCancelCallback(LifecycleCoordinator::CancelCallback cancel) { this->m_cancel = cancel; }
            void SetStateCallback(LifecycleCoordinator::StateCallback callback) { this->m_stateCallback = callback; }

            /**
             * @brief Log in to the host-set, throws AuthError
             */
            void Authenticate();
            bool IsAuthenticated() const { return !this->m_session.isNull(); }
            Session* GetSession() const { return this->m_session.data(); }

            /**
             * @brief Guests visible under the configured type filter, throws DirectoryError
             */
            QList<GuestRecord> ListGuests() const;

            /**
             * @brief Resolve the host-set's auto-connect guest
             * @return false when no auto-connect id is configured or the guest is not listed
             */
            bool FindAutoConnectGuest(GuestRecord& guest) const;

            bool FindGuest(int vmid, GuestRecord& guest) const;

            /**
             * @brief Start the guest if needed and build its viewer configuration
             *
             * Throws LifecycleError or SynthesisError.
             */
            QByteArray PrepareConnection(const GuestRecord& guest);

            /**
             * @brief PrepareConnection() followed by the viewer hand-off, blocks until the viewer exits
             */
            void Connect(const GuestRecord& guest);

            LifecycleCoordinator::State LastLifecycleState() const { return this->m_lastState; }

        private:
            Session* requireSession() const;

            VdiConfig m_config;
            HostSet m_hostSet;
            HostPoolResolver m_resolver;
            DisplayViewer* m_viewer;
            Sleeper* m_sleeper;
            LifecycleCoordinator::Policy m_policy;
            LifecycleCoordinator::CancelCallback m_cancel;
            LifecycleCoordinator::StateCallback m_stateCallback;
            LifecycleCoordinator::State m_lastState;
            QSharedPointer<Session> m_session;
    };
}

#endif // ORCHESTRATOR_H
