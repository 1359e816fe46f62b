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

#ifndef VDIERROR_H
#define VDIERROR_H

#include "vdilib_global.h"
#include <QString>
#include <stdexcept>
#include <string>

namespace Vdi
{
    /*!
     * \brief Base class of every failure that aborts an orchestration step
     *
     * Carries a human readable message that the front end prints as a single
     * line. Subclasses add a kind so callers can branch without parsing text.
     */
    class VDILIB_EXPORT VdiError : public std::runtime_error
    {
        public:
            explicit VdiError(const QString& message);

            QString message() const { return this->m_message; }

        private:
            QString m_message;
    };

    class VDILIB_EXPORT AuthError : public VdiError
    {
        public:
            enum Kind
            {
                CredentialRejected,
                PoolExhausted
            };

            AuthError(Kind kind, const QString& message);

            Kind kind() const { return this->m_kind; }

        private:
            Kind m_kind;
    };

    class VDILIB_EXPORT DirectoryError : public VdiError
    {
        public:
            enum Kind
            {
                Unavailable
            };

            explicit DirectoryError(const QString& message);

            Kind kind() const { return Unavailable; }
    };

    class VDILIB_EXPORT LifecycleError : public VdiError
    {
        public:
            enum Kind
            {
                StartRejected,
                Failed,
                TimedOut,
                StatusUnavailable,
                Cancelled
            };

            LifecycleError(Kind kind, const QString& message);

            Kind kind() const { return this->m_kind; }

        private:
            Kind m_kind;
    };

    class VDILIB_EXPORT SynthesisError : public VdiError
    {
        public:
            enum Kind
            {
                TicketUnavailable,
                MalformedTicket
            };

            SynthesisError(Kind kind, const QString& message);

            Kind kind() const { return this->m_kind; }

        private:
            Kind m_kind;
    };

    class VDILIB_EXPORT ConfigError : public VdiError
    {
        public:
            explicit ConfigError(const QString& message);
    };

    class VDILIB_EXPORT ViewerError : public VdiError
    {
        public:
            enum Kind
            {
                NotFound,
                LaunchFailed
            };

            ViewerError(Kind kind, const QString& message);

            Kind kind() const { return this->m_kind; }

        private:
            Kind m_kind;
    };
}

#endif // VDIERROR_H
