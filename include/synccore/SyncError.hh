//
// SyncError.hh
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#pragma once
#include "synccore/Base.hh"
#include "Error.hh"
#include <exception>
#include <string>

namespace synccore {

    namespace websocket {

        /// WebSocket close codes; HTTP status codes share the same domain.
        enum CloseCode : int {
            kCodeNormal = 1000,
            kCodeGoingAway,
            kCodeProtocolError,
            kCodeUnsupportedData,
            kCodeStatusCodeExpected = 1005,
            kCodeAbnormal,
            kCodeInconsistentData,
            kCodePolicyViolation,
            kCodeMessageTooBig,
            kCodeExtensionNotNegotiated,
            kCodeUnexpectedCondition,
            kCodeFailedTLSHandshake = 1015,
            kCloseAppTransient      = 4001,
            kCloseAppPermanent,
        };

        /// Codes in the `Network` error domain.
        enum NetworkError : int {
            kNetErrDNSFailure = 1,         // DNS lookup failed (transient)
            kNetErrUnknownHost,            // DNS server doesn't know the hostname
            kNetErrTimeout,                // Connection timed out
            kNetErrInvalidURL,
            kNetErrTooManyRedirects,
            kNetErrTLSHandshakeFailed,
            kNetErrTLSCertExpired,
            kNetErrTLSCertUntrusted,       // Cert isn't trusted for other reason
            kNetErrTLSCertRequiredByPeer,  // Peer requires a client cert
            kNetErrTLSCertRejectedByPeer,  // Peer rejected our client cert
            kNetErrTLSCertUnknownRoot,     // Self-signed cert, or unknown anchor cert
            kNetErrInvalidRedirect,        // Attempted redirect to invalid replication endpoint
            kNetErrUnknown,                // Unknown error
            kNetErrTLSCertRevoked,
            kNetErrTLSCertNameMismatch,
            kNetErrNetworkReset,
            kNetErrConnectionAborted,
            kNetErrConnectionReset,
            kNetErrConnectionRefused,
            kNetErrNetworkDown,
            kNetErrNetworkUnreachable,
            kNetErrNotConnected,
            kNetErrHostDown,
            kNetErrHostUnreachable,
            kNetErrAddressNotAvailable,
            kNetErrBrokenPipe,
        };

    }  // namespace websocket

    /** An error value, as carried in a ReplicatorStatus and reported by the sync engine.
        A default-constructed SyncError means "no error". */
    struct SyncError {
        error::Domain domain{error::SyncCore};
        int           code{0};
        std::string   message;

        SyncError() = default;

        SyncError(error::Domain d, int c, std::string msg = "") : domain(d), code(c), message(std::move(msg)) {}

        explicit SyncError(const error& e) : SyncError(e.domain, e.code, e.what()) {}

        explicit operator bool() const { return code != 0; }

        /// True if the error is likely to go away by itself, so the operation is worth retrying.
        [[nodiscard]] bool mayBeTransient() const noexcept;

        /// True if the error might be fixed by a change in the network, e.g. switching to WiFi.
        [[nodiscard]] bool mayBeNetworkDependent() const noexcept;

        /// A human-readable description including the domain name and code.
        std::string description() const;

        /// Converts the exception currently being handled (or `x`) to a SyncError.
        static SyncError fromException(const std::exception& x) noexcept;
        static SyncError fromCurrentException() noexcept;

        /// Throws the equivalent `synccore::error`.
        [[noreturn]] void raise() const;

        bool operator==(const SyncError& e) const { return domain == e.domain && code == e.code; }
    };

}  // namespace synccore
