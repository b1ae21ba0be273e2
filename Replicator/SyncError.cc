//
// SyncError.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "synccore/SyncError.hh"
#include "StringUtil.hh"
#include <cerrno>

using namespace std;

namespace synccore {
    using namespace websocket;

    using CodeList = const int[];
    using ErrorSet = const int* [error::NumDomainsPlus1];

    __cold static bool errorIsInSet(const SyncError& err, ErrorSet set) {
        if ( err.code != 0 && unsigned(err.domain) < error::NumDomainsPlus1 ) {
            const int* pCode = set[err.domain];
            if ( pCode ) {
                for ( ; *pCode != 0; ++pCode )
                    if ( *pCode == err.code ) return true;
            }
        }
        return false;
    }

    __cold bool SyncError::mayBeTransient() const noexcept {
        static CodeList kTransientPOSIX = {ENETRESET, ECONNABORTED, ECONNRESET, ETIMEDOUT, ECONNREFUSED, 0};

        static CodeList kTransientNetwork = {kNetErrDNSFailure,
                                             kNetErrTimeout,
                                             kNetErrNetworkReset,
                                             kNetErrConnectionAborted,
                                             kNetErrConnectionReset,
                                             kNetErrConnectionRefused,
                                             0};
        static CodeList kTransientWebSocket = {408, /* Request Timeout */
                                               429, /* Too Many Requests (RFC 6585) */
                                               502, /* Bad Gateway */
                                               503, /* Service Unavailable */
                                               504, /* Gateway Timeout */
                                               kCodeAbnormal,
                                               kCloseAppTransient,
                                               0};
        static ErrorSet kTransient = {// indexed by error::Domain
                                      nullptr, nullptr, kTransientPOSIX, kTransientNetwork, kTransientWebSocket};
        return errorIsInSet(*this, kTransient);
    }

    __cold bool SyncError::mayBeNetworkDependent() const noexcept {
        static CodeList kUnreachablePOSIX = {ENETDOWN,     ENETUNREACH,   ENOTCONN, ETIMEDOUT, EHOSTDOWN,
                                             EHOSTUNREACH, EADDRNOTAVAIL, EPIPE,    0};

        static CodeList kUnreachableNetwork = {kNetErrDNSFailure,
                                               kNetErrUnknownHost,  // May change if user logs into VPN or moves to intranet
                                               kNetErrNetworkDown,
                                               kNetErrNetworkUnreachable,
                                               kNetErrNotConnected,
                                               kNetErrHostDown,
                                               kNetErrHostUnreachable,
                                               kNetErrAddressNotAvailable,
                                               kNetErrBrokenPipe,
                                               0};
        static ErrorSet kUnreachable = {// indexed by error::Domain
                                        nullptr, nullptr, kUnreachablePOSIX, kUnreachableNetwork, nullptr};
        return errorIsInSet(*this, kUnreachable);
    }

    string SyncError::description() const {
        if ( code == 0 ) return "No error";
        string msg = message.empty() ? error::_what(domain, code) : message;
        return format("%s error %d, \"%s\"", error::nameOfDomain(domain), code, msg.c_str());
    }

    SyncError SyncError::fromException(const exception& x) noexcept { return SyncError(error::convertException(x)); }

    SyncError SyncError::fromCurrentException() noexcept { return SyncError(error::convertCurrentException()); }

    void SyncError::raise() const {
        if ( message.empty() ) error::_throw(domain, code);
        else
            throw error(domain, code, message);
    }

}  // namespace synccore
