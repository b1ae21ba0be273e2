//
// Error.hh
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
#include "fleece/PlatformCompat.hh"
#include <stdexcept>
#include <string>

#undef check

namespace synccore {

    /** Most API calls can throw this. */
    struct error : public std::runtime_error {
        enum Domain {
            SyncCore = 1,  // See SyncCoreError enum, below
            POSIX,         // See <errno.h>
            Network,       // See websocket::NetworkError in SyncError.hh
            WebSocket,     // HTTP status codes and WebSocket close codes

            // Add new domain here.
            // You MUST add a name string to kDomainNames in Error.cc!
            NumDomainsPlus1
        };

        // Error codes in SyncCore domain:
        enum SyncCoreError {
            AssertionFailed = 1,
            Unimplemented,
            NotOpen,
            NotFound,
            Conflict,
            InvalidParameter,
            UnexpectedError,
            NotWriteable,
            Busy,
            UnsupportedOperation,
            RemoteError,
            Unauthorized,

            // Add new codes here. You MUST add messages to kSyncCoreMessages!

            NumSyncCoreErrorsPlus1
        };

        //---- Data members:
        Domain const domain;
        int const    code;

        error(Domain, int code);
        error(Domain, int code, const std::string& what);

        explicit error(SyncCoreError e) : error(SyncCore, e) {}

        [[noreturn]] void _throw() const;

        /** True for errors that occur routinely and aren't worth a warning when thrown. */
        [[nodiscard]] bool isUnremarkable() const;

        /** Returns the error equivalent to a given runtime_error. Uses RTTI to discover if the
            error is already an `error` instance; otherwise maps other standard exception types. */
        static error convertRuntimeError(const std::runtime_error&);
        static error convertException(const std::exception&);
        static error convertCurrentException();

        /** Static version of the standard `what` method. */
        static std::string _what(Domain, int code) noexcept;

        static const char* nameOfDomain(Domain) noexcept;

        /** Constructs and throws an error. */
        [[noreturn]] static void _throw(Domain d, int c);
        [[noreturn]] static void _throw(SyncCoreError);
        [[noreturn]] static void _throw(SyncCoreError, const char* msg, ...) __printflike(2, 3);
        [[noreturn]] static void _throwErrno(const char* msg, ...) __printflike(1, 2);

        /** Throws an assertion failure exception. Called by the Assert() macro. */
        [[noreturn]] static void assertionFailed(const char* func, const char* file, unsigned line, const char* expr,
                                                 const char* message = nullptr, ...) __printflike(5, 6);

        static bool sWarnOnError;
    };

    static inline bool operator==(const error& a, const error& b) noexcept {
        return a.domain == b.domain && a.code == b.code;
    }

    static inline bool operator==(const error& a, error::SyncCoreError code) noexcept {
        return a.domain == error::SyncCore && a.code == code;
    }

// Like C assert() but throws an exception instead of aborting
#define Assert(e, ...)                                                                                                 \
    (_usuallyFalse(!(e)) ? synccore::error::assertionFailed(__func__, __FILE__, __LINE__, #e, ##__VA_ARGS__) : (void)0)

// DebugAssert is removed from release builds; use when 'e' test is too expensive
#ifndef DEBUG
#    define DebugAssert(e, ...)                                                                                        \
        do {                                                                                                           \
        } while ( 0 )
#else
#    define DebugAssert(e, ...) Assert(e, ##__VA_ARGS__)
#endif

}  // namespace synccore
