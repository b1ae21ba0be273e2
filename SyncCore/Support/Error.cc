//
// Error.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"
#include "synccore/SyncError.hh"  // for Network error codes
#include <cctype>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <exception>
#include <string>
#include <system_error>
#include <typeinfo>

namespace synccore {

    using namespace std;


#pragma mark ERROR CODES, NAMES, etc.


    __cold static const char* synccore_errstr(error::SyncCoreError code) {
        static const char* kSyncCoreMessages[] = {
                "no error",  // 0
                "assertion failed",
                "unimplemented function called",
                "object is not open",
                "not found",
                "conflict",
                "invalid parameter",
                "unexpected exception",
                "not writeable",
                "busy",
                "unsupported operation",
                "error on remote server",
                "unauthorized",
        };
        static_assert(sizeof(kSyncCoreMessages) / sizeof(kSyncCoreMessages[0]) == error::NumSyncCoreErrorsPlus1,
                      "Incomplete error message table");
        const char* str = nullptr;
        if ( code < sizeof(kSyncCoreMessages) / sizeof(char*) ) str = kSyncCoreMessages[code];
        if ( !str ) str = "(unknown SyncCoreError)";
        return str;
    }

    __cold static const char* network_errstr(int code) {
        static const char* kNetworkMessages[] = {
                "no error",  // 0
                "DNS error",
                "unknown hostname",
                "connection timed out",
                "invalid URL",
                "too many redirects",
                "TLS handshake failed",
                "server TLS certificate expired",
                "server TLS certificate untrusted",
                "server requires a TLS client certificate",
                "server rejected the TLS client certificate",
                "server TLS certificate is self-signed or has unknown root cert",
                "redirected to an invalid URL",
                "unknown network error",
                "server TLS certificate has been revoked",
                "server TLS certificate name mismatch",
                "network subsystem was reset",
                "connection aborted",
                "connection reset",
                "connection refused",
                "network subsystem down",
                "network unreachable",
                "socket not connected",
                "host reported not available",
                "host not reachable",
                "address not available",
                "broken pipe"};
        const char* str = nullptr;
        if ( code >= 0 && size_t(code) < sizeof(kNetworkMessages) / sizeof(char*) ) str = kNetworkMessages[code];
        if ( !str ) str = "(unknown network error)";
        return str;
    }

    __cold static const char* websocket_errstr(int code) {
        static const struct {
            int         code;
            const char* message;
        } kWebSocketMessages[] = {{400, "invalid request"},
                                  {401, "unauthorized"},
                                  {403, "forbidden"},
                                  {404, "not found"},
                                  {405, "HTTP method not allowed"},
                                  {408, "request timeout"},
                                  {409, "conflict"},
                                  {410, "gone"},
                                  {429, "too many requests"},
                                  {500, "server error"},
                                  {501, "server error: not implemented"},
                                  {502, "remote error"},
                                  {503, "service unavailable"},
                                  {504, "gateway timeout"},
                                  {1000, "normal close"},
                                  {1001, "peer going away"},
                                  {1002, "protocol error"},
                                  {1003, "unsupported data"},
                                  {1005, "no status code received"},
                                  {1006, "connection closed abnormally"},
                                  {1007, "inconsistent data"},
                                  {1008, "policy violation"},
                                  {1009, "message too big"},
                                  {1010, "extension not negotiated"},
                                  {1011, "unexpected condition"},
                                  {1015, "TLS handshake failed"},
                                  {4001, "transient application error"},
                                  {4002, "permanent application error"},
                                  {0, nullptr}};

        for ( unsigned i = 0; kWebSocketMessages[i].message; ++i ) {
            if ( kWebSocketMessages[i].code == code ) return kWebSocketMessages[i].message;
        }
        return code >= 1000 ? "WebSocket error" : "HTTP error";
    }

    __cold string error::_what(error::Domain domain, int code) noexcept {
        switch ( domain ) {
            case SyncCore:
                return synccore_errstr((SyncCoreError)code);
            case POSIX:
                return strerror(code);
            case Network:
                return network_errstr(code);
            case WebSocket:
                return websocket_errstr(code);
            default:
                return "unknown error domain";
        }
    }

    __cold const char* error::nameOfDomain(Domain domain) noexcept {
        static const char* kDomainNames[] = {"0", "SyncCore", "POSIX", "Network", "WebSocket"};
        static_assert(sizeof(kDomainNames) / sizeof(kDomainNames[0]) == error::NumDomainsPlus1,
                      "Incomplete domain name table");

        if ( domain <= 0 || domain >= NumDomainsPlus1 ) return "INVALID_DOMAIN";
        return kDomainNames[domain];
    }


#pragma mark - ERROR CLASS:


    bool error::sWarnOnError = false;

    __cold error::error(error::Domain d, int c) : error(d, c, _what(d, c)) {}

    __cold error::error(error::Domain d, int c, const std::string& what) : runtime_error(what), domain(d), code(c) {
        DebugAssert(code != 0);
    }

    __cold static error unexpectedException(const std::exception& x) {
        const char* name = typeid(x).name();
        while ( isalpha(*name) ) ++name;
        while ( isdigit(*name) ) ++name;
        Warn("Caught unexpected C++ %s(\"%s\")", name, x.what());
        return {error::SyncCore, error::UnexpectedError, x.what()};
    }

    __cold error error::convertRuntimeError(const std::runtime_error& re) {
        if ( auto e = dynamic_cast<const error*>(&re); e ) {
            return *e;
        } else if ( auto se = dynamic_cast<const std::system_error*>(&re); se ) {
            if ( se->code().category() == std::generic_category() || se->code().category() == std::system_category() )
                return {POSIX, se->code().value(), re.what()};
        }
        return unexpectedException(re);
    }

    __cold error error::convertException(const std::exception& x) {
        if ( auto re = dynamic_cast<const std::runtime_error*>(&x); re ) return convertRuntimeError(*re);
        if ( auto le = dynamic_cast<const std::logic_error*>(&x); le ) {
            SyncCoreError code = AssertionFailed;
            if ( dynamic_cast<const std::invalid_argument*>(le) != nullptr
                 || dynamic_cast<const std::domain_error*>(le) != nullptr )
                code = InvalidParameter;
            return {SyncCore, code, le->what()};
        }
        return unexpectedException(x);
    }

    __cold error error::convertCurrentException() {
        // This rigamarole recovers the current exception being thrown...
        auto xp = std::current_exception();
        if ( xp ) {
            try {
                std::rethrow_exception(xp);
            } catch ( const std::exception& x ) {
                // Now we have the exception, so we can convert it:
                return convertException(x);
            } catch ( ... ) {
                // Not a std::exception; reported as UnexpectedError below
            }
        }
        return {error::SyncCore, error::UnexpectedError, "Unknown C++ exception"};
    }

    __cold bool error::isUnremarkable() const {
        if ( code == 0 ) return true;
        switch ( domain ) {
            case SyncCore:
                return code == NotFound || code == NotOpen;
            case POSIX:
                return code == ENOENT;
            case Network:
                return code != websocket::kNetErrUnknown;
            default:
                return false;
        }
    }

    __cold void error::_throw() const {
        if ( sWarnOnError && !isUnremarkable() ) {
            WarnError("SyncCore throwing %s error %d: %s", nameOfDomain(domain), code, what());
        }
        throw *this;
    }

    __cold void error::_throw(Domain domain, int code) { error{domain, code}._throw(); }

    __cold void error::_throw(error::SyncCoreError err) { error{SyncCore, err}._throw(); }

    __cold void error::_throw(error::SyncCoreError code, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        std::string message = vformat(fmt, args);
        va_end(args);
        error{SyncCore, code, message}._throw();
    }

    __cold void error::_throwErrno(const char* fmt, ...) {
        int     code = errno;
        va_list args;
        va_start(args, fmt);
        std::string message = vformat(fmt, args);
        va_end(args);
        message += ": ";
        message += strerror(code);
        error{POSIX, code, message}._throw();
    }

    __cold void error::assertionFailed(const char* fn, const char* file, unsigned line, const char* expr,
                                       const char* message, ...) {
        string messageStr = "Assertion failed: ";
        if ( message ) {
            va_list args;
            va_start(args, message);
            messageStr += vformat(message, args);
            va_end(args);
        } else {
            messageStr += expr;
        }
        if ( !WillLog(LogLevel::Error) ) fprintf(stderr, "%s (%s:%u, in %s)", messageStr.c_str(), file, line, fn);
        WarnError("%s (%s:%u, in %s)", messageStr.c_str(), file, line, fn);
        throw error(SyncCore, AssertionFailed, messageStr);
    }

}  // namespace synccore
