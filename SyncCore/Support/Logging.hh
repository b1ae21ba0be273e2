//
// Logging.hh
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
#include <atomic>
#include <cinttypes>  //for stdint.h fmt specifiers
#include <cstdarg>
#include <cstdint>
#include <map>
#include <string>

/*
    This is a configurable console-logging facility that lets logging be turned on and off
    independently for various subsystems or areas of the code. It's used similarly to printf:
        Log("the value of foo is %d", foo);

    You can associate a log message with a particular subsystem by defining a logging domain:
        LogDomain FooLog("Foo");
    and then logging to it:
        LogTo(FooLog, "the value of foo is %d", foo);

    Each domain has a minimum level; messages below it are discarded. For any domain "Foo", the
    environment variable `SyncCoreLogFoo` can force the level to one of
    "debug", "verbose", "info", "warning", "error" or "none". `SyncCoreLog` (no suffix) sets the
    level of the default domain and the console callback.

    Warn() always logs at Warning level to the default domain.
*/

namespace synccore {

    enum class LogLevel : int8_t { Uninitialized = -1, Debug, Verbose, Info, Warning, Error, None };

    class Logging;

    class LogDomain {
      public:
        explicit LogDomain(const char* name, LogLevel level = LogLevel::Info)
            : _level(level), _name(name), _next(sFirstDomain) {
            sFirstDomain = this;
        }

        static LogDomain* named(const char* name);

        const char* name() const { return _name; }

        void     setLevel(LogLevel lvl) noexcept;
        LogLevel level() const noexcept;

        bool willLog(LogLevel lv) const { return _effectiveLevel <= lv; }

        void log(LogLevel level, const char* fmt, ...) __printflike(3, 4);
        void vlog(LogLevel level, const char* fmt, va_list) __printflike(3, 0);

        using Callback_t = void (*)(const LogDomain&, LogLevel, const char* format, va_list);

        static void defaultCallback(const LogDomain&, LogLevel, const char* format, va_list) __printflike(3, 0);
        static Callback_t currentCallback();

        /** Registers (or unregisters) a callback to be passed log messages.
            @param callback  The callback function, or NULL to unregister.
            @param preformatted  If true, callback will be passed already-formatted log messages to
                be displayed verbatim (and the `va_list` parameter will be empty.) */
        static void setCallback(Callback_t callback, bool preformatted);

        /** Starts (or stops, if `path` is empty) writing plain-text log messages to a file.
            @param path  The file to append to.
            @param level  The minimum level that's written to the file.
            @param initialMessage  First line written to the file, e.g. version info. */
        static void writeLogsTo(const std::string& path, LogLevel level, const std::string& initialMessage = "");

        static LogLevel callbackLogLevel() noexcept;

        static LogLevel fileLogLevel() noexcept { return sFileMinLevel; }

        /** Number of messages logged at Warning level or above, in any domain. */
        static unsigned warningCount();

      private:
        friend class Logging;
        unsigned registerObject(const void* object, const unsigned* val, const std::string& description,
                                const std::string& nickname, LogLevel level);
        void     unregisterObject(unsigned obj);
        void     vlog(LogLevel level, const Logging* logger, bool callback, const char* fmt, va_list)
                __printflike(5, 0);

        static LogLevel _callbackLogLevel() noexcept;
        LogLevel        computeLevel() noexcept;
        LogLevel        levelFromEnvironment() const noexcept;
        static void     _invalidateEffectiveLevels() noexcept;

        void writeToFile(LogLevel level, const std::string& prefix, const char* fmt, va_list) __printflike(4, 0);
        void invokeCallbackVerbatim(LogLevel level);
        void callVerbatim(LogLevel level, const char* fmt, ...) __printflike(3, 4);

        std::atomic<LogLevel> _effectiveLevel{LogLevel::Uninitialized};
        std::atomic<LogLevel> _level;
        const char* const     _name;
        LogDomain* const      _next;

        static unsigned                          slastObjRef;
        static std::map<unsigned, std::string>   sObjNames;
        static LogDomain*                        sFirstDomain;
        static LogLevel                          sCallbackMinLevel;
        static LogLevel                          sFileMinLevel;
    };

    extern LogDomain kSyncCore_DefaultLog, SyncLog, ActorLog;


#define LogToAt(DOMAIN, LEVEL, FMT, ...)                                                                               \
    do {                                                                                                               \
        if ( _usuallyFalse((DOMAIN).willLog(synccore::LogLevel::LEVEL)) )                                              \
            (DOMAIN).log(synccore::LogLevel::LEVEL, FMT, ##__VA_ARGS__);                                               \
    } while ( 0 )

#define LogTo(DOMAIN, FMT, ...)      LogToAt(DOMAIN, Info, FMT, ##__VA_ARGS__)
#define LogVerbose(DOMAIN, FMT, ...) LogToAt(DOMAIN, Verbose, FMT, ##__VA_ARGS__)
#define LogWarn(DOMAIN, FMT, ...)    LogToAt(DOMAIN, Warning, FMT, ##__VA_ARGS__)
#define LogError(DOMAIN, FMT, ...)   LogToAt(DOMAIN, Error, FMT, ##__VA_ARGS__)

#define Log(FMT, ...)       LogToAt(synccore::kSyncCore_DefaultLog, Info, FMT, ##__VA_ARGS__)
#define Warn(FMT, ...)      LogToAt(synccore::kSyncCore_DefaultLog, Warning, FMT, ##__VA_ARGS__)
#define WarnError(FMT, ...) LogToAt(synccore::kSyncCore_DefaultLog, Error, FMT, ##__VA_ARGS__)

#ifdef DEBUG
#    define LogDebug(DOMAIN, FMT, ...) LogToAt(DOMAIN, Debug, FMT, ##__VA_ARGS__)
#else
#    define LogDebug(DOMAIN, FMT, ...)                                                                                 \
        do {                                                                                                           \
        } while ( 0 )
#endif


    static inline bool WillLog(LogLevel lv) { return kSyncCore_DefaultLog.willLog(lv); }

    /** Mixin that adds logInfo(), warn(), etc. methods. The messages these write will be prefixed
        with a description of the object; by default this is just the class and a serial number,
        but you can customize it by overriding loggingIdentifier(). */
    class Logging {
      public:
        std::string loggingName() const;

      protected:
        explicit Logging(LogDomain& domain) : _domain(domain) {}

        virtual ~Logging();

        /** Override this to return a string identifying this object. */
        virtual std::string loggingIdentifier() const;
        virtual std::string loggingClassName() const;

#define LOGBODY(LEVEL)                                                                                                 \
    va_list args;                                                                                                      \
    va_start(args, format);                                                                                            \
    _logv(LogLevel::LEVEL, format, args);                                                                              \
    va_end(args);

        void warn(const char* format, ...) const __printflike(2, 3) { LOGBODY(Warning) }

        // For performance reasons, logInfo(), logVerbose(), logDebug() are macros (below)
        void _logInfo(const char* format, ...) const __printflike(2, 3) { LOGBODY(Info) }

        void _logVerbose(const char* format, ...) const __printflike(2, 3) { LOGBODY(Verbose) }

        void _logDebug(const char* format, ...) const __printflike(2, 3) { LOGBODY(Debug) }

#undef LOGBODY

        bool willLog(LogLevel level = LogLevel::Info) const { return _domain.willLog(level); }

        void _log(LogLevel level, const char* format, ...) const __printflike(3, 4);
        void _logv(LogLevel level, const char* format, va_list) const __printflike(3, 0);

        unsigned getObjectRef(LogLevel level = LogLevel::Info) const;

        LogDomain& _domain;

      private:
        friend class LogDomain;
        mutable unsigned _objectRef{0};
    };

#define _logAt(LEVEL, FMT, ...)                                                                                        \
    do {                                                                                                               \
        if ( _usuallyFalse(this->willLog(synccore::LogLevel::LEVEL)) )                                                 \
            this->_log(synccore::LogLevel::LEVEL, FMT, ##__VA_ARGS__);                                                 \
    } while ( 0 )
#define logInfo(FMT, ...)    _logAt(Info, FMT, ##__VA_ARGS__)
#define logVerbose(FMT, ...) _logAt(Verbose, FMT, ##__VA_ARGS__)

#ifdef DEBUG
#    define logDebug(FMT, ...) _logAt(Debug, FMT, ##__VA_ARGS__)
#else
#    define logDebug(FMT, ...)                                                                                         \
        do {                                                                                                           \
        } while ( 0 )
#endif

}  // namespace synccore
