//
// Logging.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Logging.hh"
#include "StringUtil.hh"
#include <algorithm>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>
#include <strings.h>
#include <typeinfo>

#if defined(__linux__) || defined(__APPLE__)
#    include <cxxabi.h>
#endif

using namespace std;
using namespace std::chrono;

namespace synccore {

    LogDomain* LogDomain::sFirstDomain = nullptr;

    LogDomain kSyncCore_DefaultLog("", LogLevel::Info);
    LogDomain SyncLog("Sync");
    LogDomain ActorLog("Actor");

    LogLevel                        LogDomain::sCallbackMinLevel = LogLevel::Uninitialized;
    static LogDomain::Callback_t    sCallback                    = LogDomain::defaultCallback;
    static bool                     sCallbackPreformatted        = false;
    LogLevel                        LogDomain::sFileMinLevel     = LogLevel::None;
    unsigned                        LogDomain::slastObjRef{0};
    std::map<unsigned, std::string> LogDomain::sObjNames;
    static ofstream*                sFileOut = nullptr;
    static atomic<unsigned>         sWarningCount;
    static mutex                    sLogMutex;

    static const char* kLevels[] = {"Debug", "Verbose", "Info", "WARNING", "ERROR"};

    // Writes a timestamp like "2026-10-18T14:03:27.581123" followed by a space.
    static void writeTimestamp(ostream& out) {
        auto    now    = system_clock::now();
        time_t  secs   = system_clock::to_time_t(now);
        auto    micros = duration_cast<microseconds>(now.time_since_epoch()).count() % 1000000;
        tm      local{};
        char    buf[40];
        localtime_r(&secs, &local);
        strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &local);
        out << buf;
        snprintf(buf, sizeof(buf), ".%06lld ", (long long)micros);
        out << buf;
    }

    static void writeHeader(const char* levelName, const char* domainName, ostream& out) {
        if ( levelName[0] ) {
            if ( domainName && domainName[0] ) out << '[' << domainName << "] ";
            out << levelName << ": ";
        }
    }

    unsigned LogDomain::warningCount() { return sWarningCount; }


#pragma mark - GLOBAL SETTINGS:


    void LogDomain::setCallback(Callback_t callback, bool preformatted) {
        unique_lock<mutex> lock(sLogMutex);
        if ( !callback ) sCallbackMinLevel = LogLevel::None;
        sCallback             = callback;
        sCallbackPreformatted = preformatted;
        _invalidateEffectiveLevels();
    }

    LogDomain::Callback_t LogDomain::currentCallback() { return sCallback; }

    void LogDomain::writeLogsTo(const string& path, LogLevel level, const string& initialMessage) {
        unique_lock<mutex> lock(sLogMutex);
        if ( sFileOut ) {
            sFileOut->flush();
            delete sFileOut;
            sFileOut = nullptr;
        }
        if ( path.empty() ) {
            sFileMinLevel = LogLevel::None;
        } else {
            sFileOut = new ofstream(path, ofstream::out | ofstream::app);
            if ( !sFileOut->good() ) {
                fprintf(stderr, "SyncCore: failed to open log file %s\n", path.c_str());
                delete sFileOut;
                sFileOut      = nullptr;
                sFileMinLevel = LogLevel::None;
            } else {
                sFileMinLevel = level;
                writeTimestamp(*sFileOut);
                *sFileOut << "---- SyncCore log ----" << endl;
                if ( !initialMessage.empty() ) {
                    writeTimestamp(*sFileOut);
                    *sFileOut << "---- " << initialMessage << " ----" << endl;
                }

                // Make sure to flush the log when the process exits:
                static once_flag f;
                call_once(f, [] {
                    atexit([] {
                        if ( sLogMutex.try_lock() ) {  // avoid deadlock on crash inside logging code
                            if ( sFileOut ) {
                                writeTimestamp(*sFileOut);
                                *sFileOut << "---- END ----" << endl;
                                sFileOut->flush();
                            }
                            sLogMutex.unlock();
                        }
                    });
                });
            }
        }
        _invalidateEffectiveLevels();
    }

    // Only call while holding sLogMutex!
    void LogDomain::_invalidateEffectiveLevels() noexcept {
        for ( auto d = sFirstDomain; d; d = d->_next ) d->_effectiveLevel = LogLevel::Uninitialized;
    }

    LogLevel LogDomain::callbackLogLevel() noexcept {
        unique_lock<mutex> lock(sLogMutex);
        return _callbackLogLevel();
    }

    // Only call while holding sLogMutex!
    LogLevel LogDomain::_callbackLogLevel() noexcept {
        auto level = sCallbackMinLevel;
        if ( level == LogLevel::Uninitialized ) {
            // Allow 'SyncCoreLog' env var to set initial callback level:
            level = kSyncCore_DefaultLog.levelFromEnvironment();
            if ( level == LogLevel::Uninitialized ) level = LogLevel::Info;
            sCallbackMinLevel = level;
        }
        return level;
    }


#pragma mark - INITIALIZATION:


    // Returns the LogLevel override set by an environment variable, or Uninitialized if none
    LogLevel LogDomain::levelFromEnvironment() const noexcept {
        char* val = getenv((string("SyncCoreLog") + _name).c_str());
        if ( val ) {
            static const char* const kEnvLevelNames[] = {"debug", "verbose", "info", "warning",
                                                         "error", "none",    nullptr};
            for ( int i = 0; kEnvLevelNames[i]; i++ ) {
                if ( 0 == strcasecmp(val, kEnvLevelNames[i]) ) return LogLevel(i);
            }
            return LogLevel::Info;
        }
        return LogLevel::Uninitialized;
    }

    LogLevel LogDomain::computeLevel() noexcept {
        if ( _effectiveLevel == LogLevel::Uninitialized ) setLevel(_level);
        return _level;
    }

    LogLevel LogDomain::level() const noexcept { return const_cast<LogDomain*>(this)->computeLevel(); }

    void LogDomain::setLevel(LogLevel level) noexcept {
        unique_lock<mutex> lock(sLogMutex);

        // Setting "SyncCoreLog___" env var forces a minimum level:
        auto envLevel = levelFromEnvironment();
        if ( envLevel != LogLevel::Uninitialized ) level = min(level, envLevel);

        _level = level;
        // The effective level is the level at which I will actually trigger because there is
        // a place for my output to go:
        _effectiveLevel = max((LogLevel)_level, min(_callbackLogLevel(), sFileMinLevel));
    }

    LogDomain* LogDomain::named(const char* name) {
        unique_lock<mutex> lock(sLogMutex);
        if ( !name ) name = "";
        for ( auto d = sFirstDomain; d; d = d->_next )
            if ( strcmp(d->name(), name) == 0 ) return d;
        return nullptr;
    }


#pragma mark - LOGGING:


    static char sFormatBuffer[2048];

    void LogDomain::vlog(LogLevel level, const Logging* logger, bool doCallback, const char* fmt, va_list args) {
        if ( _effectiveLevel == LogLevel::Uninitialized ) computeLevel();
        if ( !willLog(level) ) return;

        string prefix;
        if ( logger ) {
            unsigned objRef = logger->getObjectRef();
            prefix          = format("{%s#%u}", logger->loggingClassName().c_str(), objRef);
        }

        unique_lock<mutex> lock(sLogMutex);

        if ( level >= LogLevel::Warning ) ++sWarningCount;

        // Invoke the client callback:
        if ( doCallback && sCallback && level >= _callbackLogLevel() ) {
            va_list args2;
            va_copy(args2, args);
            if ( sCallbackPreformatted || !prefix.empty() ) {
                size_t n = 0;
                if ( !prefix.empty() ) n = snprintf(sFormatBuffer, sizeof(sFormatBuffer), "%s ", prefix.c_str());
                vsnprintf(&sFormatBuffer[n], sizeof(sFormatBuffer) - n, fmt, args2);
                if ( sCallbackPreformatted ) {
                    va_list noArgs{};
                    sCallback(*this, level, sFormatBuffer, noArgs);
                } else {
                    invokeCallbackVerbatim(level);
                }
            } else {
                sCallback(*this, level, fmt, args2);
            }
            va_end(args2);
        }

        // Write to the log file:
        if ( level >= sFileMinLevel && sFileOut ) writeToFile(level, prefix, fmt, args);
    }

    // Must have sLogMutex held. Passes the already-formatted sFormatBuffer through the callback.
    void LogDomain::invokeCallbackVerbatim(LogLevel level) { callVerbatim(level, "%s", sFormatBuffer); }

    void LogDomain::callVerbatim(LogLevel level, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        sCallback(*this, level, fmt, args);
        va_end(args);
    }

    void LogDomain::vlog(LogLevel level, const char* fmt, va_list args) { vlog(level, nullptr, true, fmt, args); }

    void LogDomain::log(LogLevel level, const char* fmt, ...) {
        va_list args;
        va_start(args, fmt);
        vlog(level, nullptr, true, fmt, args);
        va_end(args);
    }

    // Must have sLogMutex held
    void LogDomain::writeToFile(LogLevel level, const string& prefix, const char* fmt, va_list args) {
        static char formatBuffer[2048];
        size_t      n = 0;
        writeTimestamp(*sFileOut);
        writeHeader(kLevels[(int)level], _name, *sFileOut);
        if ( !prefix.empty() ) n = snprintf(formatBuffer, sizeof(formatBuffer), "%s ", prefix.c_str());
        vsnprintf(&formatBuffer[n], sizeof(formatBuffer) - n, fmt, args);
        *sFileOut << formatBuffer << endl;
    }

    // The default logging callback writes to stderr.
    void LogDomain::defaultCallback(const LogDomain& domain, LogLevel level, const char* fmt, va_list args) {
        writeTimestamp(cerr);
        writeHeader(kLevels[(int)level], domain.name(), cerr);
        cerr.flush();
        vfprintf(stderr, fmt, args);
        fputc('\n', stderr);
    }

    unsigned LogDomain::registerObject(const void* object, const unsigned* val, const string& description,
                                       const string& nickname, LogLevel level) {
        unique_lock<mutex> lock(sLogMutex);
        if ( *val != 0 ) return *val;

        unsigned objRef = ++slastObjRef;
        sObjNames.emplace(objRef, nickname);
        if ( sCallback && level >= _callbackLogLevel() && level >= _level.load() ) {
            snprintf(sFormatBuffer, sizeof(sFormatBuffer), "{%s#%u}==> %s @%p", nickname.c_str(), objRef,
                     description.c_str(), object);
            invokeCallbackVerbatim(level);
        }
        return objRef;
    }

    void LogDomain::unregisterObject(unsigned objectRef) {
        unique_lock<mutex> lock(sLogMutex);
        sObjNames.erase(objectRef);
    }


#pragma mark - LOGGING CLASS:


    Logging::~Logging() {
        if ( _objectRef ) _domain.unregisterObject(_objectRef);
    }

    static std::string classNameOf(const Logging* obj) {
        const char* name = typeid(*obj).name();
#if defined(__linux__) || defined(__APPLE__)
        // Get the name of my class, unmangle it, and remove namespaces:
        size_t unmangledLen;
        int    status;
        char*  unmangled = abi::__cxa_demangle(name, nullptr, &unmangledLen, &status);
        if ( unmangled ) name = unmangled;
        string result(name);
        free(unmangled);
        return result;
#else
        return name;
#endif
    }

    std::string Logging::loggingName() const { return format("%s#%u", loggingClassName().c_str(), getObjectRef()); }

    std::string Logging::loggingClassName() const {
        string name  = classNameOf(this);
        auto   colon = name.find_last_of(':');
        if ( colon != string::npos ) name = name.substr(colon + 1);
        return name;
    }

    std::string Logging::loggingIdentifier() const { return format("%p", this); }

    unsigned Logging::getObjectRef(LogLevel level) const {
        if ( _objectRef == 0 ) {
            string nickname   = loggingClassName();
            string identifier = classNameOf(this) + " " + loggingIdentifier();
            _objectRef        = _domain.registerObject(this, &_objectRef, identifier, nickname, level);
        }
        return _objectRef;
    }

    void Logging::_log(LogLevel level, const char* format, ...) const {
        va_list args;
        va_start(args, format);
        _logv(level, format, args);
        va_end(args);
    }

    void Logging::_logv(LogLevel level, const char* format, va_list args) const {
        _domain.computeLevel();
        if ( _domain.willLog(level) ) _domain.vlog(level, this, true, format, args);
    }

}  // namespace synccore
