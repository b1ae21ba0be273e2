//
// SyncCoreTest.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "SyncCoreTest.hh"
#include <atomic>
#include <mutex>
#include <thread>

using namespace std;


void InitTestLogging() {
    static once_flag once;
    call_once(once, [] {
        error::sWarnOnError = true;
        Log("This is SyncCore %s", SYNCCORE_VERSION_STRING);
    });
}


#pragma mark - EXCEPTIONS:


static atomic_int sExpectExceptions;

ExpectingExceptions::ExpectingExceptions() {
    ++sExpectExceptions;
    error::sWarnOnError = false;
}

ExpectingExceptions::~ExpectingExceptions() {
    if ( --sExpectExceptions == 0 ) error::sWarnOnError = true;
}

void ExpectException(error::Domain domain, int code, const std::function<void()>& lambda) {
    try {
        ExpectingExceptions x;
        Log("NOTE: Expecting an exception to be thrown...");
        lambda();
    } catch ( std::runtime_error& x ) {
        Log("... caught exception %s", x.what());
        error err = error::convertRuntimeError(x);
        CHECK(err.domain == domain);
        CHECK(err.code == code);
        return;
    }
    FAIL("Should have thrown an exception");
}


#pragma mark - MISC.:


bool WaitUntil(chrono::milliseconds timeout, fleece::function_ref<bool()> predicate) {
    auto deadline = chrono::steady_clock::now() + timeout;
    do {
        if ( predicate() ) return true;
        this_thread::sleep_for(50ms);
    } while ( chrono::steady_clock::now() < deadline );

    return false;
}


#pragma mark - TESTFIXTURE:


static LogDomain::Callback_t sPrevCallback;
static atomic_uint           sWarningsLogged;

static void logCallback(const LogDomain& domain, LogLevel level, const char* fmt, va_list args) {
    if ( level >= LogLevel::Warning ) { ++sWarningsLogged; }
    sPrevCallback(domain, level, fmt, args);
}

static unsigned initFixture() {
    static once_flag once;
    call_once(once, [] {
        InitTestLogging();
        sPrevCallback = LogDomain::currentCallback();
        LogDomain::setCallback(&logCallback, false);
    });
    return sWarningsLogged;
}

TestFixture::TestFixture() : _warningsAlreadyLogged(initFixture()) {}

unsigned TestFixture::warningsLogged() const noexcept { return sWarningsLogged - _warningsAlreadyLogged; }
