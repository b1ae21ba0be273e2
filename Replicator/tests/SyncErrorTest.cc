//
// SyncErrorTest.cc
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
#include "synccore/SyncError.hh"
#include <stdexcept>
#include <system_error>

using namespace std;


TEST_CASE("SyncError description", "[Error]") {
    CHECK(SyncError().description() == "No error");
    CHECK(SyncError(error::WebSocket, 503, "Service down").description() == "WebSocket error 503, \"Service down\"");
    // Uses the default message for the code if there isn't one:
    auto desc = SyncError(error::SyncCore, error::NotFound).description();
    CHECK(desc.find("SyncCore error 4, \"") == 0);
    CHECK(desc.size() > 20);
}


TEST_CASE("SyncError from exceptions", "[Error]") {
    SECTION("synccore::error") {
        SyncError err = SyncError::fromException(error(error::Network, websocket::kNetErrUnknownHost, "no such host"));
        CHECK(err.domain == error::Network);
        CHECK(err.code == websocket::kNetErrUnknownHost);
        CHECK(err.message == "no such host");
    }
    SECTION("system_error") {
        SyncError err = SyncError::fromException(system_error(ECONNRESET, generic_category()));
        CHECK(err.domain == error::POSIX);
        CHECK(err.code == ECONNRESET);
        CHECK(err.mayBeTransient());
    }
    SECTION("invalid_argument") {
        SyncError err = SyncError::fromException(invalid_argument("bad"));
        CHECK(err == SyncError(error::SyncCore, error::InvalidParameter));
    }
    SECTION("current exception") {
        try {
            throw error(error::WebSocket, 401);
        } catch ( ... ) {
            SyncError err = SyncError::fromCurrentException();
            CHECK(err == SyncError(error::WebSocket, 401));
        }
    }
}


TEST_CASE("SyncError raise", "[Error]") {
    ExpectException(error::WebSocket, 404, [] { SyncError(error::WebSocket, 404, "Not found").raise(); });
    ExpectException(error::POSIX, EPIPE, [] { SyncError(error::POSIX, EPIPE).raise(); });
}
