//
// Actor.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Actor.hh"
#include "Logging.hh"
#include <chrono>
#include <condition_variable>
#include <mutex>

using namespace std;

namespace synccore::actor {

    Actor::~Actor() { logStats(); }

    void Actor::caughtException(const std::exception& x) {
        warn("Caught exception in Actor %s: %s", actorName().c_str(), x.what());
    }

    void Actor::waitTillCaughtUp() {
        using namespace std::chrono_literals;
        mutex              mut;
        condition_variable cond;
        bool               finished = false;
        _mailbox.enqueue("Actor::waitTillCaughtUp", [&] {
            lock_guard<mutex> lock(mut);
            finished = true;
            // It's important to keep the mutex locked while calling notify_one. This ensures that
            // `waitTillCaughtUp` won't wake up and return, invalidating `cond`, before
            // notify_one is called on it.
            cond.notify_one();
        });

        unique_lock<mutex> lock(mut);
        while ( !finished ) {
            if ( cond.wait_for(lock, 2s) == cv_status::timeout )
                logVerbose("Actor %s still waiting to catch up...", actorName().c_str());
        }
    }

}  // namespace synccore::actor
