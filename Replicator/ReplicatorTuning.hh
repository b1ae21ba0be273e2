//
// ReplicatorTuning.hh
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
#include <chrono>

namespace synccore::repl::tuning {
    using namespace std::chrono_literals;

    /* Constants governing how a Replicator recovers from errors. */

    // Number of times a one-shot replicator retries after a transient error before giving up.
    constexpr unsigned kMaxOneShotRetryCount = 2;

    // Longest possible retry delay. The delay doubles on each failed retry, starting at 2 sec.
    constexpr std::chrono::seconds kMaxRetryDelay = 10min;

    // The retry delay's exponent is clamped to this, so the shift can't overflow.
    constexpr unsigned kMaxRetryExponent = 30;

    // How often InterfaceReachability checks the host's network interfaces.
    constexpr std::chrono::milliseconds kReachabilityPollInterval = 2s;

}  // namespace synccore::repl::tuning
