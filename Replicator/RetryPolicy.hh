//
// RetryPolicy.hh
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
#include "synccore/SyncError.hh"
#include <chrono>

namespace synccore::repl {

    /** How a session-ending error should be treated. */
    enum class ErrorClass {
        Permanent,         // Don't retry
        Transient,         // Retry after a delay
        NetworkDependent,  // Retry when the network changes
    };

    const char* nameOf(ErrorClass);

    /** Decides whether and when a Replicator retries after its session stops with an error.
        All methods are pure functions. */
    class RetryPolicy {
      public:
        /// Classifies an error. An error that is both transient and network-dependent
        /// (like a DNS failure or ETIMEDOUT) is Transient.
        static ErrorClass classify(const SyncError&) noexcept;

        /// True if a session that failed with an error of this class should be restarted.
        /// `attemptCount` is the number of retries already made.
        static bool isRetryable(ErrorClass, bool continuous, unsigned attemptCount) noexcept;

        /// True if the Replicator should watch for the network becoming reachable after this error.
        static bool shouldWatchNetwork(const SyncError&, bool continuous) noexcept;

        /// The delay before retry number `attemptCount` (1-based): 2^attemptCount seconds,
        /// up to a maximum of 10 minutes.
        static std::chrono::seconds delay(unsigned attemptCount) noexcept;
    };

}  // namespace synccore::repl
