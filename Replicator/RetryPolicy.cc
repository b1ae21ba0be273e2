//
// RetryPolicy.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "RetryPolicy.hh"
#include "ReplicatorTuning.hh"
#include <algorithm>

namespace synccore::repl {

    const char* nameOf(ErrorClass c) {
        static const char* const kNames[] = {"permanent", "transient", "network-dependent"};
        return kNames[int(c)];
    }

    ErrorClass RetryPolicy::classify(const SyncError& err) noexcept {
        if ( err.mayBeTransient() ) return ErrorClass::Transient;
        else if ( err.mayBeNetworkDependent() )
            return ErrorClass::NetworkDependent;
        else
            return ErrorClass::Permanent;
    }

    bool RetryPolicy::isRetryable(ErrorClass errClass, bool continuous, unsigned attemptCount) noexcept {
        switch ( errClass ) {
            case ErrorClass::Transient:
                return continuous || attemptCount < tuning::kMaxOneShotRetryCount;
            case ErrorClass::NetworkDependent:
                // A one-shot replicator doesn't wait around for the network to come back.
                return continuous;
            default:
                return false;
        }
    }

    bool RetryPolicy::shouldWatchNetwork(const SyncError& err, bool continuous) noexcept {
        return err.mayBeNetworkDependent() || (continuous && err.mayBeTransient());
    }

    std::chrono::seconds RetryPolicy::delay(unsigned attemptCount) noexcept {
        auto exponent = std::min(attemptCount, tuning::kMaxRetryExponent);
        return std::min(std::chrono::seconds(int64_t(1) << exponent), tuning::kMaxRetryDelay);
    }

}  // namespace synccore::repl
