//
// ReplicatorTypes.hh
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
#include <cstdint>
#include <optional>

namespace synccore {

    /** The possible states of a replicator, ordered by progress. */
    enum class ActivityLevel : int32_t {
        Stopped,     ///< Finished, or got a fatal error.
        Offline,     ///< Connection failed, but waiting to retry.
        Connecting,  ///< Connection is in progress.
        Idle,        ///< Continuous replicator has caught up and is waiting for changes.
        Busy,        ///< Connected and actively working.
    };

    /** Names of the ActivityLevel values, indexed by level. */
    extern const char* const kActivityLevelNames[5];

    inline const char* nameOf(ActivityLevel level) { return kActivityLevelNames[int(level)]; }

    /** How to replicate, in either direction. */
    enum class ReplicatorMode : int32_t {
        Disabled,    // Do not allow this direction
        Passive,     // Allow peer to initiate this direction
        OneShot,     // Replicate, then stop
        Continuous,  // Keep replication active until stopped by application
    };

    /** Which directions a replicator transfers documents in. */
    enum class ReplicatorType : int32_t { PushAndPull, Push, Pull };

    inline bool isPush(ReplicatorType t) { return t != ReplicatorType::Pull; }

    inline bool isPull(ReplicatorType t) { return t != ReplicatorType::Push; }

    /** Progress of a replication session. `unitsCompleted` and `unitsTotal` are in arbitrary
        units; only their ratio is meaningful. */
    struct ReplicatorProgress {
        uint64_t unitsCompleted{0};
        uint64_t unitsTotal{0};
        uint64_t documentCount{0};

        bool operator==(const ReplicatorProgress&) const = default;
    };

    /** Current status of replication. A new immutable value is published on every change. */
    struct ReplicatorStatus {
        ActivityLevel            level{ActivityLevel::Stopped};
        ReplicatorProgress       progress;
        std::optional<SyncError> error;

        ReplicatorStatus() = default;

        ReplicatorStatus(ActivityLevel lv, ReplicatorProgress p = {}, std::optional<SyncError> err = std::nullopt)
            : level(lv), progress(p), error(std::move(err)) {}

        std::string description() const;
    };

    //---- Option keys of the Fleece dictionary produced by ReplicatorOptions::encode():

#define kReplicatorOptionDocIDs         "docIDs"        ///< Docs to replicate (string[])
#define kReplicatorOptionChannels       "channels"      ///< SG channel names (string[])
#define kReplicatorOptionFilter         "filter"        ///< Pull filter name (string)
#define kReplicatorOptionFilterParams   "filterParams"  ///< Pull filter params (Dict[string])
#define kReplicatorOptionPinnedCert     "pinnedCert"    ///< Cert or public key (data)
#define kReplicatorOptionExtraHeaders   "headers"       ///< Extra HTTP headers (Dict[string])
#define kReplicatorOptionCookies        "cookies"       ///< HTTP Cookie header value (string)
#define kReplicatorOptionAuthentication "auth"          ///< Auth settings (Dict); see below
#define kReplicatorOptionHeartbeat      "heartbeat"     ///< Interval in secs to send a keepalive ping

    // Auth dictionary keys:
#define kReplicatorAuthType     "type"      ///< Auth type; see below (string)
#define kReplicatorAuthUserName "username"  ///< User name for basic auth (string)
#define kReplicatorAuthPassword "password"  ///< Password for basic auth (string)

    // auth.type values:
#define kReplicatorAuthTypeBasic "Basic"  ///< HTTP Basic (the default)

}  // namespace synccore
