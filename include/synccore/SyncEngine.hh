//
// SyncEngine.hh
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
#include "synccore/ReplicatorConfiguration.hh"
#include "synccore/ReplicatorTypes.hh"
#include <functional>
#include <string>

namespace synccore {

    /** One live session of a sync engine, which transfers documents until it stops. */
    class EngineSession : public RefCounted {
      public:
        /// The session's current status.
        virtual ReplicatorStatus status() const = 0;

        /// Asks the session to stop. It reports `Stopped` through its status callback when done.
        virtual void stop() = 0;

        /// Releases the session's resources. No callbacks are made after this returns.
        virtual void terminate() = 0;
    };

    /** Callbacks from an EngineSession. They may be called on any thread. */
    struct EngineCallbacks {
        std::function<void(EngineSession*, const ReplicatorStatus&)> onStatusChanged;

        std::function<void(EngineSession*, bool pushing, const std::string& docID, const SyncError& error,
                           bool transient)>
                onDocumentError;
    };

    /** Parameters for creating an EngineSession. */
    struct SessionParameters {
        ReplicatorMode  push{ReplicatorMode::Disabled};
        ReplicatorMode  pull{ReplicatorMode::Disabled};
        alloc_slice     optionsDictFleece;  // Encoded ReplicatorOptions
        EngineCallbacks callbacks;
    };

    /** The component that actually transfers documents. SyncCore manages its sessions. */
    class SyncEngine {
      public:
        virtual ~SyncEngine() = default;

        /// Creates and starts a session. Throws an exception if it can't be created.
        /// The caller holds the database's lock.
        virtual Retained<EngineSession> createSession(Database& db, const Endpoint& endpoint,
                                                      const SessionParameters& params) = 0;
    };

}  // namespace synccore
