//
// Database.hh
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
#include "synccore/Base.hh"
#include <mutex>
#include <set>

namespace synccore {
    class Replicator;

    /** The two conflicting revisions of a document, as handed to a ConflictResolver. */
    struct Conflict {
        std::string docID;
        alloc_slice localBody;   // Fleece-encoded; null if deleted locally
        alloc_slice remoteBody;  // Fleece-encoded; null if deleted remotely
    };

    /** A strategy for resolving a document conflict found while pulling. */
    class ConflictResolver {
      public:
        virtual ~ConflictResolver() = default;

        /// Returns the merged document body, or a null slice to delete the document.
        virtual alloc_slice resolve(const Conflict&) = 0;
    };

    /** The local database a Replicator works with. SyncCore does not implement storage; a
        concrete subclass supplies conflict resolution, and this class supplies the database
        lock and the set of replicators currently running against it. */
    class Database : public RefCounted {
      public:
        explicit Database(std::string name) : _name(std::move(name)) {}

        const std::string& name() const { return _name; }

        /// Resolves a conflict in document `docID` using `resolver`.
        /// Called on a Replicator's queue; may throw.
        virtual void resolveConflict(const std::string& docID, ConflictResolver* resolver) = 0;

        /// Calls `fn` while holding the database's lock, and returns its result.
        template <class LAMBDA>
        auto useLocked(LAMBDA fn) -> decltype(fn()) {
            std::unique_lock lock(_mutex);
            return fn();
        }

        //---- The set of active replicators:

        void   addActiveReplicator(Replicator*);
        void   removeActiveReplicator(Replicator*);
        bool   hasActiveReplicator(const Replicator*) const;
        size_t activeReplicatorCount() const;

      protected:
        ~Database() override;

      private:
        std::string const          _name;
        std::recursive_mutex       _mutex;
        mutable std::mutex         _activeMutex;
        std::set<const Replicator*> _activeReplicators;  // Not retained; each removes itself when stopped
    };

}  // namespace synccore
