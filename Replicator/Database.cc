//
// Database.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "synccore/Database.hh"
#include "Logging.hh"

namespace synccore {

    Database::~Database() {
        if ( !_activeReplicators.empty() )
            WarnError("Database '%s' destructed with %zu active replicators", _name.c_str(),
                      _activeReplicators.size());
    }

    void Database::addActiveReplicator(Replicator* repl) {
        std::unique_lock lock(_activeMutex);
        _activeReplicators.insert(repl);
    }

    void Database::removeActiveReplicator(Replicator* repl) {
        std::unique_lock lock(_activeMutex);
        _activeReplicators.erase(repl);
    }

    bool Database::hasActiveReplicator(const Replicator* repl) const {
        std::unique_lock lock(_activeMutex);
        return _activeReplicators.count(repl) > 0;
    }

    size_t Database::activeReplicatorCount() const {
        std::unique_lock lock(_activeMutex);
        return _activeReplicators.size();
    }

}  // namespace synccore
