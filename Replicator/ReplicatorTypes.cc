//
// ReplicatorTypes.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "synccore/ReplicatorTypes.hh"
#include "StringUtil.hh"

namespace synccore {

    const char* const kActivityLevelNames[5] = {"stopped", "offline", "connecting", "idle", "busy"};

    std::string ReplicatorStatus::description() const {
        std::string desc = format("%s, progress=%llu/%llu, docs=%llu", nameOf(level),
                                  (unsigned long long)progress.unitsCompleted, (unsigned long long)progress.unitsTotal,
                                  (unsigned long long)progress.documentCount);
        if ( error ) desc += ", error=" + error->description();
        return desc;
    }

}  // namespace synccore
