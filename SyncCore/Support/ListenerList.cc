//
// ListenerList.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ListenerList.hh"
#include "Error.hh"
#include "Logging.hh"

namespace synccore {

    ListenerListBase::~ListenerListBase() {
        if ( _iterating ) WarnError("ListenerList being destructed during notification");
    }

    void ListenerListBase::warnListenerException() noexcept {
        error e = error::convertCurrentException();
        Warn("Caught exception from a listener: %s", e.what());
    }

    void ListenerListBase::beginIteration() {
        Assert(!_iterating, "Illegal reentrant notification of ListenerList");
        _iterating = true;
    }

}  // namespace synccore
