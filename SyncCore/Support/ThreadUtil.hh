//
// ThreadUtil.hh
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
#include <pthread.h>
#include <string>

namespace synccore {

    /** Names the current thread, for debuggers and crash reports. Linux truncates names to 15 chars. */
    static inline void SetThreadName(const char* name) {
#ifdef __APPLE__
        pthread_setname_np(name);
#else
        std::string truncated(name);
        if ( truncated.size() > 15 ) truncated.resize(15);
        pthread_setname_np(pthread_self(), truncated.c_str());
#endif
    }

    /** Returns the current thread's name, or an empty string. */
    static inline std::string GetThreadName() {
        char name[64] = {};
        pthread_getname_np(pthread_self(), name, sizeof(name));
        return name;
    }

}  // namespace synccore
