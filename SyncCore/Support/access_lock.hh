//
// access_lock.hh
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
#include <mutex>
#include <utility>

namespace synccore {

    /** A wrapper that protects a value from concurrent access.
        The value is only accessible through a callback, and an internal mutex prevents
        multiple callbacks from running at once. */
    template <class T, class MUTEX = std::mutex>
    class access_lock {
      public:
        access_lock() : _contents() {}

        explicit access_lock(T&& contents) : _contents(std::move(contents)) {}

        /** Calls `callback` with a reference to the value, while holding the mutex,
            and returns whatever the callback returns. */
        template <class LAMBDA>
        auto use(LAMBDA callback) {
            std::lock_guard<MUTEX> lock(_mutex);
            return callback(_contents);
        }

        template <class LAMBDA>
        auto use(LAMBDA callback) const {
            std::lock_guard<MUTEX> lock(_mutex);
            return callback(static_cast<const T&>(_contents));
        }

        /** Returns a copy of the value. */
        T get() const {
            std::lock_guard<MUTEX> lock(_mutex);
            return _contents;
        }

        /** Replaces the value. */
        void set(T value) {
            std::lock_guard<MUTEX> lock(_mutex);
            _contents = std::move(value);
        }

      private:
        T             _contents;
        mutable MUTEX _mutex;
    };

}  // namespace synccore
