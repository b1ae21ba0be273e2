//
// Timer.hh
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
#include <atomic>
#include <chrono>
#include <functional>
#include <map>

namespace synccore::actor {

    /** Calls a function after a delay, on a background thread shared by all Timers.
        Used for delayed Actor messages and for polling. */
    class Timer {
      public:
        using clock    = std::chrono::steady_clock;
        using duration = clock::duration;
        using callback = std::function<void()>;

        /** The callback runs on the timer thread, so it should return quickly. It may reschedule
            its own Timer. */
        explicit Timer(callback cb) : _callback(std::move(cb)) {}

        /** Cancels the Timer. If its callback is running on another thread, waits for it to return. */
        ~Timer();

        Timer(const Timer&)            = delete;
        Timer& operator=(const Timer&) = delete;

        /** Makes the Timer delete itself after it fires. */
        void autoDelete() { _autoDelete = true; }

        /** Schedules the callback, replacing any earlier schedule. */
        void fireAfter(duration);

        template <class Rep, class Period>
        void fireAfter(const std::chrono::duration<Rep, Period>& dur) {
            fireAfter(std::chrono::duration_cast<duration>(dur));
        }

        /** Cancels a scheduled callback. A callback that's already running isn't waited for. */
        void stop();

      private:
        class Manager;
        static Manager& manager();

        using Schedule = std::multimap<clock::time_point, Timer*>;

        callback           _callback;
        Schedule::iterator _entry;              // Position in the schedule, if _scheduled
        bool               _scheduled{false};   // Guarded by the Manager's mutex
        bool               _destructing{false}; // Guarded by the Manager's mutex
        std::atomic<bool>  _firing{false};      // True while the callback runs
        bool               _autoDelete{false};
    };

}  // namespace synccore::actor
