//
// Timer.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "Timer.hh"
#include "Logging.hh"
#include "ThreadUtil.hh"
#include <condition_variable>
#include <exception>
#include <mutex>
#include <thread>

using namespace std;

namespace synccore::actor {

    /** Owns the schedule of pending Timers and the thread that fires them. */
    class Timer::Manager {
      public:
        Manager() : _thread([this] { run(); }) {}

        void schedule(Timer* timer, clock::time_point when) {
            unique_lock lock(_mutex);
            if ( timer->_destructing ) return;  // callback rescheduling a Timer that's being destructed
            remove(timer);
            timer->_entry     = _schedule.emplace(when, timer);
            timer->_scheduled = true;
            if ( timer->_entry == _schedule.begin() ) _changed.notify_one();
        }

        void cancel(Timer* timer) {
            unique_lock lock(_mutex);
            remove(timer);
        }

        void destructing(Timer* timer) {
            {
                unique_lock lock(_mutex);
                remove(timer);
                timer->_destructing = true;
            }
            // A Timer deleted by its own callback is on the timer thread, and mustn't wait for itself.
            if ( this_thread::get_id() != _thread.get_id() )
                while ( timer->_firing ) this_thread::sleep_for(100us);
        }

      private:
        // _mutex must be locked.
        void remove(Timer* timer) {
            if ( timer->_scheduled ) {
                _schedule.erase(timer->_entry);
                timer->_scheduled = false;
            }
        }

        void run() {
            SetThreadName("SyncCore Timer");
            unique_lock lock(_mutex);
            while ( true ) {
                if ( _schedule.empty() ) {
                    _changed.wait(lock);
                    continue;
                }
                auto next = _schedule.begin();
                if ( next->first > clock::now() ) {
                    _changed.wait_until(lock, next->first);
                    continue;
                }
                Timer* timer = next->second;
                remove(timer);
                timer->_firing = true;
                lock.unlock();
                fire(timer);
                lock.lock();
            }
        }

        // Called without the mutex, so the callback can reschedule its Timer.
        static void fire(Timer* timer) {
            try {
                timer->_callback();
            } catch ( const std::exception& x ) { LogError(ActorLog, "Timer callback threw %s", x.what()); }
            bool autoDelete = timer->_autoDelete;
            timer->_firing  = false;  // after this, a destructor on another thread may free the Timer
            if ( autoDelete ) delete timer;
        }

        Schedule                _schedule;
        mutex                   _mutex;
        condition_variable      _changed;  // Signaled when the earliest fire time moves up
        thread                  _thread;
    };

    // Never destructed, since Timers may be destructed during process exit.
    Timer::Manager& Timer::manager() {
        static auto* sManager = new Manager;
        return *sManager;
    }

    Timer::~Timer() { manager().destructing(this); }

    void Timer::fireAfter(duration d) { manager().schedule(this, clock::now() + d); }

    void Timer::stop() { manager().cancel(this); }

}  // namespace synccore::actor
