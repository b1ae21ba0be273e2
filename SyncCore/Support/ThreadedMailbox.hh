//
// ThreadedMailbox.hh
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
#include "Channel.hh"
#include "fleece/RefCounted.hh"
#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace synccore::actor {
    using fleece::RefCounted;
    using fleece::Retained;

    class Scheduler;
    class Actor;

    /** A delay expressed in floating-point seconds */
    using delay_t = std::chrono::duration<double>;

    /** Actor mailbox that uses a thread pool run by a Scheduler. Messages are closures; they run
        one at a time, in the order they were enqueued, on whichever pool thread picks up the
        mailbox. */
    class ThreadedMailbox : Channel<std::function<void()>> {
      public:
        explicit ThreadedMailbox(Actor*, const std::string& name = "");

        const std::string& name() const { return _name; }

        unsigned eventCount() const { return (unsigned)size() + (unsigned)_delayedEventCount; }

        void enqueue(const char* name, std::function<void()>);
        void enqueueAfter(delay_t delay, const char* name, std::function<void()>);

        static Actor* currentActor() { return sCurrentActor; }

        void logStats() const;

      private:
        friend class Scheduler;

        void reschedule();
        void performNextMessage();
        void safelyCall(const std::function<void()>& f, const char* name) const;

        Actor* const      _actor;
        std::string const _name;

        std::atomic_int _delayedEventCount{0};
        std::atomic_int _active{0};
        unsigned        _callCount{0};
        unsigned        _maxEventCount{0};

        static thread_local Actor* sCurrentActor;
    };

    /** The Scheduler is reponsible for calling ThreadedMailboxes to run their Actor methods.
        It manages a thread pool on which Mailboxes and Actors will run. */
    class Scheduler {
      public:
        explicit Scheduler(unsigned numThreads = 0) : _numThreads(numThreads) {}

        /** Returns a per-process shared instance, already started. */
        static Scheduler* sharedScheduler();

        /** Starts the background threads that will run queued Actors. */
        void start();

      protected:
        friend class ThreadedMailbox;

        /** A request for an Actor's performNextMessage method to be called. */
        static void schedule(ThreadedMailbox* mbox);

      private:
        void task(unsigned taskID);

        unsigned                  _numThreads;
        Channel<ThreadedMailbox*> _queue;
        std::vector<std::thread>  _threadPool;
        std::atomic_flag          _started = ATOMIC_FLAG_INIT;
    };

}  // namespace synccore::actor
