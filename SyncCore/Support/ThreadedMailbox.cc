//
// ThreadedMailbox.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ThreadedMailbox.hh"
#include "Actor.hh"
#include "Error.hh"
#include "Logging.hh"
#include "ThreadUtil.hh"
#include "Timer.hh"
#include <algorithm>
#include <cstdio>

using namespace std;

namespace synccore::actor {

#pragma mark - SCHEDULER:


    Scheduler* Scheduler::sharedScheduler() {
        static Scheduler* sScheduler = [] {
            auto s = new Scheduler;
            s->start();
            return s;
        }();
        return sScheduler;
    }

    void Scheduler::start() {
        if ( !_started.test_and_set() ) {
            if ( _numThreads == 0 ) {
                _numThreads = thread::hardware_concurrency();
                if ( _numThreads == 0 ) _numThreads = 2;
            }
            LogTo(ActorLog, "Starting Scheduler<%p> with %u threads", this, _numThreads);
            for ( unsigned id = 1; id <= _numThreads; id++ ) _threadPool.emplace_back([this, id] { task(id); });
        }
    }

    void Scheduler::task(unsigned taskID) {
        LogVerbose(ActorLog, "   task %u starting", taskID);
        char name[32];
        snprintf(name, sizeof(name), "SyncCore Sched#%u", taskID);
        SetThreadName(name);
        // The shared Scheduler lives as long as the process, so its threads never exit.
        while ( true ) {
            ThreadedMailbox* mailbox = _queue.pop();
            LogDebug(ActorLog, "   task %u calling Actor<%p>", taskID, mailbox);
            mailbox->performNextMessage();
        }
    }

    void Scheduler::schedule(ThreadedMailbox* mbox) { sharedScheduler()->_queue.push(mbox); }

#pragma mark - MAILBOX:


    thread_local Actor* ThreadedMailbox::sCurrentActor;

    ThreadedMailbox::ThreadedMailbox(Actor* a, const std::string& name) : _actor(a), _name(name) {
        Scheduler::sharedScheduler();
    }

    void ThreadedMailbox::enqueue(const char* name, std::function<void()> f) {
        fleece::retain(_actor);
        auto wrappedBlock = [this, f = std::move(f), name] { safelyCall(f, name); };
        if ( push(std::move(wrappedBlock)) ) reschedule();
    }

    void ThreadedMailbox::enqueueAfter(delay_t delay, const char* name, std::function<void()> f) {
        if ( delay <= delay_t::zero() ) return enqueue(name, std::move(f));

        ++_delayedEventCount;
        fleece::retain(_actor);
        auto timer = new Timer([this, f = std::move(f), name] {
            auto wrappedBlock = [this, f, name] {
                --_delayedEventCount;
                safelyCall(f, name);
                fleece::release(_actor);  // For enqueueAfter's retain call
            };
            // The pushed block gets its own retain, released by performNextMessage:
            fleece::retain(_actor);
            if ( push(std::move(wrappedBlock)) ) reschedule();
        });
        timer->autoDelete();
        timer->fireAfter(chrono::duration_cast<Timer::duration>(delay));
    }

    void ThreadedMailbox::safelyCall(const std::function<void()>& f, const char* name) const {
        try {
            f();
        } catch ( std::exception& x ) {
            LogVerbose(ActorLog, "%s: exception in %s", _actor->actorName().c_str(), name ? name : "?");
            _actor->caughtException(x);
        }
    }

    void ThreadedMailbox::reschedule() { Scheduler::schedule(this); }

    void ThreadedMailbox::performNextMessage() {
        DebugAssert(++_active == 1);  // Fail-safe check to detect 'impossible' re-entrant call
        sCurrentActor = _actor;
        // The message stays queued while it runs, so concurrent enqueues don't reschedule me.
        auto fn = front();
        fn();
        sCurrentActor = nullptr;
        DebugAssert(--_active == 0);

        ++_callCount;
        _maxEventCount = max(_maxEventCount, eventCount());

        bool   empty = dropFront();
        Actor* actor = _actor;
        if ( !empty ) reschedule();
        fleece::release(actor);  // For enqueue's retain call; may delete the Actor and me
    }

    void ThreadedMailbox::logStats() const {
        LogVerbose(ActorLog, "%s handled %u events; max queue depth was %u", _actor->actorName().c_str(), _callCount,
                   _maxEventCount);
    }

}  // namespace synccore::actor
