//
// ActorTest.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "SyncCoreTest.hh"
#include "Actor.hh"
#include "Timer.hh"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace std;
using namespace synccore::actor;


class TestActor : public Actor {
  public:
    TestActor() : Actor(kSyncCore_DefaultLog, "TestActor") {}

    void append(int n) { enqueue(FUNCTION_TO_QUEUE(TestActor::_append), n); }

    void appendLater(delay_t delay, int n) { enqueueAfter(delay, FUNCTION_TO_QUEUE(TestActor::_append), n); }

    int sum() {
        return enqueueSync("TestActor::sum", [this] {
            CHECK(currentActor() == this);
            int total = 0;
            for ( int n : _items ) total += n;
            return total;
        });
    }

    void failSync() {
        enqueueSync("TestActor::failSync", [] { error::_throw(error::NotFound); });
    }

    // Calls enqueueSync from the actor's own queue, and records what happened.
    void reenter() { enqueue(FUNCTION_TO_QUEUE(TestActor::_reenter)); }

    void throwInQueue() { enqueue(FUNCTION_TO_QUEUE(TestActor::_throw)); }

    vector<int> items() {
        return enqueueSync("TestActor::items", [this] { return _items; });
    }

    atomic<int>  maxConcurrent{0};
    atomic<int>  wrongThread{0};
    atomic<bool> reentryThrew{false};
    atomic<int>  caughtExceptions{0};

  protected:
    void caughtException(const std::exception& x) override {
        ++caughtExceptions;
        Actor::caughtException(x);
    }

  private:
    void _append(int n) {
        if ( currentActor() != this ) ++wrongThread;
        int now = ++_running;
        if ( now > maxConcurrent ) maxConcurrent = now;
        this_thread::sleep_for(1ms);
        _items.push_back(n);
        --_running;
    }

    void _reenter() {
        try {
            (void)sum();
        } catch ( const error& x ) {
            if ( x == error::UnsupportedOperation ) reentryThrew = true;
        }
    }

    void _throw() { error::_throw(error::Conflict, "oops"); }

    vector<int> _items;
    atomic<int> _running{0};
};


TEST_CASE_METHOD(TestFixture, "Actor runs commands in order", "[Actor]") {
    auto actor = make_retained<TestActor>();
    for ( int i = 0; i < 100; ++i ) actor->append(i);
    actor->waitTillCaughtUp();
    auto items = actor->items();
    REQUIRE(items.size() == 100);
    for ( int i = 0; i < 100; ++i ) CHECK(items[i] == i);
    CHECK(actor->maxConcurrent == 1);
    CHECK(actor->wrongThread == 0);
    CHECK(Actor::currentActor() == nullptr);
}


TEST_CASE_METHOD(TestFixture, "Actor commands from many threads never overlap", "[Actor]") {
    auto           actor = make_retained<TestActor>();
    vector<thread> threads;
    for ( int t = 0; t < 4; ++t ) {
        threads.emplace_back([&actor, t] {
            for ( int i = 0; i < 25; ++i ) actor->append(t * 100 + i);
        });
    }
    for ( auto& t : threads ) t.join();
    actor->waitTillCaughtUp();
    CHECK(actor->items().size() == 100);
    CHECK(actor->maxConcurrent == 1);
}


TEST_CASE_METHOD(TestFixture, "Actor enqueueSync", "[Actor]") {
    auto actor = make_retained<TestActor>();
    actor->append(3);
    actor->append(4);
    // The synchronous command runs after the ones already enqueued:
    CHECK(actor->sum() == 7);

    SECTION("Exception is rethrown to the caller") {
        ExpectException(error::SyncCore, error::NotFound, [&] { actor->failSync(); });
    }

    SECTION("Reentrant call throws instead of deadlocking") {
        ExpectingExceptions x;
        actor->reenter();
        actor->waitTillCaughtUp();
        CHECK(actor->reentryThrew);
    }
}


TEST_CASE_METHOD(TestFixture, "Actor enqueueAfter", "[Actor]") {
    auto actor = make_retained<TestActor>();
    auto start = Timer::clock::now();
    actor->appendLater(200ms, 2);
    actor->append(1);
    CHECK(actor->items() == vector<int>{1});
    REQUIRE_BEFORE(5s, actor->items().size() == 2);
    CHECK(Timer::clock::now() - start >= 200ms);
    CHECK(actor->items() == (vector<int>{1, 2}));
}


TEST_CASE_METHOD(TestFixture, "Actor catches exceptions", "[Actor]") {
    auto actor = make_retained<TestActor>();
    {
        ExpectingExceptions x;
        actor->throwInQueue();
        actor->append(5);
        actor->waitTillCaughtUp();
    }
    CHECK(actor->caughtExceptions == 1);
    // The queue keeps running after the exception:
    CHECK(actor->items() == vector<int>{5});
}


TEST_CASE("Timer", "[Timer]") {
    atomic<int> fired{0};
    Timer       timer([&] { ++fired; });

    SECTION("Fires once") {
        timer.fireAfter(50ms);
        CHECK_BEFORE(2s, fired == 1);
        this_thread::sleep_for(100ms);
        CHECK(fired == 1);
    }

    SECTION("Stopped before firing") {
        timer.fireAfter(200ms);
        timer.stop();
        this_thread::sleep_for(300ms);
        CHECK(fired == 0);
    }

    SECTION("Rescheduling replaces the fire time") {
        timer.fireAfter(10s);
        timer.fireAfter(20ms);
        CHECK_BEFORE(2s, fired == 1);
        this_thread::sleep_for(100ms);
        CHECK(fired == 1);
    }
}


TEST_CASE("Timer reschedules itself", "[Timer]") {
    atomic<int> fired{0};
    Timer*      timerPtr = nullptr;
    Timer       timer([&] {
        if ( ++fired < 3 ) timerPtr->fireAfter(10ms);
    });
    timerPtr = &timer;
    timer.fireAfter(10ms);
    CHECK_BEFORE(2s, fired == 3);
    this_thread::sleep_for(100ms);
    CHECK(fired == 3);
}


TEST_CASE("Timer auto-delete", "[Timer]") {
    atomic<int> fired{0};
    auto        timer = new Timer([&] { ++fired; });
    timer->autoDelete();
    timer->fireAfter(10ms);
    CHECK_BEFORE(2s, fired == 1);
}


TEST_CASE("Timer destructed while firing", "[Timer]") {
    atomic<bool> entered{false}, finished{false};
    {
        Timer timer([&] {
            entered = true;
            this_thread::sleep_for(100ms);
            finished = true;
        });
        timer.fireAfter(0ms);
        CHECK_BEFORE(2s, entered);
    }
    // The destructor waited for the callback:
    CHECK(finished);
}
