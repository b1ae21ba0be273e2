//
// Actor.hh
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
#include "ThreadedMailbox.hh"
#include "Error.hh"
#include "Logging.hh"
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace synccore::actor {

    using Mailbox = ThreadedMailbox;

#define FUNCTION_TO_QUEUE(METHOD) #METHOD, &METHOD

    /** Abstract base actor class. Subclasses should implement their public methods as calls to
        `enqueue` that pass the parameter values through, and name a matching private
        implementation method; for example:
            class Adder : public Actor {
                public:  void add(int a, bool clear)  {enqueue(FUNCTION_TO_QUEUE(Adder::_add), a, clear);}
                private: void _add(int a, bool clear) {... actual implementation...}
            };
        The public method will return immediately; the private one will be called later (on
        a thread belonging to the Scheduler). It is guaranteed that only one enqueued
        method call will be run at once, so the Actor implementation is effectively single-
        threaded. */
    class Actor
        : public RefCounted
        , public Logging {
      public:
        unsigned eventCount() const { return _mailbox.eventCount(); }

        std::string actorName() const { return _mailbox.name(); }

        /** The Actor that's currently running on this thread, else nullptr */
        static Actor* currentActor() { return Mailbox::currentActor(); }

        /** Blocks until the Actor has finished handling all outstanding events.
            The actor should never call this on itself, nor should it be called by
            anything else that might be called directly by the actor (on its thread.) */
        void waitTillCaughtUp();

      protected:
        /** Constructs an Actor.
            @param domain The domain which this actor is logged to.
            @param name  Used for logging; otherwise unimportant. */
        explicit Actor(LogDomain& domain, const std::string& name = "") : Logging(domain), _mailbox(this, name) {}

        ~Actor() override;

        /** Schedules a call to a method. */
        template <class Rcvr, class... Args, class... CallArgs>
        void enqueue(const char* methodName, void (Rcvr::*fn)(Args...), CallArgs&&... args) {
            _mailbox.enqueue(methodName, std::bind(fn, (Rcvr*)this, std::forward<CallArgs>(args)...));
        }

        /** Schedules a call to a method, after a delay.
            Other calls scheduled after this one may end up running before it! */
        template <class Rcvr, class... Args, class... CallArgs>
        void enqueueAfter(delay_t delay, const char* methodName, void (Rcvr::*fn)(Args...), CallArgs&&... args) {
            _mailbox.enqueueAfter(delay, methodName, std::bind(fn, (Rcvr*)this, std::forward<CallArgs>(args)...));
        }

        /** Runs a function on the actor's queue and blocks until it's finished, returning its
            result. An exception thrown by the function is rethrown to the caller.
            Calling this from the actor's own queue would deadlock, so it throws instead. */
        template <class LAMBDA>
        auto enqueueSync(const char* methodName, LAMBDA fn) -> decltype(fn()) {
            using Result = decltype(fn());
            if ( currentActor() == this )
                error::_throw(error::UnsupportedOperation, "%s called reentrantly on %s's own queue", methodName,
                              actorName().c_str());
            auto promise = std::make_shared<std::promise<Result>>();
            auto future  = promise->get_future();
            _mailbox.enqueue(methodName, [promise, fn]() mutable {
                try {
                    if constexpr ( std::is_void_v<Result> ) {
                        fn();
                        promise->set_value();
                    } else {
                        promise->set_value(fn());
                    }
                } catch ( ... ) {
                    // Handed to the waiting caller, which rethrows it:
                    promise->set_exception(std::current_exception());
                }
            });
            return future.get();
        }

        virtual void caughtException(const std::exception& x);

        std::string loggingIdentifier() const override { return actorName(); }

        void logStats() const { _mailbox.logStats(); }

      private:
        friend class ThreadedMailbox;

        Mailbox _mailbox;
    };

}  // namespace synccore::actor
