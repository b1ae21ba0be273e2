//
// Replicator.hh
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
#include "synccore/NetworkReachability.hh"
#include "synccore/ReplicatorConfiguration.hh"
#include "synccore/SyncEngine.hh"
#include "Actor.hh"
#include "ListenerList.hh"
#include "access_lock.hh"
#include <functional>
#include <memory>

namespace synccore {
    namespace repl {
        class ReachabilityObserver;
    }

    /** Runs functions on some thread or queue chosen by the application. */
    class ExecutionContext {
      public:
        virtual ~ExecutionContext() = default;
        virtual void dispatch(std::function<void()>) = 0;
    };

    /** Manages a replication between a local Database and an Endpoint. The actual transfer is
        done by sessions of a SyncEngine; the Replicator starts them, retries when they fail
        with recoverable errors, and publishes their status to listeners.

        All state changes happen on the Replicator's own queue, so its public methods may be
        called on any thread. They must not be called from a change listener, except for
        `status`, `config`, `removeChangeListener` and `dispose`. */
    class Replicator : public actor::Actor {
      public:
        using ChangeListener = std::function<void(Replicator*, const ReplicatorStatus&)>;

        /// Creates a Replicator. The configuration is copied.
        /// @param config  The configuration; throws `InvalidParameter` if it isn't valid.
        /// @param engine  The sync engine that will run sessions.
        /// @param reachabilityFactory  Creates network monitors; if null, uses InterfaceReachability.
        Replicator(const ReplicatorConfiguration& config, std::shared_ptr<SyncEngine> engine,
                   ReachabilityFactory reachabilityFactory = nullptr);

        /// Starts replicating. Does nothing if a session is already running.
        /// Throws `NotOpen` if the Replicator has been disposed.
        void start();

        /// Asks the current session to stop; the `Stopped` status arrives asynchronously.
        /// Throws `NotOpen` if the Replicator has been disposed.
        void stop();

        /// Stops the session if necessary and releases all resources. If the Replicator isn't
        /// stopped, listeners are notified of a final `Stopped` status. Safe to call repeatedly.
        /// When called from a change listener it returns at once, and disposal happens after
        /// the listener returns.
        void dispose();

        /// Registers a listener for status changes. If `context` is given, the listener is
        /// invoked through it; otherwise it's called on the Replicator's queue.
        ListenerToken addChangeListener(ChangeListener, std::shared_ptr<ExecutionContext> context = nullptr);

        /// Unregisters a listener. Unknown tokens are ignored.
        void removeChangeListener(ListenerToken);

        /// The most recently published status.
        ReplicatorStatus status() const { return _status.get(); }

        /// A copy of the configuration.
        ReplicatorConfiguration config() const { return _config; }

        /// Describes the replicator as `Replicator[<*> target]`, where `<` means pull,
        /// `*` continuous and `>` push.
        const std::string& description() const { return _description; }

      protected:
        ~Replicator() override;

        std::string loggingIdentifier() const override { return _description; }

        /// The delay before retry number `attempt`.
        virtual actor::delay_t retryDelay(unsigned attempt) const;

      private:
        void _start();
        void _stop();
        void _dispose();
        void _retry();
        void _networkReachable();
        void _sessionStatusChanged(Retained<EngineSession>, ReplicatorStatus);
        void _documentError(Retained<EngineSession>, bool pushing, std::string docID, SyncError, bool transient);

        void startSession();
        void handleStatus(ReplicatorStatus);
        bool handleError(const SyncError&);
        void publish(const ReplicatorStatus&);
        void clearSession();
        void armReachability();
        void disarmReachability();
        bool canRestart() const;

        ReplicatorConfiguration const     _config;
        std::shared_ptr<SyncEngine> const _engine;
        ReachabilityFactory const         _reachabilityFactory;
        std::string const                 _description;

        // These are only accessed on the queue:
        ReplicatorOptions                           _sessionOptions;  // Authenticated & frozen options
        Retained<EngineSession>                     _session;         // Current engine session, if any
        unsigned                                    _attemptCount{0};
        std::unique_ptr<repl::ReachabilityObserver> _reachability;
        ActivityLevel                               _level{ActivityLevel::Stopped};
        bool                                        _stopRequested{false};  // stop() was called on a session
        bool                                        _disposed{false};
        Retained<Replicator>                        _selfRetain;  // Keeps me alive while active

        access_lock<ReplicatorStatus>                      _status;  // Published status
        ListenerList<Replicator*, const ReplicatorStatus&> _listeners;
    };

}  // namespace synccore
