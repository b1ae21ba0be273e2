//
// ReplicatorTestFakes.hh
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
#include "synccore/Replicator.hh"
#include "synccore/SyncEngine.hh"
#include "synccore/NetworkReachability.hh"
#include <atomic>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace synccore::test {

    /** A Database that records conflict-resolution requests. */
    class FakeDatabase final : public Database {
      public:
        explicit FakeDatabase(std::string name = "local") : Database(std::move(name)) {}

        void resolveConflict(const std::string& docID, ConflictResolver* resolver) override;

        struct Resolution {
            std::string       docID;
            ConflictResolver* resolver;
        };

        std::vector<Resolution> resolutions() const;

        std::atomic<bool> failResolution{false};  // If true, resolveConflict throws

      private:
        mutable std::mutex      _mutex;
        std::vector<Resolution> _resolutions;
    };

    /** A ConflictResolver that's never actually called. */
    class FakeResolver final : public ConflictResolver {
      public:
        alloc_slice resolve(const Conflict& c) override { return c.remoteBody; }
    };

    /** An engine session driven by the test. */
    class FakeSession final : public EngineSession {
      public:
        explicit FakeSession(SessionParameters params) : params(std::move(params)) {}

        ReplicatorStatus status() const override;
        void             stop() override;
        void             terminate() override;

        /// Reports a new status to the Replicator.
        void report(ReplicatorStatus);

        void report(ActivityLevel level) { report(ReplicatorStatus(level)); }

        void reportError(SyncError err) { report(ReplicatorStatus(ActivityLevel::Stopped, {}, std::move(err))); }

        void reportDocError(bool pushing, const std::string& docID, const SyncError&, bool transient = false);

        SessionParameters const  params;
        std::optional<SyncError> stopError;  // If set, the session stops with this error
        std::atomic<int>         stopCalls{0};
        std::atomic<int>         terminateCalls{0};

      private:
        mutable std::mutex _mutex;
        ReplicatorStatus   _status{ActivityLevel::Connecting};
    };

    /** A SyncEngine that creates FakeSessions. */
    class FakeSyncEngine final : public SyncEngine {
      public:
        Retained<EngineSession> createSession(Database& db, const Endpoint& endpoint,
                                              const SessionParameters& params) override;

        size_t                sessionCount() const;
        Retained<FakeSession> session(size_t index) const;
        Retained<FakeSession> lastSession() const;

        /// If set, createSession throws this error.
        void failCreation(std::optional<SyncError> err);

        /// If set, each new session immediately fails with this error.
        void failSessions(std::optional<SyncError> err);

      private:
        mutable std::mutex                 _mutex;
        std::vector<Retained<FakeSession>> _sessions;
        std::optional<SyncError>           _createError;
        std::optional<SyncError>           _sessionError;
    };

    /** Shared state of the FakeReachability monitors created by a factory. */
    class FakeReachabilityHub : public std::enable_shared_from_this<FakeReachabilityHub> {
      public:
        /// A ReachabilityFactory that creates monitors connected to this hub.
        ReachabilityFactory factory();

        /// Tells the running monitor (if any) that the network's reachability changed.
        /// Returns false if no monitor is running.
        bool setReachable(bool reachable);

        bool running() const;

        std::atomic<int> created{0};
        std::atomic<int> started{0};
        std::atomic<int> stopped{0};

      private:
        friend class FakeReachability;

        mutable std::mutex            _mutex;
        NetworkReachability::Callback _runningCallback;
    };

    /** An ExecutionContext that queues functions until the test runs them. */
    class ManualExecutionContext final : public ExecutionContext {
      public:
        void   dispatch(std::function<void()>) override;
        size_t pending() const;
        void   runAll();

      private:
        mutable std::mutex                _mutex;
        std::deque<std::function<void()>> _queue;
    };

    /** A Replicator whose retry delays are scaled down, and recorded. */
    class TestReplicator final : public Replicator {
      public:
        TestReplicator(const ReplicatorConfiguration& config, std::shared_ptr<SyncEngine> engine,
                       ReachabilityFactory factory, double delayScale)
            : Replicator(config, std::move(engine), std::move(factory)), _delayScale(delayScale) {}

        /// The unscaled delays requested so far, in order.
        std::vector<actor::delay_t> retryDelays() const;

      protected:
        actor::delay_t retryDelay(unsigned attempt) const override;

      private:
        double const                        _delayScale;
        mutable std::mutex                  _mutex;
        mutable std::vector<actor::delay_t> _delays;
    };

}  // namespace synccore::test
