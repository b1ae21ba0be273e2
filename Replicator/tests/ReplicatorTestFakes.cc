//
// ReplicatorTestFakes.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ReplicatorTestFakes.hh"
#include "Error.hh"

using namespace std;

namespace synccore::test {

#pragma mark - DATABASE:

    void FakeDatabase::resolveConflict(const string& docID, ConflictResolver* resolver) {
        {
            unique_lock lock(_mutex);
            _resolutions.push_back({docID, resolver});
        }
        if ( failResolution ) throw error(error::SyncCore, error::UnexpectedError, "resolver failed");
    }

    vector<FakeDatabase::Resolution> FakeDatabase::resolutions() const {
        unique_lock lock(_mutex);
        return _resolutions;
    }

#pragma mark - SESSION:

    ReplicatorStatus FakeSession::status() const {
        unique_lock lock(_mutex);
        return _status;
    }

    void FakeSession::stop() {
        ++stopCalls;
        // Like a real engine, confirms asynchronously via the status callback:
        report(ReplicatorStatus(ActivityLevel::Stopped, status().progress, stopError));
    }

    void FakeSession::terminate() { ++terminateCalls; }

    void FakeSession::report(ReplicatorStatus status) {
        {
            unique_lock lock(_mutex);
            _status = status;
        }
        params.callbacks.onStatusChanged(this, status);
    }

    void FakeSession::reportDocError(bool pushing, const string& docID, const SyncError& err, bool transient) {
        params.callbacks.onDocumentError(this, pushing, docID, err, transient);
    }

#pragma mark - ENGINE:

    Retained<EngineSession> FakeSyncEngine::createSession(Database&, const Endpoint&, const SessionParameters& params) {
        unique_lock lock(_mutex);
        if ( _createError ) throw error(_createError->domain, _createError->code);
        auto session = make_retained<FakeSession>(params);
        _sessions.push_back(session);
        auto sessionError = _sessionError;
        lock.unlock();

        if ( sessionError ) {
            // Fails after the Replicator has seen the initial status:
            params.callbacks.onStatusChanged(session.get(), ReplicatorStatus(ActivityLevel::Stopped, {}, *sessionError));
        }
        return session;
    }

    void FakeSyncEngine::failCreation(optional<SyncError> err) {
        unique_lock lock(_mutex);
        _createError = std::move(err);
    }

    void FakeSyncEngine::failSessions(optional<SyncError> err) {
        unique_lock lock(_mutex);
        _sessionError = std::move(err);
    }

    size_t FakeSyncEngine::sessionCount() const {
        unique_lock lock(_mutex);
        return _sessions.size();
    }

    Retained<FakeSession> FakeSyncEngine::session(size_t index) const {
        unique_lock lock(_mutex);
        return index < _sessions.size() ? _sessions[index] : Retained<FakeSession>();
    }

    Retained<FakeSession> FakeSyncEngine::lastSession() const {
        unique_lock lock(_mutex);
        return _sessions.empty() ? Retained<FakeSession>() : _sessions.back();
    }

#pragma mark - REACHABILITY:

    class FakeReachability final : public NetworkReachability {
      public:
        FakeReachability(shared_ptr<FakeReachabilityHub> hub, Callback callback)
            : NetworkReachability(callback), _hub(std::move(hub)), _callback(std::move(callback)) {
            ++_hub->created;
        }

        ~FakeReachability() override { stop(); }

        void start() override {
            unique_lock lock(_hub->_mutex);
            if ( _running ) return;
            _running              = true;
            _hub->_runningCallback = _callback;
            ++_hub->started;
        }

        void stop() override {
            unique_lock lock(_hub->_mutex);
            if ( !_running ) return;
            _running               = false;
            _hub->_runningCallback = nullptr;
            ++_hub->stopped;
        }

      private:
        shared_ptr<FakeReachabilityHub> _hub;
        Callback                        _callback;
        bool                            _running{false};
    };

    ReachabilityFactory FakeReachabilityHub::factory() {
        auto hub = shared_from_this();
        return [hub](const URLEndpoint*, NetworkReachability::Callback callback) -> unique_ptr<NetworkReachability> {
            return make_unique<FakeReachability>(hub, std::move(callback));
        };
    }

    bool FakeReachabilityHub::setReachable(bool reachable) {
        // The mutex stays locked while notifying, so the monitor can't be stopped meanwhile.
        unique_lock lock(_mutex);
        if ( !_runningCallback ) return false;
        _runningCallback(reachable);
        return true;
    }

    bool FakeReachabilityHub::running() const {
        unique_lock lock(_mutex);
        return _runningCallback != nullptr;
    }

#pragma mark - EXECUTION CONTEXT:

    void ManualExecutionContext::dispatch(function<void()> fn) {
        unique_lock lock(_mutex);
        _queue.push_back(std::move(fn));
    }

    size_t ManualExecutionContext::pending() const {
        unique_lock lock(_mutex);
        return _queue.size();
    }

    void ManualExecutionContext::runAll() {
        deque<function<void()>> queue;
        {
            unique_lock lock(_mutex);
            swap(queue, _queue);
        }
        for ( auto& fn : queue ) fn();
    }

#pragma mark - REPLICATOR:

    vector<actor::delay_t> TestReplicator::retryDelays() const {
        unique_lock lock(_mutex);
        return _delays;
    }

    actor::delay_t TestReplicator::retryDelay(unsigned attempt) const {
        auto delay = Replicator::retryDelay(attempt);
        {
            unique_lock lock(_mutex);
            _delays.push_back(delay);
        }
        return delay * _delayScale;
    }

}  // namespace synccore::test
