//
// Replicator.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "synccore/Replicator.hh"
#include "ReachabilityObserver.hh"
#include "RetryPolicy.hh"
#include "Error.hh"
#include "Logging.hh"
#include "StringUtil.hh"

using namespace std;

namespace synccore {
    using namespace repl;

    static string makeDescription(const ReplicatorConfiguration& config) {
        string flags;
        if ( isPull(config.replicatorType) ) flags += '<';
        if ( config.continuous ) flags += '*';
        if ( isPush(config.replicatorType) ) flags += '>';
        return "Replicator[" + flags + " " + describe(config.endpoint) + "]";
    }

    static const ReplicatorConfiguration& validated(const ReplicatorConfiguration& config) {
        config.validate();
        return config;
    }

    Replicator::Replicator(const ReplicatorConfiguration& config, shared_ptr<SyncEngine> engine,
                           ReachabilityFactory reachabilityFactory)
        : Actor(SyncLog, "Replicator")
        , _config(validated(config))
        , _engine(std::move(engine))
        , _reachabilityFactory(std::move(reachabilityFactory))
        , _description(makeDescription(_config)) {
        if ( !_engine ) error::_throw(error::InvalidParameter, "Replicator requires a SyncEngine");
        logVerbose("Created, with options %s", string(_config.options).c_str());
    }

    // Not the place to notify listeners; the Replicator is already being destructed.
    Replicator::~Replicator() {
        _reachability.reset();
        if ( _session ) {
            warn("Destructed while a session was still running");
            _session->terminate();
        }
        _config.database->removeActiveReplicator(this);
    }

#pragma mark - PUBLIC API:

    void Replicator::start() {
        enqueueSync("Replicator::start", [this] { _start(); });
    }

    void Replicator::stop() {
        enqueueSync("Replicator::stop", [this] { _stop(); });
    }

    void Replicator::dispose() {
        if ( currentActor() == this ) enqueue(FUNCTION_TO_QUEUE(Replicator::_dispose));  // Called from a listener
        else
            enqueueSync("Replicator::dispose", [this] { _dispose(); });
    }

    ListenerToken Replicator::addChangeListener(ChangeListener listener, shared_ptr<ExecutionContext> context) {
        Assert(listener);
        if ( !context ) return _listeners.add(std::move(listener));
        return _listeners.add([listener, context](Replicator* repl, const ReplicatorStatus& status) {
            Retained<Replicator> retained(repl);
            context->dispatch([listener, retained, status] { listener(retained, status); });
        });
    }

    void Replicator::removeChangeListener(ListenerToken token) { _listeners.remove(token); }

    actor::delay_t Replicator::retryDelay(unsigned attempt) const { return RetryPolicy::delay(attempt); }

#pragma mark - COMMANDS:

    void Replicator::_start() {
        if ( _disposed ) error::_throw(error::NotOpen, "Replicator can't be started after it's disposed");
        if ( _session ) {
            warn("Already started");
            return;
        }
        logInfo("Starting");
        _attemptCount  = 0;
        _stopRequested = false;
        startSession();
    }

    void Replicator::_stop() {
        if ( _disposed ) error::_throw(error::NotOpen, "Replicator can't be stopped after it's disposed");
        disarmReachability();
        if ( _session ) {
            logInfo("Stopping");
            _stopRequested = true;
            _session->stop();
        } else if ( _level == ActivityLevel::Offline ) {
            // Waiting to retry; nothing will revive it now, so it's stopped.
            logInfo("Stopping while offline");
            handleStatus(ReplicatorStatus(ActivityLevel::Stopped, status().progress));
        }
    }

    void Replicator::_dispose() {
        if ( _disposed ) return;
        _disposed = true;
        logInfo("Disposing");
        disarmReachability();
        if ( _session ) _session->stop();
        clearSession();
        _config.database->removeActiveReplicator(this);
        if ( _level != ActivityLevel::Stopped ) publish(ReplicatorStatus(ActivityLevel::Stopped, status().progress));
        _selfRetain = nullptr;  // balances the retain in startSession; may destruct me once this call returns
    }

    // Called by a timer after a transient error.
    void Replicator::_retry() {
        if ( !canRestart() ) {
            logVerbose("Retry skipped; no longer waiting to retry");
            return;
        }
        logInfo("Retrying (attempt #%u)...", _attemptCount);
        startSession();
    }

    // Called when the network becomes reachable while the reachability observer is armed.
    void Replicator::_networkReachable() {
        if ( !canRestart() ) {
            logVerbose("Network is reachable, but not waiting to retry");
            return;
        }
        logInfo("Network is reachable; restarting...");
        _attemptCount = 0;
        startSession();
    }

    void Replicator::_sessionStatusChanged(Retained<EngineSession> session, ReplicatorStatus status) {
        if ( session != _session ) {
            logVerbose("Ignoring status from an obsolete session");
            return;
        }
        handleStatus(std::move(status));
    }

    void Replicator::_documentError(Retained<EngineSession> session, bool pushing, string docID, SyncError err,
                                    bool transient) {
        if ( session != _session ) return;
        if ( !pushing && err.domain == error::SyncCore && err.code == error::Conflict ) {
            // Conflict pulling a document; the revision was added, but it needs to be resolved:
            logInfo("Pulled conflicting version of '%s'", docID.c_str());
            try {
                _config.database->resolveConflict(docID, _config.conflictResolver.get());
            } catch ( const std::exception& x ) {
                warn("Conflict resolution of '%s' failed: %s", docID.c_str(), x.what());
            }
        } else {
            logInfo("%serror %s '%s': %s", (transient ? "transient " : ""), (pushing ? "pushing" : "pulling"),
                    docID.c_str(), err.description().c_str());
        }
    }

#pragma mark - INTERNALS:

    bool Replicator::canRestart() const { return !_disposed && !_session && _level == ActivityLevel::Offline; }

    // Creates an engine session and handles its initial status, or the error creating it.
    void Replicator::startSession() {
        _sessionOptions = _config.options;
        if ( _config.authenticator ) {
            _config.authenticator->authenticate(_sessionOptions);
        } else if ( auto url = get_if<URLEndpoint>(&_config.endpoint); url && !url->username.empty() ) {
            BasicAuthenticator(url->username, url->password).authenticate(_sessionOptions);
        }
        _sessionOptions.freeze();

        auto              mode = _config.continuous ? ReplicatorMode::Continuous : ReplicatorMode::OneShot;
        SessionParameters params;
        params.push              = isPush(_config.replicatorType) ? mode : ReplicatorMode::Disabled;
        params.pull              = isPull(_config.replicatorType) ? mode : ReplicatorMode::Disabled;
        params.optionsDictFleece = _sessionOptions.encode();
        params.callbacks.onStatusChanged = [this](EngineSession* session, const ReplicatorStatus& status) {
            enqueue(FUNCTION_TO_QUEUE(Replicator::_sessionStatusChanged), Retained<EngineSession>(session), status);
        };
        params.callbacks.onDocumentError = [this](EngineSession* session, bool pushing, const string& docID,
                                                  const SyncError& err, bool transient) {
            enqueue(FUNCTION_TO_QUEUE(Replicator::_documentError), Retained<EngineSession>(session), pushing, docID,
                    err, transient);
        };

        ReplicatorStatus status;
        try {
            Database& db = *_config.database;
            _session     = db.useLocked([&] { return _engine->createSession(db, _config.endpoint, params); });
            Assert(_session, "SyncEngine returned a null session");
            db.addActiveReplicator(this);
            _selfRetain = this;  // keep myself alive till the session stops
            logInfo("Started session with options %s", string(_sessionOptions).c_str());
            status = _session->status();
        } catch ( const std::exception& x ) {
            SyncError err = SyncError::fromException(x);
            warn("Couldn't create a session: %s", err.description().c_str());
            clearSession();
            status = ReplicatorStatus(ActivityLevel::Stopped, {}, err);
        }
        handleStatus(std::move(status));
    }

    void Replicator::handleStatus(ReplicatorStatus status) {
        if ( status.error && !*status.error ) status.error.reset();

        if ( status.level == ActivityLevel::Stopped && status.error ) {
            if ( handleError(*status.error) ) status.level = ActivityLevel::Offline;
        } else if ( status.level > ActivityLevel::Connecting ) {
            _attemptCount = 0;
            disarmReachability();
        }

        bool stopped = (status.level == ActivityLevel::Stopped);
        if ( stopped ) {
            clearSession();
            disarmReachability();
            _config.database->removeActiveReplicator(this);
        }
        publish(status);
        if ( stopped ) _selfRetain = nullptr;  // balances the retain in startSession
    }

    // Decides whether to retry after the session stopped with an error.
    // Returns true if the Replicator should go offline, false if the error is fatal.
    bool Replicator::handleError(const SyncError& err) {
        if ( _stopRequested ) {
            logInfo("Stopped with error while stopping: %s", err.description().c_str());
            return false;
        }
        ErrorClass errClass = RetryPolicy::classify(err);
        if ( !RetryPolicy::isRetryable(errClass, _config.continuous, _attemptCount) ) {
            if ( errClass == ErrorClass::Transient )
                logInfo("Giving up after %u retries: %s", _attemptCount, err.description().c_str());
            return false;
        }

        clearSession();
        if ( errClass == ErrorClass::Transient ) {
            auto delay = retryDelay(++_attemptCount);
            logInfo("Transient error (%s); will retry in %.3g sec...", err.description().c_str(), delay.count());
            enqueueAfter(delay, FUNCTION_TO_QUEUE(Replicator::_retry));
        } else {
            logInfo("Network error (%s); will retry when network changes...", err.description().c_str());
        }

        if ( RetryPolicy::shouldWatchNetwork(err, _config.continuous) ) armReachability();
        return true;
    }

    void Replicator::publish(const ReplicatorStatus& status) {
        _level = status.level;
        _status.set(status);
        logInfo("is %s", status.description().c_str());
        _listeners.notify(this, status);
    }

    void Replicator::clearSession() {
        if ( auto session = std::move(_session) ) session->terminate();
    }

    void Replicator::armReachability() {
        if ( !_reachability ) {
            _reachability = make_unique<ReachabilityObserver>(_reachabilityFactory, get_if<URLEndpoint>(&_config.endpoint),
                                                              [this] {
                                                                  enqueue(FUNCTION_TO_QUEUE(
                                                                          Replicator::_networkReachable));
                                                              });
        }
        _reachability->arm();
    }

    void Replicator::disarmReachability() { _reachability.reset(); }

}  // namespace synccore
