//
// ReachabilityObserver.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "ReachabilityObserver.hh"
#include "InterfaceReachability.hh"
#include "Error.hh"
#include "Logging.hh"

namespace synccore::repl {

    ReachabilityObserver::ReachabilityObserver(ReachabilityFactory factory, const URLEndpoint* host,
                                               std::function<void()> onReachable)
        : _factory(factory ? std::move(factory) : ReachabilityFactory(&InterfaceReachability::create))
        , _host(host)
        , _onReachable(std::move(onReachable)) {}

    ReachabilityObserver::~ReachabilityObserver() { disarm(); }

    void ReachabilityObserver::arm() {
        if ( _monitor ) return;
        auto onReachable = _onReachable;
        _monitor         = _factory(_host, [onReachable](bool reachable) {
            if ( reachable ) onReachable();
        });
        Assert(_monitor, "ReachabilityFactory returned null");
        LogVerbose(SyncLog, "Watching for network reachability changes");
        _monitor->start();
    }

    void ReachabilityObserver::disarm() {
        if ( auto monitor = std::move(_monitor) ) {
            monitor->stop();
            LogVerbose(SyncLog, "Stopped watching for network reachability changes");
        }
    }

}  // namespace synccore::repl
