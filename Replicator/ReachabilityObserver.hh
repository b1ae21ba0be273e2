//
// ReachabilityObserver.hh
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
#include <functional>
#include <memory>

namespace synccore::repl {

    /** Watches for the network becoming reachable while a Replicator is Offline.
        It owns a NetworkReachability monitor, which runs between `arm` and `disarm`, and calls
        its `onReachable` function when the monitor reports the network has become reachable.
        Not thread-safe; the owning Replicator calls it only on its queue. */
    class ReachabilityObserver {
      public:
        ReachabilityObserver(ReachabilityFactory factory, const URLEndpoint* host, std::function<void()> onReachable);
        ~ReachabilityObserver();

        /// Starts the monitor if it's not already running.
        void arm();

        /// Stops and discards the monitor. After this returns, `onReachable` won't be called.
        void disarm();

        bool armed() const { return _monitor != nullptr; }

      private:
        ReachabilityObserver(const ReachabilityObserver&)            = delete;
        ReachabilityObserver& operator=(const ReachabilityObserver&) = delete;

        ReachabilityFactory const                  _factory;
        const URLEndpoint* const                   _host;
        std::function<void()> const                _onReachable;
        std::unique_ptr<NetworkReachability>       _monitor;
    };

}  // namespace synccore::repl
