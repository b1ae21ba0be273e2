//
// NetworkReachability.hh
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
#include "synccore/Base.hh"
#include <functional>
#include <memory>

namespace synccore {
    struct URLEndpoint;

    /** Monitors whether the network, or a particular host, is reachable.
        Platform implementations subclass this; tests substitute a fake. */
    class NetworkReachability {
      public:
        /// Called with `true` when the network becomes reachable, `false` when it's lost.
        /// May be called on any thread.
        using Callback = std::function<void(bool reachable)>;

        explicit NetworkReachability(Callback callback) : _callback(std::move(callback)) {}

        virtual ~NetworkReachability() = default;

        /// Begins monitoring. Events are reported only for changes that happen after this call.
        virtual void start() = 0;

        /// Stops monitoring. Once this returns, the callback will not be called again.
        virtual void stop() = 0;

      protected:
        void notify(bool reachable) const {
            if ( _callback ) _callback(reachable);
        }

      private:
        Callback const _callback;
    };

    /** Creates a NetworkReachability for a remote endpoint. `host` is null for local targets. */
    using ReachabilityFactory =
            std::function<std::unique_ptr<NetworkReachability>(const URLEndpoint* host, NetworkReachability::Callback)>;

}  // namespace synccore
