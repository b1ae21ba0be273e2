//
// InterfaceReachability.hh
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
#include "Timer.hh"
#include <chrono>
#include <mutex>

namespace synccore::repl {

    /** Default NetworkReachability: periodically checks the host's network interfaces, and
        considers the network reachable while any non-loopback interface is up and has an
        IPv4 or routable IPv6 address. */
    class InterfaceReachability final : public NetworkReachability {
      public:
        explicit InterfaceReachability(Callback, std::chrono::milliseconds pollInterval);
        ~InterfaceReachability() override;

        void start() override;
        void stop() override;

        /// Checks the network interfaces right now.
        static bool isNetworkReachable();

        /// A ReachabilityFactory that creates InterfaceReachability instances.
        static std::unique_ptr<NetworkReachability> create(const URLEndpoint*, Callback);

      private:
        void poll();

        std::chrono::milliseconds const _pollInterval;
        std::recursive_mutex            _mutex;
        bool                            _running{false};
        bool                            _reachable{false};
        actor::Timer                    _timer;  // Declared last, so it's destroyed (and waits for poll) first
    };

}  // namespace synccore::repl
