//
// InterfaceReachability.cc
//
// Copyright 2026-Present Couchbase, Inc.
//
// Use of this software is governed by the Business Source License included
// in the file licenses/BSL-Couchbase.txt.  As of the Change Date specified
// in that file, in accordance with the Business Source License, use of this
// software will be governed by the Apache License, Version 2.0, included in
// the file licenses/APL2.txt.
//

#include "InterfaceReachability.hh"
#include "ReplicatorTuning.hh"
#include "Error.hh"
#include "Logging.hh"
#include <arpa/inet.h>
#include <exception>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

using namespace std;

namespace synccore::repl {

    InterfaceReachability::InterfaceReachability(Callback callback, chrono::milliseconds pollInterval)
        : NetworkReachability(std::move(callback)), _pollInterval(pollInterval), _timer([this] { poll(); }) {}

    InterfaceReachability::~InterfaceReachability() { stop(); }

    unique_ptr<NetworkReachability> InterfaceReachability::create(const URLEndpoint*, Callback callback) {
        return make_unique<InterfaceReachability>(std::move(callback), tuning::kReachabilityPollInterval);
    }

    static bool isRoutable(const sockaddr* addr) {
        if ( addr->sa_family == AF_INET ) {
            return true;
        } else if ( addr->sa_family == AF_INET6 ) {
            auto& in6 = ((const sockaddr_in6*)addr)->sin6_addr;
            return !IN6_IS_ADDR_LINKLOCAL(&in6) && !IN6_IS_ADDR_LOOPBACK(&in6);
        } else {
            return false;
        }
    }

    bool InterfaceReachability::isNetworkReachable() {
        ifaddrs* addrs;
        if ( getifaddrs(&addrs) < 0 ) error::_throwErrno("getifaddrs failed");
        bool reachable = false;
        for ( ifaddrs* a = addrs; a && !reachable; a = a->ifa_next ) {
            if ( a->ifa_addr && (a->ifa_flags & IFF_UP) && (a->ifa_flags & IFF_RUNNING)
                 && !(a->ifa_flags & IFF_LOOPBACK) )
                reachable = isRoutable(a->ifa_addr);
        }
        freeifaddrs(addrs);
        return reachable;
    }

    void InterfaceReachability::start() {
        unique_lock lock(_mutex);
        if ( _running ) return;
        _running = true;
        try {
            _reachable = isNetworkReachable();
        } catch ( const std::exception& x ) {
            LogWarn(SyncLog, "InterfaceReachability couldn't check network interfaces: %s", x.what());
            _reachable = false;
        }
        LogVerbose(SyncLog, "InterfaceReachability started; network is %s", (_reachable ? "up" : "down"));
        _timer.fireAfter(_pollInterval);
    }

    void InterfaceReachability::stop() {
        unique_lock lock(_mutex);
        if ( !_running ) return;
        _running = false;
        _timer.stop();
    }

    void InterfaceReachability::poll() {
        // The lock is held while notifying, so that stop() can't return while a callback is in progress.
        unique_lock lock(_mutex);
        if ( !_running ) return;
        bool reachable;
        try {
            reachable = isNetworkReachable();
        } catch ( const std::exception& x ) {
            LogWarn(SyncLog, "InterfaceReachability couldn't check network interfaces: %s", x.what());
            reachable = _reachable;
        }
        _timer.fireAfter(_pollInterval);
        if ( reachable != _reachable ) {
            _reachable = reachable;
            LogTo(SyncLog, "Network is now %s", (reachable ? "reachable" : "unreachable"));
            notify(reachable);
        }
    }

}  // namespace synccore::repl
