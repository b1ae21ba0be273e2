//
// ListenerList.hh
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
#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace synccore {

    /** Identifies a listener registered with a ListenerList. Zero is never a valid token. */
    using ListenerToken = uint64_t;

    // Non-template part of ListenerList<>.
    class ListenerListBase {
      protected:
        ListenerListBase() = default;
        ~ListenerListBase();

        ListenerToken nextToken() { return ++_lastToken; }

        // Logs an exception thrown by a listener. Must be called from within a catch block.
        static void warnListenerException() noexcept;

        // Throws an assertion failure if a notification is already in progress on this thread.
        void beginIteration();

        void endIteration() { _iterating = false; }

        std::recursive_mutex _mutex;              // Allows add/remove during notification
        bool                 _iterating = false;  // True during notify()

      private:
        ListenerListBase(const ListenerListBase&)            = delete;
        ListenerListBase& operator=(const ListenerListBase&) = delete;

        ListenerToken _lastToken = 0;
    };

    /** A thread-safe list of callbacks, identified by tokens, for implementing the Observer pattern.
        - Listeners are called in the order they were added.
        - Removing a listener by its token takes amortized constant time.
        - It is safe to add or remove listeners from within a callback. Listeners added during a
          notification are not called by that notification.
        - Once `remove` returns, the removed listener will not be called again by any thread.
        - Exceptions thrown by a listener are caught and logged; the remaining listeners still run. */
    template <typename... Args>
    class ListenerList : private ListenerListBase {
      public:
        using Callback = std::function<void(Args...)>;

        ListenerList() = default;

        /// Adds a listener and returns the token that identifies it.
        ListenerToken add(Callback callback) {
            std::unique_lock lock(_mutex);
            ListenerToken    token = nextToken();
            _index.emplace(token, _entries.size());
            _entries.push_back({token, std::move(callback)});
            return token;
        }

        /// Removes the listener with this token. Unknown tokens are ignored.
        /// @returns  True if a listener was removed.
        bool remove(ListenerToken token) {
            std::unique_lock lock(_mutex);
            auto             i = _index.find(token);
            if ( i == _index.end() ) return false;
            Entry& entry   = _entries[i->second];
            entry.token    = 0;
            entry.callback = nullptr;
            _index.erase(i);
            ++_removedCount;
            compact();
            return true;
        }

        size_t size() {
            std::unique_lock lock(_mutex);
            return _index.size();
        }

        /// Calls every listener with the given arguments.
        void notify(Args... args) {
            std::unique_lock lock(_mutex);
            beginIteration();
            // Entries appended by a listener are past `end`, so this notification skips them:
            for ( size_t i = 0, end = _entries.size(); i < end; ++i ) {
                if ( _entries[i].token == 0 ) continue;
                // Copy the callback, since it may remove itself while running:
                Callback callback = _entries[i].callback;
                try {
                    callback(args...);
                } catch ( ... ) { warnListenerException(); }
            }
            endIteration();
            compact();
        }

      private:
        struct Entry {
            ListenerToken token;  // 0 once removed
            Callback      callback;
        };

        // Drops removed entries once they're at least half the vector, and re-indexes the rest.
        // Deferred during a notification, which iterates by position.
        void compact() {
            if ( _iterating || _removedCount == 0 || _removedCount * 2 < _entries.size() ) return;
            std::erase_if(_entries, [](const Entry& e) { return e.token == 0; });
            for ( size_t i = 0; i < _entries.size(); ++i ) _index[_entries[i].token] = i;
            _removedCount = 0;
        }

        std::vector<Entry>                        _entries;  // In registration order
        std::unordered_map<ListenerToken, size_t> _index;    // Token -> position in _entries
        size_t                                    _removedCount = 0;
    };

}  // namespace synccore
