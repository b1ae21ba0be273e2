//
// Channel.hh
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
#include "Error.hh"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace synccore::actor {

    /** Thread-safe FIFO queue. The Scheduler blocks on it for mailboxes that have work; a mailbox
        keeps its pending messages in one and runs them front to back. */
    template <class T>
    class Channel {
      public:
        /// Adds a value at the back. Returns true if the queue was empty, i.e. the consumer
        /// needs to be woken up or rescheduled.
        bool push(T value) {
            std::unique_lock lock(_mutex);
            bool             wasEmpty = _items.empty();
            _items.push_back(std::move(value));
            lock.unlock();
            _nonEmpty.notify_one();
            return wasEmpty;
        }

        /// Removes and returns the front value, waiting for one if the queue is empty.
        T pop() {
            std::unique_lock lock(_mutex);
            _nonEmpty.wait(lock, [this] { return !_items.empty(); });
            T value(std::move(_items.front()));
            _items.pop_front();
            return value;
        }

        /// A copy of the front value, which stays in the queue. The queue must not be empty.
        T front() const {
            std::unique_lock lock(_mutex);
            Assert(!_items.empty());
            return _items.front();
        }

        /// Discards the front value. Returns true if that left the queue empty.
        bool dropFront() {
            std::unique_lock lock(_mutex);
            Assert(!_items.empty());
            _items.pop_front();
            return _items.empty();
        }

        size_t size() const {
            std::unique_lock lock(_mutex);
            return _items.size();
        }

      private:
        mutable std::mutex      _mutex;
        std::condition_variable _nonEmpty;
        std::deque<T>           _items;
    };

}  // namespace synccore::actor
