// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <functional>
#include <list>

#include "event_notifier.hpp"
#include "task.hpp"

namespace erafetch::concurrency {

/**
 * Wakes up every coroutine waiting on it, unlike EventNotifier which serves a single waiter.
 * Take the waiter before checking the awaited condition: a notify_all() issued in between
 * makes the waiter return at once instead of being lost.
 *
 *     auto waiter = backlog_changed.waiter();
 *     if (backlog <= threshold) co_return;
 *     co_await waiter();
 *
 * \warning waiters and notify_all() must run on the same executor
 */
class AwaitableConditionVariable {
  public:
    using Waiter = std::function<Task<void>()>;

    Waiter waiter();
    void notify_all();

    //! Number of coroutines currently suspended in a waiter
    size_t waiting_count() const { return waiting_.size(); }

  private:
    uint64_t generation_{0};
    std::list<EventNotifier*> waiting_;
};

}  // namespace erafetch::concurrency
