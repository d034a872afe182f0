// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "awaitable_condition_variable.hpp"

#include <boost/asio/this_coro.hpp>

namespace erafetch::concurrency {

AwaitableConditionVariable::Waiter AwaitableConditionVariable::waiter() {
    return [this, generation = generation_]() -> Task<void> {
        if (generation != generation_) {
            co_return;
        }
        EventNotifier notifier{co_await boost::asio::this_coro::executor};

        // Unlink the notifier even if the suspended coroutine is destroyed
        struct Unlink {
            std::list<EventNotifier*>& list;
            std::list<EventNotifier*>::iterator position;
            ~Unlink() { list.erase(position); }
        };
        const Unlink unlink{waiting_, waiting_.insert(waiting_.end(), &notifier)};
        co_await notifier.wait();
    };
}

void AwaitableConditionVariable::notify_all() {
    ++generation_;
    for (auto* notifier : waiting_) {
        notifier->notify();
    }
}

}  // namespace erafetch::concurrency
