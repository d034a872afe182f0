// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "task.hpp"

namespace erafetch::concurrency {

// A simplified condition variable similar to Rust Tokio Notify:
// https://docs.rs/tokio/1.25.0/tokio/sync/struct.Notify.html
// Only one waiter is supported. The notification is a cancellation of a timer that never expires,
// so notify() must be called on the executor the waiter runs on.
class EventNotifier {
  public:
    explicit EventNotifier(const boost::asio::any_io_executor& executor)
        : timer_(executor, boost::asio::steady_timer::time_point::max()) {}

    Task<void> wait() {
        if (!notified_) {
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        notified_ = false;
    }

    void notify() {
        notified_ = true;
        timer_.cancel();
    }

  private:
    boost::asio::steady_timer timer_;
    bool notified_{false};
};

}  // namespace erafetch::concurrency
