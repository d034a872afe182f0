// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sleep.hpp"

#include <boost/asio/error.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace erafetch {

using namespace boost::asio;

Task<void> sleep(std::chrono::milliseconds duration) {
    auto executor = co_await this_coro::executor;
    steady_timer timer(executor);
    timer.expires_after(duration);
    co_await timer.async_wait(use_awaitable);
}

Task<void> sleep(std::chrono::milliseconds duration, concurrency::CancellationToken& token) {
    token.throw_if_cancelled();

    auto executor = co_await this_coro::executor;
    steady_timer timer(executor);
    timer.expires_after(duration);
    const auto registration = token.on_cancel([&timer]() { timer.cancel(); });

    boost::system::error_code ec;
    co_await timer.async_wait(redirect_error(use_awaitable, ec));
    if (ec == error::operation_aborted || token.is_cancelled()) {
        throw concurrency::make_cancellation_error();
    }
    if (ec) {
        throw boost::system::system_error{ec};
    }
}

}  // namespace erafetch
