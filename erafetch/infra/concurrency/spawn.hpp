// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <type_traits>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/execution/executor.hpp>
#include <boost/asio/execution_context.hpp>
#include <boost/asio/is_executor.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>

#include "task.hpp"

namespace erafetch::concurrency {

template <typename T>
concept AsioExecutor = boost::asio::is_executor<T>::value || boost::asio::execution::is_executor<T>::value;

template <typename T>
concept AsioExecutionContext = std::is_base_of_v<boost::asio::execution_context, T>;

//! An executor or an execution context (io_context, thread_pool) a coroutine can be spawned on
template <typename T>
concept SpawnTarget = AsioExecutor<std::remove_cvref_t<T>> || AsioExecutionContext<std::remove_cvref_t<T>>;

//! Run the coroutine returned by \p f on \p target, e.g. the blocking thread pool, and await its result.
//! The awaiting coroutine resumes on its own executor.
template <SpawnTarget Target, typename F>
auto spawn_task(Target&& target, F&& f) {
    return boost::asio::co_spawn(std::forward<Target>(target), std::forward<F>(f), boost::asio::use_awaitable);
}

//! Run the coroutine returned by \p f on \p target and get its result through a std::future
template <SpawnTarget Target, typename F>
auto spawn_future(Target&& target, F&& f) {
    return boost::asio::co_spawn(std::forward<Target>(target), std::forward<F>(f), boost::asio::use_future);
}

}  // namespace erafetch::concurrency
