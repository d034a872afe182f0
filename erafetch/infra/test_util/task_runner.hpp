// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <erafetch/infra/concurrency/task.hpp>

namespace erafetch::test_util {

//! Drives coroutines on a private io_context from the test thread
class TaskRunner {
  public:
    //! Run \p task to completion, rethrowing its exception if any
    template <typename T>
    T run(Task<T> task) {
        auto future{spawn_future(std::move(task))};
        poll_context_until_future_is_ready(future);
        return future.get();
    }

    template <typename T>
    std::future<T> spawn_future(Task<T> task) {
        return boost::asio::co_spawn(ioc_, std::move(task), boost::asio::use_future);
    }

    //! Execute handlers until \p future is ready, including those posted from other threads
    template <typename T>
    void poll_context_until_future_is_ready(std::future<T>& future) {
        ioc_.restart();
        while (future.wait_for(std::chrono::seconds{0}) != std::future_status::ready) {
            ioc_.poll_one();
        }
    }

    //! Execute the ready handlers until every spawned coroutine is suspended
    void poll_until_idle() {
        ioc_.restart();
        while (ioc_.poll_one() > 0) {
        }
    }

    boost::asio::io_context& ioc() { return ioc_; }
    boost::asio::any_io_executor executor() { return ioc_.get_executor(); }

  private:
    boost::asio::io_context ioc_;
};

}  // namespace erafetch::test_util
