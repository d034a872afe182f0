// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "sleep.hpp"

#include <chrono>
#include <future>

#include <catch2/catch_test_macros.hpp>

#include <erafetch/infra/test_util/task_runner.hpp>

namespace erafetch {

using namespace std::chrono_literals;

TEST_CASE("sleep", "[erafetch][concurrency]") {
    test_util::TaskRunner runner;

    SECTION("waits at least the given duration") {
        const auto start = std::chrono::steady_clock::now();
        runner.run(sleep(20ms));
        CHECK(std::chrono::steady_clock::now() - start >= 20ms);
    }

    SECTION("cancellable sleep completes when not cancelled") {
        concurrency::CancellationToken token;
        runner.run(sleep(1ms, token));
        CHECK(token.handler_count() == 0);
    }

    SECTION("cancellation interrupts a long sleep") {
        concurrency::CancellationToken token;
        auto future = runner.spawn_future(sleep(1h, token));
        runner.poll_until_idle();
        CHECK(future.wait_for(0s) == std::future_status::timeout);

        token.cancel();
        runner.poll_context_until_future_is_ready(future);
        CHECK_THROWS_AS(future.get(), boost::system::system_error);
    }

    SECTION("already cancelled token throws without sleeping") {
        concurrency::CancellationToken token;
        token.cancel();
        CHECK_THROWS_AS(runner.run(sleep(1h, token)), boost::system::system_error);
    }
}

}  // namespace erafetch
