// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cancellation_token.hpp"

#include <boost/asio/error.hpp>
#include <catch2/catch_test_macros.hpp>

namespace erafetch::concurrency {

TEST_CASE("CancellationToken", "[erafetch][concurrency]") {
    CancellationToken token;
    CHECK_FALSE(token.is_cancelled());
    CHECK_NOTHROW(token.throw_if_cancelled());

    SECTION("handlers run once on cancel") {
        int calls{0};
        const auto registration = token.on_cancel([&]() { ++calls; });
        CHECK(token.handler_count() == 1);
        token.cancel();
        token.cancel();
        CHECK(calls == 1);
        CHECK(token.is_cancelled());
        CHECK(token.handler_count() == 0);
    }

    SECTION("registration going out of scope drops the handler") {
        int calls{0};
        {
            const auto registration = token.on_cancel([&]() { ++calls; });
            CHECK(token.handler_count() == 1);
        }
        CHECK(token.handler_count() == 0);
        token.cancel();
        CHECK(calls == 0);
    }

    SECTION("handler registered after cancel runs immediately") {
        token.cancel();
        bool called{false};
        const auto registration = token.on_cancel([&]() { called = true; });
        CHECK(called);
    }

    SECTION("moved registration keeps the handler alive") {
        int calls{0};
        CancellationToken::Registration outer;
        {
            auto inner = token.on_cancel([&]() { ++calls; });
            outer = std::move(inner);
        }
        CHECK(token.handler_count() == 1);
        token.cancel();
        CHECK(calls == 1);
    }

    SECTION("cancelled token throws the cancellation error") {
        token.cancel();
        try {
            token.throw_if_cancelled();
            FAIL("expected cancellation");
        } catch (const boost::system::system_error& error) {
            CHECK(is_cancellation(error));
        }
    }
}

TEST_CASE("is_cancellation", "[erafetch][concurrency]") {
    CHECK(is_cancellation(make_cancellation_error()));
    CHECK(is_cancellation(boost::system::system_error{boost::asio::error::operation_aborted}));
    CHECK_FALSE(is_cancellation(boost::system::system_error{boost::asio::error::connection_reset}));
}

}  // namespace erafetch::concurrency
