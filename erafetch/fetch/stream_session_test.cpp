// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stream_session.hpp"

#include <chrono>
#include <future>

#include <catch2/catch_test_macros.hpp>

#include <erafetch/infra/test_util/task_runner.hpp>

#include "test_util/fake_block_client.hpp"

namespace erafetch::fetch {

using namespace std::chrono_literals;
using test_util::FakeBlockClient;
using test_util::Fault;

TEST_CASE("StreamSession", "[erafetch][fetch][stream_session]") {
    erafetch::test_util::TaskRunner runner;
    FakeBlockClient client{5};
    const Credential credential{"token"};
    concurrency::CancellationToken token;
    std::vector<BlockRecord> records;

    SECTION("ingests the blocks in order") {
        StreamSession session{client, 3, credential, token};
        runner.run(session.run(records));
        REQUIRE(records.size() == 5);
        for (uint64_t i{0}; i < records.size(); ++i) {
            CHECK(records[i].sequence == i);
            CHECK(records[i].payload == test_util::make_payload(3, i));
        }
        CHECK(client.open_count(3) == 1);
        CHECK(client.open_streams() == 0);
        CHECK(client.closed_streams() == 1);
    }

    SECTION("connection reset is transient") {
        client.set_fault(3, 1, Fault{Fault::Kind::kTransientAt, 2});
        StreamSession session{client, 3, credential, token};
        CHECK_THROWS_AS(runner.run(session.run(records)), TransientStreamError);
        CHECK(client.open_streams() == 0);
    }

    SECTION("early end of stream is short") {
        client.set_fault(3, 1, Fault{Fault::Kind::kShortAfter, 4});
        StreamSession session{client, 3, credential, token};
        CHECK_THROWS_AS(runner.run(session.run(records)), ShortStreamError);
    }

    SECTION("block beyond the expected count is a protocol failure") {
        client.set_fault(3, 1, Fault{Fault::Kind::kExtraBlock, 0});
        StreamSession session{client, 3, credential, token};
        CHECK_THROWS_AS(runner.run(session.run(records)), ProtocolError);
        CHECK(client.open_streams() == 0);
    }

    SECTION("out-of-order block is a protocol failure") {
        client.set_fault(3, 1, Fault{Fault::Kind::kOutOfOrderAt, 1});
        StreamSession session{client, 3, credential, token};
        CHECK_THROWS_AS(runner.run(session.run(records)), ProtocolError);
    }

    SECTION("rejected credential") {
        client.require_token("another");
        StreamSession session{client, 3, credential, token};
        CHECK_THROWS_AS(runner.run(session.run(records)), AuthError);
        CHECK(client.open_streams() == 0);
    }

    SECTION("stalled stream times out") {
        client.set_fault(3, 1, Fault{Fault::Kind::kStallAt, 1});
        StreamSession session{client, 3, credential, token, 20ms};
        CHECK_THROWS_AS(runner.run(session.run(records)), TransientStreamError);
        CHECK(client.open_streams() == 0);
    }

    SECTION("read timeout does not fire on a healthy stream") {
        StreamSession session{client, 3, credential, token, 1s};
        runner.run(session.run(records));
        CHECK(records.size() == 5);
    }

    SECTION("cancellation closes the stream") {
        client.set_fault(3, 1, Fault{Fault::Kind::kStallAt, 2});
        StreamSession session{client, 3, credential, token};
        auto future = runner.spawn_future(session.run(records));
        runner.poll_until_idle();
        CHECK(future.wait_for(0s) == std::future_status::timeout);
        CHECK(client.open_streams() == 1);

        token.cancel();
        runner.poll_context_until_future_is_ready(future);
        CHECK_THROWS_AS(future.get(), boost::system::system_error);
        CHECK(client.open_streams() == 0);
        CHECK(token.handler_count() == 0);
    }

    SECTION("cancelled before start does not open") {
        token.cancel();
        StreamSession session{client, 3, credential, token};
        CHECK_THROWS_AS(runner.run(session.run(records)), boost::system::system_error);
        CHECK(client.total_open_count() == 0);
    }

    SECTION("records must be empty") {
        records.push_back(BlockRecord{});
        StreamSession session{client, 3, credential, token};
        CHECK_THROWS_AS(runner.run(session.run(records)), std::invalid_argument);
    }
}

}  // namespace erafetch::fetch
