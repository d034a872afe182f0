// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "era1_encoder.hpp"

#include <catch2/catch_test_macros.hpp>

#include <erafetch/e2store/era1_builder.hpp>
#include <erafetch/e2store/era1_reader.hpp>

#include "test_util/fake_block_client.hpp"

namespace erafetch::fetch {

static std::vector<BlockRecord> make_records(EraIndex era, uint64_t count) {
    std::vector<BlockRecord> records;
    for (uint64_t sequence{0}; sequence < count; ++sequence) {
        records.push_back(BlockRecord{
            .sequence = sequence,
            .number = era * e2store::kBlocksPerEra + sequence,
            .payload = test_util::make_payload(era, sequence),
        });
    }
    return records;
}

TEST_CASE("Era1Encoder", "[erafetch][fetch][era1_encoder]") {
    Bytes32 root_0{};
    root_0.fill(0xa0);
    Bytes32 root_1{};
    root_1.fill(0xa1);
    const Era1Encoder encoder{e2store::AccumulatorTable{{root_0, root_1}}};

    SECTION("encodes a decodable era1 file") {
        const auto records{make_records(1, 16)};
        const Bytes content{encoder.encode(1, records)};
        const auto file{e2store::read_era1(content)};
        CHECK(file.starting_number == e2store::kBlocksPerEra);
        CHECK(file.accumulator_root == root_1);
        REQUIRE(file.blocks.size() == 16);
        for (size_t i{0}; i < records.size(); ++i) {
            CHECK(file.blocks[i].header == records[i].payload.header);
            CHECK(file.blocks[i].body == records[i].payload.body);
            CHECK(file.blocks[i].receipts == records[i].payload.receipts);
            CHECK(e2store::total_difficulty_to_be(file.blocks[i].total_difficulty) == records[i].payload.total_difficulty);
        }
    }

    SECTION("encoding is deterministic") {
        const auto records{make_records(0, 8)};
        CHECK(encoder.encode(0, records) == encoder.encode(0, records));
    }

    SECTION("no block") {
        CHECK_THROWS_AS(encoder.encode(0, {}), EncodeError);
    }

    SECTION("no accumulator root") {
        CHECK_THROWS_AS(encoder.encode(2, make_records(2, 4)), EncodeError);
    }

    SECTION("non-consecutive block numbers") {
        auto records{make_records(0, 4)};
        records[2].number += 10;
        CHECK_THROWS_AS(encoder.encode(0, records), EncodeError);
    }

    SECTION("oversized total difficulty") {
        auto records{make_records(0, 2)};
        records[1].payload.total_difficulty = Bytes(33, 0x01);
        CHECK_THROWS_AS(encoder.encode(0, records), EncodeError);
    }
}

}  // namespace erafetch::fetch
