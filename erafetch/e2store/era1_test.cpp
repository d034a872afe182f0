// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <string>
#include <vector>

#include <boost/endian/conversion.hpp>
#include <catch2/catch_test_macros.hpp>

#include <erafetch/core/common/util.hpp>

#include "entry.hpp"
#include "era1_builder.hpp"
#include "era1_reader.hpp"

namespace erafetch::e2store {

namespace {
    struct OwnedBlock {
        Bytes header;
        Bytes body;
        Bytes receipts;
        Bytes total_difficulty;

        BlockTuple tuple() const { return {header, body, receipts, total_difficulty}; }
    };

    OwnedBlock make_block(uint64_t number) {
        const std::string n{std::to_string(number)};
        return OwnedBlock{
            .header = Bytes{string_view_to_byte_view("header-" + n)},
            .body = Bytes(static_cast<size_t>(100 + number), static_cast<uint8_t>(number)),
            .receipts = Bytes{string_view_to_byte_view("receipts-" + n)},
            .total_difficulty = *from_hex("0400000000"),
        };
    }

    Bytes32 make_root(uint8_t seed) {
        Bytes32 root{};
        root.fill(seed);
        return root;
    }

    Bytes build(uint64_t first, size_t count, const Bytes32& root) {
        Era1Builder builder;
        for (uint64_t number{first}; number < first + count; ++number) {
            const auto block{make_block(number)};
            builder.add(number, block.tuple());
        }
        return builder.finalize(root);
    }
}  // namespace

TEST_CASE("total difficulty conversion", "[erafetch][e2store][era1]") {
    const Bytes32 little_endian{total_difficulty_to_le(*from_hex("0102"))};
    CHECK(little_endian[0] == 0x02);
    CHECK(little_endian[1] == 0x01);
    CHECK(little_endian[2] == 0x00);
    CHECK(total_difficulty_to_be(little_endian) == *from_hex("0102"));
    CHECK(total_difficulty_to_be(Bytes32{}).empty());
    CHECK_THROWS_AS(total_difficulty_to_le(Bytes(33, 0x01)), std::invalid_argument);
}

TEST_CASE("Era1Builder layout", "[erafetch][e2store][era1]") {
    const Bytes era{build(8192, 3, make_root(0x11))};

    std::vector<uint16_t> types;
    Reader reader{era};
    size_t index_offset{0};
    while (true) {
        const size_t offset{reader.offset()};
        const auto entry{reader.next()};
        if (!entry) break;
        if (entry->type == static_cast<uint16_t>(EntryType::kBlockIndex)) index_offset = offset;
        types.push_back(entry->type);
    }
    const std::vector<uint16_t> expected_types{
        0x3265,
        0x03, 0x04, 0x05, 0x06,
        0x03, 0x04, 0x05, 0x06,
        0x03, 0x04, 0x05, 0x06,
        0x07,
        0x3266,
    };
    CHECK(types == expected_types);

    // BlockIndex: starting number, offsets relative to the index entry, count
    const ByteView index{ByteView{era}.substr(index_offset + kHeaderSize)};
    REQUIRE(index.size() == 16 + 3 * 8);
    CHECK(boost::endian::load_little_u64(&index[0]) == 8192);
    CHECK(static_cast<int64_t>(boost::endian::load_little_u64(&index[8])) == static_cast<int64_t>(kHeaderSize) - static_cast<int64_t>(index_offset));
    CHECK(boost::endian::load_little_u64(&index[32]) == 3);
    CHECK(read_block_count(era) == 3);
}

TEST_CASE("Era1Builder rejects misuse", "[erafetch][e2store][era1]") {
    Era1Builder builder;
    CHECK_THROWS_AS(builder.finalize(make_root(0)), std::logic_error);

    const auto block0{make_block(0)};
    builder.add(0, block0.tuple());
    const auto block2{make_block(2)};
    CHECK_THROWS_AS(builder.add(2, block2.tuple()), std::invalid_argument);
    CHECK(builder.block_count() == 1);
}

TEST_CASE("read_era1", "[erafetch][e2store][era1]") {
    const Bytes32 root{make_root(0x22)};
    const Bytes era{build(16384, 4, root)};

    SECTION("decodes what was built") {
        const auto file{read_era1(era)};
        CHECK(file.starting_number == 16384);
        CHECK(file.last_number() == 16387);
        CHECK(file.accumulator_root == root);
        REQUIRE(file.blocks.size() == 4);
        for (size_t i{0}; i < file.blocks.size(); ++i) {
            const auto expected{make_block(16384 + i)};
            CHECK(file.blocks[i].number == 16384 + i);
            CHECK(file.blocks[i].header == expected.header);
            CHECK(file.blocks[i].body == expected.body);
            CHECK(file.blocks[i].receipts == expected.receipts);
            CHECK(total_difficulty_to_be(file.blocks[i].total_difficulty) == expected.total_difficulty);
        }
    }

    SECTION("truncated file") {
        CHECK_THROWS_AS(read_era1(ByteView{era}.substr(0, era.size() - 1)), DecodingError);
        CHECK_THROWS_AS(read_block_count(ByteView{era}.substr(0, era.size() - 1)), DecodingError);
    }

    SECTION("missing version") {
        CHECK_THROWS_AS(read_era1(ByteView{era}.substr(kHeaderSize)), DecodingError);
    }

    SECTION("corrupted block offset") {
        Bytes corrupted{era};
        // first offset of the BlockIndex starts 8 (header) + 8 (starting number) bytes into the entry
        const size_t first_offset_position{corrupted.size() - 8 - 4 * 8};
        corrupted[first_offset_position] ^= 0x01;
        CHECK_THROWS_AS(read_era1(corrupted), DecodingError);
    }

    SECTION("trailing data") {
        Bytes extended{era};
        append_entry(extended, EntryType::kVersion, {});
        CHECK_THROWS_AS(read_era1(extended), DecodingError);
    }
}

TEST_CASE("compare_entries", "[erafetch][e2store][era1]") {
    const Bytes era{build(0, 2, make_root(0x33))};

    SECTION("identical files") {
        CHECK_FALSE(compare_entries(era, era));
    }

    SECTION("different accumulator") {
        const Bytes other{build(0, 2, make_root(0x34))};
        const auto difference{compare_entries(era, other)};
        REQUIRE(difference);
        CHECK(difference->entry_index == 9);
        CHECK(difference->description.find("Accumulator") != std::string::npos);
    }

    SECTION("different block count") {
        const Bytes other{build(0, 1, make_root(0x33))};
        const auto difference{compare_entries(era, other)};
        REQUIRE(difference);
        CHECK(difference->entry_index == 5);
    }
}

}  // namespace erafetch::e2store
