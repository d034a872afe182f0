// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "entry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <erafetch/core/common/util.hpp>

namespace erafetch::e2store {

TEST_CASE("append_entry", "[erafetch][e2store]") {
    Bytes out;
    append_entry(out, EntryType::kVersion, {});
    CHECK(to_hex(out) == "6532000000000000");

    append_entry(out, EntryType::kTotalDifficulty, *from_hex("0102"));
    CHECK(to_hex(out) == "65320000000000000600020000000000" "0102");
}

TEST_CASE("Reader", "[erafetch][e2store]") {
    Bytes data;
    append_entry(data, EntryType::kVersion, {});
    append_entry(data, EntryType::kAccumulator, *from_hex("aabbcc"));

    SECTION("decodes entries in order") {
        Reader reader{data};
        const auto version{reader.next()};
        REQUIRE(version);
        CHECK(version->type == static_cast<uint16_t>(EntryType::kVersion));
        CHECK(version->data.empty());
        CHECK(reader.offset() == kHeaderSize);

        const auto accumulator{reader.next()};
        REQUIRE(accumulator);
        CHECK(accumulator->type == static_cast<uint16_t>(EntryType::kAccumulator));
        CHECK(to_hex(accumulator->data) == "aabbcc");
        CHECK(reader.at_end());
        CHECK_FALSE(reader.next());
    }

    SECTION("truncated data") {
        data.pop_back();
        Reader reader{data};
        CHECK(reader.next());
        CHECK_THROWS_AS(reader.next(), DecodingError);
    }

    SECTION("truncated header") {
        Reader reader{ByteView{data}.substr(0, 5)};
        CHECK_THROWS_AS(reader.next(), DecodingError);
    }

    SECTION("reserved field must be zero") {
        data[6] = 0x01;
        Reader reader{data};
        CHECK_THROWS_AS(reader.next(), DecodingError);
    }
}

TEST_CASE("EntryType to_string", "[erafetch][e2store]") {
    CHECK(to_string(EntryType::kBlockIndex) == "BlockIndex");
    CHECK(to_string(EntryType::kCompressedReceipts) == "CompressedReceipts");
    CHECK(to_string(static_cast<EntryType>(0x42)) == "Unknown(0x0042)");
}

}  // namespace erafetch::e2store
