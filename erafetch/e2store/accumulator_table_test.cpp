// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "accumulator_table.hpp"

#include <fstream>
#include <string>

#include <catch2/catch_test_macros.hpp>

#include <erafetch/core/common/util.hpp>
#include <erafetch/infra/common/directories.hpp>

namespace erafetch::e2store {

static const std::string kRoot0{"0x5ec1ffb8c3b146f42606c74ced973dc16ec5a107c0345858c343fc94780b4218"};
static const std::string kRoot1{"bcf3a6b2d8e3ec0e7b8e6ab5ecb2e3c4bce5bde0f9f8e1a0c3c3a3b8f9e0c1d2"};

TEST_CASE("AccumulatorTable::parse", "[erafetch][e2store]") {
    SECTION("one root per line with or without prefix") {
        const auto table{AccumulatorTable::parse(kRoot0 + "\n" + kRoot1 + "\n\n")};
        CHECK(table.size() == 2);
        REQUIRE(table.find(0));
        CHECK(to_hex(*table.find(0), /*with_prefix=*/true) == kRoot0);
        REQUIRE(table.find(1));
        CHECK(to_hex(*table.find(1)) == kRoot1);
        CHECK_FALSE(table.find(2));
    }

    SECTION("coverage of an inclusive range") {
        const auto table{AccumulatorTable::parse(kRoot0 + "\n" + kRoot1)};
        CHECK(table.covers(0, 1));
        CHECK(table.covers(1, 1));
        CHECK_FALSE(table.covers(0, 2));
        CHECK_FALSE(AccumulatorTable{}.covers(0, 0));
    }

    SECTION("malformed line") {
        CHECK_THROWS_AS(AccumulatorTable::parse(kRoot0 + "\nzz\n"), std::invalid_argument);
        CHECK_THROWS_AS(AccumulatorTable::parse("0x1234"), std::invalid_argument);
    }

    SECTION("blank line in between") {
        CHECK_THROWS_AS(AccumulatorTable::parse(kRoot0 + "\n\n" + kRoot1), std::invalid_argument);
    }
}

TEST_CASE("AccumulatorTable::from_file", "[erafetch][e2store]") {
    TemporaryDirectory tmp_dir;
    const auto path{tmp_dir.path() / "accumulators.txt"};

    SECTION("existing file") {
        std::ofstream{path} << kRoot0 << "\n";
        CHECK(AccumulatorTable::from_file(path).size() == 1);
    }

    SECTION("missing file") {
        CHECK_THROWS_AS(AccumulatorTable::from_file(path), std::runtime_error);
    }
}

}  // namespace erafetch::e2store
