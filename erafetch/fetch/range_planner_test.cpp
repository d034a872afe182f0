// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "range_planner.hpp"

#include <limits>

#include <catch2/catch_test_macros.hpp>

namespace erafetch::fetch {

TEST_CASE("plan_eras", "[erafetch][fetch][range_planner]") {
    CHECK(plan_eras(0, 2) == std::vector<EraIndex>{0, 1, 2});
    CHECK(plan_eras(7, 7) == std::vector<EraIndex>{7});
    CHECK(plan_eras(EraRange{1000, 1003}) == std::vector<EraIndex>{1000, 1001, 1002, 1003});

    CHECK_THROWS_AS(plan_eras(3, 2), InvalidRangeError);
    CHECK_THROWS_AS(plan_eras(-1, 2), InvalidRangeError);
    CHECK_THROWS_AS(plan_eras(0, -5), InvalidRangeError);
    CHECK_THROWS_AS(plan_eras(EraRange{5, 4}), InvalidRangeError);
}

TEST_CASE("plan_eras rejects oversized spans", "[erafetch][fetch][range_planner]") {
    CHECK_THROWS_AS(plan_eras(0, std::numeric_limits<int64_t>::max()), InvalidRangeError);
    CHECK_THROWS_AS(plan_eras(EraRange{0, std::numeric_limits<EraIndex>::max()}), InvalidRangeError);
    CHECK_THROWS_AS(plan_eras(EraRange{0, kMaxPlannedEras}), InvalidRangeError);
    CHECK_THROWS_AS(parse_era_range("0:9223372036854775807"), InvalidRangeError);

    constexpr auto kLastEra{std::numeric_limits<EraIndex>::max()};
    CHECK(plan_eras(EraRange{kLastEra - 1, kLastEra}) == std::vector<EraIndex>{kLastEra - 1, kLastEra});
}

TEST_CASE("parse_era_range", "[erafetch][fetch][range_planner]") {
    SECTION("start and end") {
        CHECK(parse_era_range("0:2") == EraRange{0, 2});
        CHECK(parse_era_range("1500:1895") == EraRange{1500, 1895});
        CHECK(parse_era_range("12:12").size() == 1);
    }
    SECTION("end only starts from era zero") {
        CHECK(parse_era_range("10") == EraRange{0, 10});
        CHECK(parse_era_range(":10") == EraRange{0, 10});
        CHECK(plan_eras(parse_era_range("10")).size() == 11);
    }
    SECTION("rejected forms") {
        for (const auto* text : {"", ":", "a:b", "1:", "1:2:3", "2:1", "-1:3", "0:-3", " 1:2", "1.5", "0x10"}) {
            CAPTURE(text);
            CHECK_THROWS_AS(parse_era_range(text), InvalidRangeError);
        }
    }
}

}  // namespace erafetch::fetch
