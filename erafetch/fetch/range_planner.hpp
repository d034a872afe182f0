// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace erafetch::fetch {

//! Upper bound on the number of eras a single run may plan
constexpr uint64_t kMaxPlannedEras{1'000'000};

//! Inclusive range of eras [start, end]
struct EraRange {
    EraIndex start{0};
    EraIndex end{0};

    //! \pre start <= end and end - start < kMaxPlannedEras, as checked by plan_eras and parse_era_range
    uint64_t size() const { return end - start + 1; }
    bool operator==(const EraRange&) const = default;
};

//! Build the ascending list of eras in [start, end]
//! \throws InvalidRangeError if a bound is negative, start > end or the range spans more than kMaxPlannedEras
std::vector<EraIndex> plan_eras(int64_t start, int64_t end);

std::vector<EraIndex> plan_eras(const EraRange& range);

//! Parse the command-line range: "<start>:<end>", ":<end>" or "<end>", the last two starting from era 0
//! \throws InvalidRangeError on any other form, a non-integer, a negative bound, start > end or an oversized span
EraRange parse_era_range(std::string_view text);

}  // namespace erafetch::fetch
