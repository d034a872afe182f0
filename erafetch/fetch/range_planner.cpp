// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "range_planner.hpp"

#include <string>

#include <absl/strings/numbers.h>

namespace erafetch::fetch {

static void check_span(EraIndex start, EraIndex end, const std::string& range) {
    if (start > end) {
        throw InvalidRangeError{"start era " + std::to_string(start) + " is after end era " + std::to_string(end)};
    }
    if (end - start >= kMaxPlannedEras) {
        throw InvalidRangeError{"era range " + range + " spans more than " + std::to_string(kMaxPlannedEras) + " eras"};
    }
}

std::vector<EraIndex> plan_eras(int64_t start, int64_t end) {
    if (start < 0 || end < 0) {
        throw InvalidRangeError{"negative era bound in range " + std::to_string(start) + ":" + std::to_string(end)};
    }
    return plan_eras(EraRange{static_cast<EraIndex>(start), static_cast<EraIndex>(end)});
}

std::vector<EraIndex> plan_eras(const EraRange& range) {
    check_span(range.start, range.end, std::to_string(range.start) + ":" + std::to_string(range.end));
    std::vector<EraIndex> eras;
    eras.reserve(range.size());
    for (EraIndex era{range.start};; ++era) {
        eras.push_back(era);
        if (era == range.end) break;
    }
    return eras;
}

static int64_t parse_bound(std::string_view text, std::string_view range) {
    const std::string_view digits{text.starts_with('-') ? text.substr(1) : text};
    int64_t bound{0};
    if (digits.empty() || digits.find_first_not_of("0123456789") != std::string_view::npos ||
        !absl::SimpleAtoi(text, &bound)) {
        throw InvalidRangeError{"invalid era range \"" + std::string{range} + "\": expected <start>:<end>"};
    }
    if (bound < 0) {
        throw InvalidRangeError{"invalid era range \"" + std::string{range} + "\": negative bound"};
    }
    return bound;
}

EraRange parse_era_range(std::string_view text) {
    const auto separator{text.find(':')};
    int64_t start{0};
    int64_t end{0};
    if (separator == std::string_view::npos) {
        end = parse_bound(text, text);
    } else {
        const std::string_view start_text{text.substr(0, separator)};
        const std::string_view end_text{text.substr(separator + 1)};
        start = start_text.empty() ? 0 : parse_bound(start_text, text);
        end = parse_bound(end_text, text);
    }
    if (start > end) {
        throw InvalidRangeError{"invalid era range \"" + std::string{text} + "\": start is after end"};
    }
    check_span(static_cast<EraIndex>(start), static_cast<EraIndex>(end), "\"" + std::string{text} + "\"");
    return EraRange{static_cast<EraIndex>(start), static_cast<EraIndex>(end)};
}

}  // namespace erafetch::fetch
