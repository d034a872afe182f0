// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

namespace erafetch::fetch {

std::string_view to_string(EraState state) {
    switch (state) {
        case EraState::kPending:
            return "Pending";
        case EraState::kFetching:
            return "Fetching";
        case EraState::kRetrying:
            return "Retrying";
        case EraState::kEncoding:
            return "Encoding";
        case EraState::kWriting:
            return "Writing";
        case EraState::kDone:
            return "Done";
        case EraState::kFailed:
            return "Failed";
    }
    return "Unknown";
}

bool is_valid_transition(EraState from, EraState to) {
    switch (from) {
        case EraState::kPending:
            return to == EraState::kFetching;
        case EraState::kFetching:
            return to == EraState::kRetrying || to == EraState::kEncoding || to == EraState::kFailed;
        case EraState::kRetrying:
            return to == EraState::kFetching || to == EraState::kFailed;
        case EraState::kEncoding:
            return to == EraState::kWriting || to == EraState::kFailed;
        case EraState::kWriting:
            return to == EraState::kDone || to == EraState::kFailed;
        case EraState::kDone:
        case EraState::kFailed:
            return false;
    }
    return false;
}

std::vector<EraIndex> FetchReport::failed_eras() const {
    std::vector<EraIndex> eras;
    eras.reserve(failures.size());
    for (const auto& failed : failures) {
        eras.push_back(failed.era);
    }
    return eras;
}

int to_exit_status(const FetchReport& report) {
    if (!report.cancelled.empty()) {
        return kExitCancelled;
    }
    return report.failures.empty() ? kExitSuccess : kExitFailedEras;
}

}  // namespace erafetch::fetch
