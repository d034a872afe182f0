// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "era_task.hpp"

#include <string>

#include <erafetch/infra/common/ensure.hpp>

namespace erafetch::fetch {

void EraTask::transition_to(EraState next) {
    ensure(is_valid_transition(state_, next), [&]() {
        return "era " + std::to_string(era_) + ": invalid transition " + std::string{to_string(state_)} + " -> " +
               std::string{to_string(next)};
    });
    state_ = next;
}

std::vector<BlockRecord>& EraTask::begin_attempt() {
    ++attempts_;
    records_.clear();
    return records_;
}

void EraTask::fail_attempt(EraFailure failure) {
    records_.clear();
    last_failure_ = std::move(failure);
}

std::vector<BlockRecord> EraTask::take_records() {
    for (size_t i{0}; i < records_.size(); ++i) {
        ensure_invariant(records_[i].sequence == i, [&]() {
            return "era " + std::to_string(era_) + ": record " + std::to_string(i) + " has sequence " +
                   std::to_string(records_[i].sequence);
        });
    }
    std::vector<BlockRecord> records;
    records.swap(records_);
    return records;
}

}  // namespace erafetch::fetch
