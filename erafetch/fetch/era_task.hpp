// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "types.hpp"

namespace erafetch::fetch {

//! The mutable unit of work for one era
class EraTask {
  public:
    explicit EraTask(EraIndex era) : era_{era} {}

    EraIndex era() const { return era_; }
    EraState state() const { return state_; }
    uint32_t attempts() const { return attempts_; }
    const std::vector<BlockRecord>& records() const { return records_; }
    const std::optional<EraFailure>& last_failure() const { return last_failure_; }

    //! Move to \p next state
    //! \throws std::logic_error if the state machine does not allow it
    void transition_to(EraState next);

    //! Start a new attempt from block zero
    //! \return the cleared buffer receiving the records of the attempt
    std::vector<BlockRecord>& begin_attempt();

    //! Record the failure of the current attempt and drop its records
    void fail_attempt(EraFailure failure);

    //! Hand out the complete record sequence of the successful attempt
    //! \throws std::logic_error if the sequence numbers are not exactly 0..count-1
    std::vector<BlockRecord> take_records();

  private:
    EraIndex era_;
    EraState state_{EraState::kPending};
    uint32_t attempts_{0};
    std::vector<BlockRecord> records_;
    std::optional<EraFailure> last_failure_;
};

}  // namespace erafetch::fetch
