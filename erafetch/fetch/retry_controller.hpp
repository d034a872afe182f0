// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include <erafetch/infra/concurrency/task.hpp>

#include "era_task.hpp"
#include "settings.hpp"
#include "types.hpp"

namespace erafetch::fetch {

/**
 * Drives the attempts of one era.
 * TransientStream and ShortStream failures are retried from block zero after an exponential backoff
 * min(base_delay * 2^(k-1), max_delay) following attempt k, until max_attempts is reached and the failure
 * becomes ExhaustedRetries. Any other FetchError ends the era at once. Cancellation propagates as
 * boost::system::system_error with operation_canceled.
 */
class RetryController {
  public:
    //! One ingestion attempt filling the given empty buffer
    using AttemptFunction = std::function<Task<void>(std::vector<BlockRecord>&)>;

    //! Applies a state change to a task, gives the owner a chance to observe it
    using TransitionFunction = std::function<void(EraTask&, EraState)>;

    RetryController(RetrySettings settings, SleepFunction sleep, TransitionFunction transition = {});

    //! Delay to wait after the failed attempt number \p attempt (1-based)
    std::chrono::milliseconds backoff_delay(uint32_t attempt) const;

    //! Run attempts until success or a terminal failure, leaving \p task in Encoding or Failed state
    Task<EraResult> run(EraTask& task, const AttemptFunction& attempt);

  private:
    void transition(EraTask& task, EraState next);

    RetrySettings settings_;
    SleepFunction sleep_;
    TransitionFunction transition_;
};

}  // namespace erafetch::fetch
