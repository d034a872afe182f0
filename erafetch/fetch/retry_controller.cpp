// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "retry_controller.hpp"

#include <algorithm>
#include <optional>
#include <string>

#include <erafetch/infra/common/ensure.hpp>
#include <erafetch/infra/common/log.hpp>

namespace erafetch::fetch {

RetryController::RetryController(RetrySettings settings, SleepFunction sleep, TransitionFunction transition)
    : settings_{settings}, sleep_{std::move(sleep)}, transition_{std::move(transition)} {
    ensure_pre_condition(settings_.max_attempts > 0, []() { return "max_attempts must be positive"; });
    ensure_pre_condition(static_cast<bool>(sleep_), []() { return "sleep function is required"; });
}

std::chrono::milliseconds RetryController::backoff_delay(uint32_t attempt) const {
    if (attempt == 0) {
        return std::chrono::milliseconds{0};
    }
    // Saturate the doubling before it can overflow
    std::chrono::milliseconds delay{settings_.base_delay};
    for (uint32_t k{1}; k < attempt && delay < settings_.max_delay; ++k) {
        delay *= 2;
    }
    return std::min(delay, settings_.max_delay);
}

void RetryController::transition(EraTask& task, EraState next) {
    if (transition_) {
        transition_(task, next);
    } else {
        task.transition_to(next);
    }
}

Task<EraResult> RetryController::run(EraTask& task, const AttemptFunction& attempt) {
    transition(task, EraState::kFetching);
    while (true) {
        auto& records{task.begin_attempt()};
        std::optional<EraFailure> failure;
        try {
            co_await attempt(records);
        } catch (const FetchError& ex) {
            failure = EraFailure{ex.kind(), ex.what()};
        }

        if (!failure) {
            transition(task, EraState::kEncoding);
            co_return task.take_records();
        }

        const auto kind{failure->kind};
        task.fail_attempt(*failure);
        if (!is_retryable(kind)) {
            ERAF_WARN_M("RetryController", {"era", std::to_string(task.era()), "attempt", std::to_string(task.attempts()),
                                            "failure", std::string{to_string(kind)}, "reason", failure->reason});
            transition(task, EraState::kFailed);
            co_return std::move(*failure);
        }
        if (task.attempts() >= settings_.max_attempts) {
            ERAF_WARN_M("RetryController", {"era", std::to_string(task.era()), "attempts", std::to_string(task.attempts()),
                                            "failure", "ExhaustedRetries", "reason", failure->reason});
            transition(task, EraState::kFailed);
            co_return EraFailure{FetchErrorKind::kExhaustedRetries,
                                 "gave up after " + std::to_string(task.attempts()) + " attempts, last failure: " +
                                     failure->reason};
        }

        const auto delay{backoff_delay(task.attempts())};
        ERAF_DEBUG_M("RetryController", {"era", std::to_string(task.era()), "attempt", std::to_string(task.attempts()),
                                         "failure", std::string{to_string(kind)}, "retry_in", std::to_string(delay.count()) + "ms"});
        transition(task, EraState::kRetrying);
        co_await sleep_(delay);
        transition(task, EraState::kFetching);
    }
}

}  // namespace erafetch::fetch
