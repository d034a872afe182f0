// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "scheduler.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

#include <erafetch/infra/common/ensure.hpp>
#include <erafetch/infra/common/log.hpp>
#include <erafetch/infra/concurrency/event_notifier.hpp>
#include <erafetch/infra/concurrency/sleep.hpp>
#include <erafetch/infra/concurrency/spawn.hpp>

#include "stream_session.hpp"

namespace erafetch::fetch {

static SleepFunction make_backoff_sleep(SleepFunction sleep, concurrency::CancellationToken& token) {
    if (!sleep) {
        return [&token](std::chrono::milliseconds delay) -> Task<void> {
            co_await erafetch::sleep(delay, token);
        };
    }
    return [sleep = std::move(sleep), &token](std::chrono::milliseconds delay) -> Task<void> {
        token.throw_if_cancelled();
        co_await sleep(delay);
        token.throw_if_cancelled();
    };
}

EraFetchScheduler::EraFetchScheduler(FetchSettings settings, BlockStreamClient& client, const EraEncoder& encoder)
    : settings_{std::move(settings)},
      client_{client},
      encoder_{encoder},
      writer_{settings_.output_dir},
      retry_controller_{settings_.retry,
                        make_backoff_sleep(settings_.sleep, cancellation_token_),
                        [this](EraTask& task, EraState next) { transition(task, next); }},
      blocking_pool_{std::max<size_t>(settings_.blocking_threads, 1)} {
    ensure_pre_condition(settings_.concurrency > 0, []() { return "concurrency must be positive"; });
}

EraFetchScheduler::~EraFetchScheduler() {
    blocking_pool_.join();
}

void EraFetchScheduler::cancel() {
    if (cancellation_token_.is_cancelled()) return;
    ERAF_INFO_M("EraFetchScheduler") << "cancellation requested";
    cancellation_token_.cancel();
}

Task<FetchReport> EraFetchScheduler::run(std::vector<EraIndex> eras) {
    ensure_pre_condition(std::adjacent_find(eras.begin(), eras.end(), std::greater_equal<>{}) == eras.end(),
                         []() { return "eras must be strictly ascending"; });
    ensure(tasks_.empty(), "EraFetchScheduler::run can be called only once");

    for (const auto era : eras) {
        tasks_.emplace_back(era);
    }
    next_pending_ = 0;
    report_ = {};

    const auto workers{std::min(settings_.concurrency, tasks_.size())};
    ERAF_INFO_M("EraFetchScheduler", {"eras", std::to_string(tasks_.size()), "workers", std::to_string(workers),
                                      "output", settings_.output_dir.string()});

    // Cancellation wakes up the workers blocked in admission
    const auto wake_on_cancel{cancellation_token_.on_cancel([this]() { backlog_changed_.notify_all(); })};

    auto executor = co_await boost::asio::this_coro::executor;
    concurrency::EventNotifier all_done{executor};
    size_t running{workers};
    std::exception_ptr worker_failure;
    for (size_t i{0}; i < workers; ++i) {
        boost::asio::co_spawn(executor, run_worker(), [&](std::exception_ptr ex) {
            if (ex && !worker_failure) {
                worker_failure = ex;
                // An internal failure stops the whole run
                cancellation_token_.cancel();
            }
            if (--running == 0) {
                all_done.notify();
            }
        });
    }
    if (workers > 0) {
        co_await all_done.wait();
    }
    if (worker_failure) {
        std::rethrow_exception(worker_failure);
    }

    if (cancellation_token_.is_cancelled()) {
        writer_.remove_in_progress();
        for (const auto& task : tasks_) {
            if (task.state() != EraState::kDone && task.state() != EraState::kFailed) {
                report_.cancelled.push_back(task.era());
            }
        }
    }

    std::sort(report_.receipts.begin(), report_.receipts.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.era < rhs.era; });
    std::sort(report_.failures.begin(), report_.failures.end(),
              [](const auto& lhs, const auto& rhs) { return lhs.era < rhs.era; });
    ERAF_INFO_M("EraFetchScheduler", {"done", std::to_string(report_.receipts.size()),
                                      "failed", std::to_string(report_.failures.size()),
                                      "cancelled", std::to_string(report_.cancelled.size())});
    co_return std::move(report_);
}

Task<void> EraFetchScheduler::run_worker() {
    while (true) {
        co_await wait_for_admission();
        if (cancellation_token_.is_cancelled() || next_pending_ == tasks_.size()) {
            co_return;
        }
        EraTask& task{tasks_[next_pending_++]};
        co_await process(task);
    }
}

Task<void> EraFetchScheduler::wait_for_admission() {
    while (write_backlog_ > settings_.max_write_backlog && !cancellation_token_.is_cancelled()) {
        auto waiter{backlog_changed_.waiter()};
        if (write_backlog_ <= settings_.max_write_backlog || cancellation_token_.is_cancelled()) {
            break;
        }
        ERAF_TRACE_M("EraFetchScheduler", {"admission", "waiting", "write_backlog", std::to_string(write_backlog_)});
        co_await waiter();
    }
}

Task<void> EraFetchScheduler::process(EraTask& task) {
    const RetryController::AttemptFunction attempt = [this, &task](std::vector<BlockRecord>& records) -> Task<void> {
        StreamSession session{client_, task.era(), settings_.credential, cancellation_token_, settings_.read_timeout};
        co_await session.run(records);
    };

    std::optional<EraResult> result;
    std::exception_ptr fetch_failure;
    try {
        result = co_await retry_controller_.run(task, attempt);
    } catch (...) {
        fetch_failure = std::current_exception();
    }
    if (fetch_failure) {
        if (is_in_flight(task.state())) {
            release_in_flight_slot();
        }
        try {
            std::rethrow_exception(fetch_failure);
        } catch (const boost::system::system_error& ex) {
            if (!concurrency::is_cancellation(ex)) throw;
            ERAF_DEBUG_M("EraFetchScheduler", {"era", std::to_string(task.era()), "fetch", "cancelled"});
        }
        co_return;
    }

    if (auto* failure = std::get_if<EraFailure>(&*result)) {
        record_failure(task, std::move(*failure));
        co_return;
    }
    co_await encode_and_write(task, std::get<std::vector<BlockRecord>>(std::move(*result)));
}

Task<void> EraFetchScheduler::encode_and_write(EraTask& task, std::vector<BlockRecord> records) {
    const EraIndex era{task.era()};
    const uint64_t block_count{records.size()};

    std::optional<Bytes> content;
    std::optional<EraFailure> failure;
    try {
        content = co_await concurrency::spawn_task(blocking_pool_, [this, era, records = std::move(records)]() -> Task<Bytes> {
            co_return encoder_.encode(era, records);
        });
    } catch (const EncodeError& ex) {
        failure = EraFailure{ex.kind(), ex.what()};
    }
    if (failure) {
        transition(task, EraState::kFailed);
        record_failure(task, std::move(*failure));
        co_return;
    }
    if (cancellation_token_.is_cancelled()) {
        co_return;
    }

    transition(task, EraState::kWriting);
    ++write_backlog_;
    std::optional<WriteReceipt> receipt;
    std::exception_ptr write_failure;
    try {
        receipt = co_await concurrency::spawn_task(blocking_pool_, [this, era, &content, block_count]() -> Task<WriteReceipt> {
            co_return writer_.commit(era, *content, block_count, &cancellation_token_);
        });
    } catch (...) {
        write_failure = std::current_exception();
    }
    --write_backlog_;
    backlog_changed_.notify_all();

    if (write_failure) {
        try {
            std::rethrow_exception(write_failure);
        } catch (const WriteError& ex) {
            failure = EraFailure{ex.kind(), ex.what()};
        } catch (const boost::system::system_error& ex) {
            if (!concurrency::is_cancellation(ex)) throw;
            ERAF_DEBUG_M("EraFetchScheduler", {"era", std::to_string(era), "write", "cancelled"});
        }
        if (failure) {
            transition(task, EraState::kFailed);
            record_failure(task, std::move(*failure));
        }
        co_return;
    }

    transition(task, EraState::kDone);
    ERAF_INFO_M("EraFetchScheduler", {"era", std::to_string(era), "blocks", std::to_string(receipt->block_count),
                                      "bytes", std::to_string(receipt->byte_count), "attempts", std::to_string(task.attempts())});
    report_.receipts.push_back(std::move(*receipt));
}

void EraFetchScheduler::transition(EraTask& task, EraState next) {
    const EraState previous{task.state()};
    task.transition_to(next);
    if (!is_in_flight(previous) && is_in_flight(next)) {
        claim_in_flight_slot();
    } else if (is_in_flight(previous) && !is_in_flight(next)) {
        release_in_flight_slot();
    }
    ERAF_TRACE_M("EraFetchScheduler", {"era", std::to_string(task.era()), "from", std::string{to_string(previous)},
                                       "to", std::string{to_string(next)}});
    if (observer_) {
        observer_(task.era(), previous, next);
    }
}

void EraFetchScheduler::claim_in_flight_slot() {
    size_t current{in_flight_.load()};
    do {
        ensure_invariant(current < settings_.concurrency, [&]() {
            return "in-flight eras would exceed concurrency " + std::to_string(settings_.concurrency);
        });
    } while (!in_flight_.compare_exchange_weak(current, current + 1));
}

void EraFetchScheduler::release_in_flight_slot() {
    const auto previous{in_flight_.fetch_sub(1)};
    ensure_invariant(previous > 0, []() { return "in-flight counter underflow"; });
}

void EraFetchScheduler::record_failure(EraTask& task, EraFailure failure) {
    ERAF_ERROR_M("EraFetchScheduler", {"era", std::to_string(task.era()), "failure", std::string{to_string(failure.kind)},
                                       "reason", failure.reason});
    report_.failures.push_back(FailedEra{task.era(), std::move(failure)});
}

}  // namespace erafetch::fetch
