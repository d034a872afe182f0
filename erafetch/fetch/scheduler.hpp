// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include <erafetch/infra/concurrency/awaitable_condition_variable.hpp>
#include <erafetch/infra/concurrency/cancellation_token.hpp>
#include <erafetch/infra/concurrency/task.hpp>

#include "block_stream.hpp"
#include "disk_writer.hpp"
#include "era_encoder.hpp"
#include "era_task.hpp"
#include "retry_controller.hpp"
#include "settings.hpp"
#include "types.hpp"

namespace erafetch::fetch {

/**
 * Fetches a list of eras with bounded concurrency.
 * N worker coroutines share the scheduler executor, each one carrying an era end to end: stream attempts,
 * then encoding and durable write on the blocking thread pool. At most N eras are in Fetching or Retrying
 * state at any time and pending eras are admitted in ascending order. No era is admitted while the number
 * of eras being written exceeds the write backlog threshold.
 * \warning run() and cancel() must be called on the same single-threaded executor
 */
class EraFetchScheduler {
  public:
    using StateObserver = std::function<void(EraIndex era, EraState from, EraState to)>;

    EraFetchScheduler(FetchSettings settings, BlockStreamClient& client, const EraEncoder& encoder);
    ~EraFetchScheduler();

    EraFetchScheduler(const EraFetchScheduler&) = delete;
    EraFetchScheduler& operator=(const EraFetchScheduler&) = delete;

    //! Fetch every era in \p eras, which must be in ascending order without duplicates
    //! \return the per-era breakdown, failed eras included, once every era is done, failed or cancelled
    Task<FetchReport> run(std::vector<EraIndex> eras);

    //! Stop the run: in-flight streams are closed, backoff timers and admission waits interrupted,
    //! pending commits aborted. Eras already written stay on disk.
    void cancel();

    //! Register a hook notified of every state transition
    void on_state_change(StateObserver observer) { observer_ = std::move(observer); }

    size_t in_flight() const { return in_flight_; }
    size_t write_backlog() const { return write_backlog_; }
    DiskWriter& writer() { return writer_; }

  private:
    Task<void> run_worker();
    Task<void> wait_for_admission();
    Task<void> process(EraTask& task);
    Task<void> encode_and_write(EraTask& task, std::vector<BlockRecord> records);

    void transition(EraTask& task, EraState next);
    void claim_in_flight_slot();
    void release_in_flight_slot();
    void record_failure(EraTask& task, EraFailure failure);

    FetchSettings settings_;
    BlockStreamClient& client_;
    const EraEncoder& encoder_;
    DiskWriter writer_;
    RetryController retry_controller_;
    boost::asio::thread_pool blocking_pool_;
    concurrency::CancellationToken cancellation_token_;
    concurrency::AwaitableConditionVariable backlog_changed_;
    StateObserver observer_;

    std::atomic<size_t> in_flight_{0};
    std::atomic<size_t> write_backlog_{0};

    std::deque<EraTask> tasks_;
    size_t next_pending_{0};
    FetchReport report_;
};

}  // namespace erafetch::fetch
