// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>

#include <erafetch/infra/concurrency/task.hpp>

#include "types.hpp"

namespace erafetch::fetch {

//! Delay before a new attempt, returns early with the cancellation error when the run is cancelled
using SleepFunction = std::function<Task<void>(std::chrono::milliseconds)>;

//! The settings for retrying failed era streams
struct RetrySettings {
    constexpr static uint32_t kDefaultMaxAttempts{5};
    constexpr static std::chrono::milliseconds kDefaultBaseDelay{500};
    constexpr static std::chrono::milliseconds kDefaultMaxDelay{30'000};

    //! Total number of attempts per era, the first one included
    uint32_t max_attempts{kDefaultMaxAttempts};

    //! Delay before the second attempt, doubled for each further one
    std::chrono::milliseconds base_delay{kDefaultBaseDelay};

    //! Upper bound of the delay between two attempts
    std::chrono::milliseconds max_delay{kDefaultMaxDelay};
};

//! The settings for one fetch run
struct FetchSettings {
    constexpr static size_t kDefaultConcurrency{4};
    constexpr static size_t kDefaultMaxWriteBacklog{2};
    constexpr static size_t kDefaultBlockingThreads{2};

    //! Token for the block stream service
    Credential credential;

    //! Directory receiving the era files
    std::filesystem::path output_dir;

    //! Max number of eras streamed at the same time
    size_t concurrency{kDefaultConcurrency};

    //! No new era is admitted while more than this number of eras are being written
    size_t max_write_backlog{kDefaultMaxWriteBacklog};

    //! Threads dedicated to encoding and disk writes
    size_t blocking_threads{kDefaultBlockingThreads};

    //! Max time to wait for one block, no limit if empty
    std::optional<std::chrono::milliseconds> read_timeout;

    RetrySettings retry;

    //! Backoff sleep, a cancellable timer if empty
    SleepFunction sleep;
};

}  // namespace erafetch::fetch
