// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>

#include "cancellation_token.hpp"
#include "task.hpp"

namespace erafetch {

Task<void> sleep(std::chrono::milliseconds duration);

//! Sleep which ends early with the cancellation error as soon as \p token is cancelled
Task<void> sleep(std::chrono::milliseconds duration, concurrency::CancellationToken& token);

}  // namespace erafetch
