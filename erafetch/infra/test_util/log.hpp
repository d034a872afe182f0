// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>

#include <erafetch/infra/common/log.hpp>

namespace erafetch::test_util {

//! Sets the log verbosity for the lifetime of the guard, so that tests do not depend on their order
class SetLogVerbosityGuard {
  public:
    explicit SetLogVerbosityGuard(log::Level level) : saved_level_{log::get_verbosity()} { log::set_verbosity(level); }
    ~SetLogVerbosityGuard() { log::set_verbosity(saved_level_); }

    SetLogVerbosityGuard(const SetLogVerbosityGuard&) = delete;
    SetLogVerbosityGuard& operator=(const SetLogVerbosityGuard&) = delete;

  private:
    log::Level saved_level_;
};

//! Redirects \p redirected into \p target for the lifetime of the guard, e.g. to capture std::cerr
class StreamSwap {
  public:
    StreamSwap(std::ostream& redirected, std::ostream& target)
        : redirected_{redirected}, saved_buffer_{redirected.rdbuf(target.rdbuf())} {}
    ~StreamSwap() { redirected_.rdbuf(saved_buffer_); }

    StreamSwap(const StreamSwap&) = delete;
    StreamSwap& operator=(const StreamSwap&) = delete;

  private:
    std::ostream& redirected_;
    std::streambuf* saved_buffer_;
};

}  // namespace erafetch::test_util
