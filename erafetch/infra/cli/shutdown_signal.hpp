// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/signal_set.hpp>

namespace erafetch::cmd::common {

//! Catches SIGINT and SIGTERM, the callback runs on the executor the signal set is bound to
class ShutdownSignal {
  public:
    using SignalNumber = int;
    using Callback = std::function<void(SignalNumber)>;

    explicit ShutdownSignal(const boost::asio::any_io_executor& executor);

    //! Invoke \p callback once, on the first signal caught
    void on_signal(Callback callback);

    //! Stop waiting for signals, the pending callback is dropped
    void cancel();

  private:
    boost::asio::signal_set signals_;
};

}  // namespace erafetch::cmd::common
