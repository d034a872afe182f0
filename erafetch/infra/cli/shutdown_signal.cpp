// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "shutdown_signal.hpp"

#include <csignal>
#include <string>
#include <utility>

#include <boost/asio/error.hpp>
#include <boost/system/system_error.hpp>

#include <erafetch/infra/common/log.hpp>

namespace erafetch::cmd::common {

ShutdownSignal::ShutdownSignal(const boost::asio::any_io_executor& executor) : signals_{executor, SIGINT, SIGTERM} {}

void ShutdownSignal::on_signal(Callback callback) {
    signals_.async_wait([callback = std::move(callback)](const boost::system::error_code& ec, SignalNumber number) {
        if (ec == boost::asio::error::operation_aborted) {
            ERAF_TRACE_M("ShutdownSignal", {"wait", "cancelled"});
            return;
        }
        if (ec) {
            ERAF_ERROR_M("ShutdownSignal", {"wait", "failed", "error", ec.message()});
            throw boost::system::system_error{ec};
        }
        ERAF_INFO_M("ShutdownSignal", {"signal", std::to_string(number)}) << "shutdown requested";
        callback(number);
    });
}

void ShutdownSignal::cancel() {
    boost::system::error_code ec;
    signals_.cancel(ec);
    if (ec) {
        ERAF_WARN_M("ShutdownSignal", {"cancel", "failed", "error", ec.message()});
    }
}

}  // namespace erafetch::cmd::common
