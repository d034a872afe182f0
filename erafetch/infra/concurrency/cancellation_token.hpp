// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

#include <boost/system/system_error.hpp>

namespace erafetch::concurrency {

//! Build the error used to surface a cancelled operation
boost::system::system_error make_cancellation_error();

//! Whether the given error denotes a cancelled operation (either our own or an aborted asio operation)
bool is_cancellation(const boost::system::system_error& error);

//! \brief Run-wide cooperative cancellation.
//! Suspended operations register a handler which unblocks them (close a stream, cancel a timer, wake a waiter).
//! \warning cancel() and handler registration must happen on the same executor, is_cancelled() is thread-safe
class CancellationToken {
  public:
    using Handler = std::function<void()>;

    //! RAII handle for a registered handler: the handler is dropped when the handle goes out of scope
    class Registration {
      public:
        Registration() = default;
        Registration(CancellationToken* token, uint64_t id) : token_(token), id_(id) {}
        ~Registration() { reset(); }

        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;
        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;

        void reset();

      private:
        CancellationToken* token_{nullptr};
        uint64_t id_{0};
    };

    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    bool is_cancelled() const { return cancelled_; }

    //! Mark as cancelled and run every registered handler once
    void cancel();

    //! Register a handler to be run on cancellation. If already cancelled, the handler runs immediately.
    [[nodiscard]] Registration on_cancel(Handler handler);

    //! Throw the cancellation error if cancellation has been requested
    void throw_if_cancelled() const;

    size_t handler_count() const;

  private:
    void unregister(uint64_t id);

    std::atomic_bool cancelled_{false};
    mutable std::mutex mutex_;
    std::map<uint64_t, Handler> handlers_;
    uint64_t next_id_{1};
};

}  // namespace erafetch::concurrency
