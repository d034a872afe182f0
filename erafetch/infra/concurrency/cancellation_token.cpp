// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "cancellation_token.hpp"

#include <utility>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>

namespace erafetch::concurrency {

boost::system::system_error make_cancellation_error() {
    return boost::system::system_error{boost::system::errc::make_error_code(boost::system::errc::operation_canceled)};
}

bool is_cancellation(const boost::system::system_error& error) {
    return error.code() == boost::system::errc::operation_canceled ||
           error.code() == boost::asio::error::operation_aborted;
}

CancellationToken::Registration::Registration(Registration&& other) noexcept
    : token_(std::exchange(other.token_, nullptr)), id_(other.id_) {}

CancellationToken::Registration& CancellationToken::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        reset();
        token_ = std::exchange(other.token_, nullptr);
        id_ = other.id_;
    }
    return *this;
}

void CancellationToken::Registration::reset() {
    if (token_) {
        token_->unregister(id_);
        token_ = nullptr;
    }
}

void CancellationToken::cancel() {
    std::vector<Handler> handlers;
    {
        std::scoped_lock lock{mutex_};
        if (cancelled_.exchange(true)) {
            return;
        }
        handlers.reserve(handlers_.size());
        for (auto& [_, handler] : handlers_) {
            handlers.push_back(std::move(handler));
        }
        handlers_.clear();
    }
    // Handlers must run outside the lock because they may unregister themselves
    for (auto& handler : handlers) {
        handler();
    }
}

CancellationToken::Registration CancellationToken::on_cancel(Handler handler) {
    {
        std::scoped_lock lock{mutex_};
        if (!cancelled_) {
            const auto id = next_id_++;
            handlers_.emplace(id, std::move(handler));
            return Registration{this, id};
        }
    }
    handler();
    return Registration{};
}

void CancellationToken::throw_if_cancelled() const {
    if (cancelled_) {
        throw make_cancellation_error();
    }
}

size_t CancellationToken::handler_count() const {
    std::scoped_lock lock{mutex_};
    return handlers_.size();
}

void CancellationToken::unregister(uint64_t id) {
    std::scoped_lock lock{mutex_};
    handlers_.erase(id);
}

}  // namespace erafetch::concurrency
