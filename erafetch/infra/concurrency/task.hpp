// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <coroutine>
#include <utility>

#include <boost/asio/awaitable.hpp>

//! Plain \erafetch namespace so that Task<T> is visible from every module without qualification
namespace erafetch {

//! Asynchronous task returned by any coroutine, i.e. asynchronous operation
template <typename T>
using Task = boost::asio::awaitable<T>;

}  // namespace erafetch
