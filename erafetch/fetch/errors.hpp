// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace erafetch::fetch {

//! Classification of the failures an era can end with
enum class FetchErrorKind {
    kInvalidRange,       // run-wide, detected before any fetch
    kTransientStream,    // connection drop, timeout, rate limit: retried
    kShortStream,        // stream ended before the expected block count: retried
    kAuth,               // credential rejected
    kProtocol,           // malformed or out-of-order data
    kExhaustedRetries,   // retryable failures exceeded the attempt budget
    kEncode,             // era encoding failed
    kWrite,              // durable write failed
};

std::string_view to_string(FetchErrorKind kind);

//! Whether a failure of this kind triggers a new attempt
bool is_retryable(FetchErrorKind kind);

class FetchError : public std::runtime_error {
  public:
    FetchError(FetchErrorKind kind, const std::string& reason) : std::runtime_error{reason}, kind_{kind} {}

    FetchErrorKind kind() const { return kind_; }

  private:
    FetchErrorKind kind_;
};

class InvalidRangeError : public FetchError {
  public:
    explicit InvalidRangeError(const std::string& reason) : FetchError{FetchErrorKind::kInvalidRange, reason} {}
};

class TransientStreamError : public FetchError {
  public:
    explicit TransientStreamError(const std::string& reason) : FetchError{FetchErrorKind::kTransientStream, reason} {}
};

class ShortStreamError : public FetchError {
  public:
    explicit ShortStreamError(const std::string& reason) : FetchError{FetchErrorKind::kShortStream, reason} {}
};

class AuthError : public FetchError {
  public:
    explicit AuthError(const std::string& reason) : FetchError{FetchErrorKind::kAuth, reason} {}
};

class ProtocolError : public FetchError {
  public:
    explicit ProtocolError(const std::string& reason) : FetchError{FetchErrorKind::kProtocol, reason} {}
};

class EncodeError : public FetchError {
  public:
    explicit EncodeError(const std::string& reason) : FetchError{FetchErrorKind::kEncode, reason} {}
};

class WriteError : public FetchError {
  public:
    explicit WriteError(const std::string& reason) : FetchError{FetchErrorKind::kWrite, reason} {}
};

}  // namespace erafetch::fetch
