// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <stdexcept>
#include <string>

namespace erafetch {

//! Message built only when the check fails
using MessageBuilder = std::function<std::string()>;

//! \throws std::logic_error with \p message if \p condition does not hold
template <size_t N>
void ensure(bool condition, const char (&message)[N]) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{message};
    }
}

//! \throws std::logic_error with the built message if \p condition does not hold
inline void ensure(bool condition, const MessageBuilder& build_message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{build_message()};
    }
}

//! A broken internal invariant: never handled as a per-era failure
inline void ensure_invariant(bool condition, const MessageBuilder& build_message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{"invariant violated: " + build_message()};
    }
}

//! A caller passing an invalid argument
inline void ensure_pre_condition(bool condition, const MessageBuilder& build_message) {
    if (!condition) [[unlikely]] {
        throw std::invalid_argument{"pre-condition violated: " + build_message()};
    }
}

}  // namespace erafetch
