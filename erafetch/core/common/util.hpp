// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <erafetch/core/common/bytes.hpp>

namespace erafetch {

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

//! \brief Parses a string input value representing hex values with or without the 0x prefix
//! \remarks An odd number of digits is accepted as if left-padded with one zero digit
std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

}  // namespace erafetch
