// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

namespace erafetch {

static constexpr const char* kHexDigits{"0123456789abcdef"};

static std::optional<uint8_t> decode_hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return std::nullopt;
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    std::string out(bytes.size() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{out.data()};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    if (has_hex_prefix(hex)) {
        hex.remove_prefix(2);
    }
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t odd{hex.length() & 1};  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + odd) / 2, 0);
    size_t src{0};
    size_t dst{0};
    if (odd) {
        const auto lo{decode_hex_digit(hex[src++])};
        if (!lo) return std::nullopt;
        out[dst++] = *lo;
    }
    while (src < hex.length()) {
        const auto hi{decode_hex_digit(hex[src++])};
        const auto lo{decode_hex_digit(hex[src++])};
        if (!hi || !lo) return std::nullopt;
        out[dst++] = static_cast<uint8_t>((*hi << 4) | *lo);
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

}  // namespace erafetch
