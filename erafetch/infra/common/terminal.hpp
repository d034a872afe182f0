// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace erafetch {

//! ANSI escape sequences used to colorize log lines
inline constexpr std::string_view kColorReset{"\x1b[0m"};
inline constexpr std::string_view kColorCoal{"\x1b[90m"};
inline constexpr std::string_view kColorWhite{"\x1b[97m"};
inline constexpr std::string_view kColorRed{"\x1b[91m"};
inline constexpr std::string_view kColorGreen{"\x1b[32m"};
inline constexpr std::string_view kColorYellowHigh{"\x1b[1;33m"};
inline constexpr std::string_view kBackgroundRed{"\x1b[101m"};
inline constexpr std::string_view kBackgroundPurple{"\x1b[105m"};

//! Whether the standard output (if \p std_out) or the standard error is attached to a TTY
bool is_terminal_output(bool std_out);

//! Remove the ANSI color sequences from \p line
size_t strip_colors(std::string& line);

}  // namespace erafetch
