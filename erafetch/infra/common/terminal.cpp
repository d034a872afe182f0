// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#include <unistd.h>

namespace erafetch {

bool is_terminal_output(bool std_out) {
    return ::isatty(std_out ? STDOUT_FILENO : STDERR_FILENO) != 0;
}

size_t strip_colors(std::string& line) {
    size_t removed{0};
    std::string::size_type start{0};
    while ((start = line.find("\x1b[", start)) != std::string::npos) {
        const auto end{line.find_first_not_of("0123456789;", start + 2)};
        if (end == std::string::npos || line[end] != 'm') {
            start += 2;
            continue;
        }
        line.erase(start, end - start + 1);
        removed += end - start + 1;
    }
    return removed;
}

}  // namespace erafetch
