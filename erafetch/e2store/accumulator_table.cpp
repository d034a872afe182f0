// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "accumulator_table.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <absl/strings/ascii.h>
#include <absl/strings/str_split.h>

#include <erafetch/core/common/util.hpp>

namespace erafetch::e2store {

AccumulatorTable AccumulatorTable::parse(std::string_view content) {
    std::vector<std::string_view> lines = absl::StrSplit(content, '\n');
    // Trailing blank lines are tolerated, blank lines in between would shift the era numbering
    while (!lines.empty() && absl::StripAsciiWhitespace(lines.back()).empty()) {
        lines.pop_back();
    }

    std::vector<Bytes32> roots;
    roots.reserve(lines.size());
    for (size_t era{0}; era < lines.size(); ++era) {
        const auto line{absl::StripAsciiWhitespace(lines[era])};
        const auto bytes{from_hex(line)};
        if (!bytes || bytes->size() != kBytes32Size) {
            throw std::invalid_argument{"invalid accumulator root for era " + std::to_string(era) + ": \"" +
                                        std::string{line} + "\""};
        }
        Bytes32 root{};
        std::copy(bytes->begin(), bytes->end(), root.begin());
        roots.push_back(root);
    }
    return AccumulatorTable{std::move(roots)};
}

AccumulatorTable AccumulatorTable::from_file(const std::filesystem::path& path) {
    std::ifstream file{path};
    if (!file.is_open()) {
        throw std::runtime_error{"cannot open accumulator file " + path.string()};
    }
    std::stringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error{"cannot read accumulator file " + path.string()};
    }
    return parse(content.str());
}

std::optional<Bytes32> AccumulatorTable::find(uint64_t era) const {
    if (era >= roots_.size()) {
        return std::nullopt;
    }
    return roots_[era];
}

}  // namespace erafetch::e2store
