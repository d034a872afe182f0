// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

#include <erafetch/core/common/bytes.hpp>

namespace erafetch::e2store {

//! \brief Header accumulator roots indexed by era, as published for pre-merge history.
//! The text form holds one 32-byte hex value per line, line N being the root of era N.
class AccumulatorTable {
  public:
    AccumulatorTable() = default;
    explicit AccumulatorTable(std::vector<Bytes32> roots) : roots_{std::move(roots)} {}

    //! \throws std::invalid_argument on a malformed line
    static AccumulatorTable parse(std::string_view content);

    //! \throws std::runtime_error if the file cannot be read, std::invalid_argument on a malformed line
    static AccumulatorTable from_file(const std::filesystem::path& path);

    std::optional<Bytes32> find(uint64_t era) const;

    //! Whether every era in the inclusive range [first, last] has a root
    bool covers(uint64_t first, uint64_t last) const { return first <= last && last < roots_.size(); }

    size_t size() const { return roots_.size(); }

  private:
    std::vector<Bytes32> roots_;
};

}  // namespace erafetch::e2store
