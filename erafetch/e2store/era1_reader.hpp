// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <erafetch/core/common/bytes.hpp>

#include "entry.hpp"

namespace erafetch::e2store {

//! The decoded content of one block of an era1 file
struct Era1Block {
    uint64_t number{0};
    Bytes header;
    Bytes body;
    Bytes receipts;
    Bytes32 total_difficulty{};  // little-endian as stored
};

struct Era1File {
    uint64_t starting_number{0};
    std::vector<Era1Block> blocks;
    Bytes32 accumulator_root{};

    uint64_t last_number() const { return starting_number + blocks.size() - 1; }
};

//! Decode and validate an era1 file content
//! \details Checks the leading Version entry, the block entry sequence, the Accumulator presence and the
//! BlockIndex count and offsets. Block parts are returned uncompressed.
//! \throws DecodingError on any violation, snappy::SnappyError on corrupted compressed data
Era1File read_era1(ByteView data);

//! Read the whole content of a file
//! \throws std::runtime_error if the file cannot be read
Bytes read_file(const std::filesystem::path& path);

//! Read the block count declared by the BlockIndex entry at the tail of an era1 file content
//! \throws DecodingError if the content does not end with a well-formed BlockIndex
uint64_t read_block_count(ByteView data);

struct EntryDifference {
    size_t entry_index{0};
    std::string description;
};

//! Compare two e2store contents entry by entry after decompression of the compressed entries
//! \return the first difference or std::nullopt if the contents are equivalent
std::optional<EntryDifference> compare_entries(ByteView lhs, ByteView rhs);

}  // namespace erafetch::e2store
