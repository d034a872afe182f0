// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <erafetch/core/common/bytes.hpp>

namespace erafetch::e2store {

//! Number of blocks in a full era
constexpr uint64_t kBlocksPerEra{8192};

//! Era1 version string carried by every file
constexpr uint16_t kEra1Version{0x3265};

//! The uncompressed parts of one block as stored in an era1 file
struct BlockTuple {
    ByteView header;            // RLP-encoded header
    ByteView body;              // RLP-encoded body
    ByteView receipts;          // RLP-encoded receipts
    ByteView total_difficulty;  // big-endian, at most 32 bytes
};

//! Convert a big-endian total difficulty into the 32-byte little-endian form stored in era1
//! \throws std::invalid_argument if the value is longer than 32 bytes
Bytes32 total_difficulty_to_le(ByteView big_endian);

//! Convert a stored 32-byte little-endian total difficulty back into minimal big-endian form
Bytes total_difficulty_to_be(const Bytes32& little_endian);

/**
 * Accumulates the blocks of one era into an in-memory era1 file.
 * Layout: Version, then per block CompressedHeader, CompressedBody, CompressedReceipts, TotalDifficulty,
 * then Accumulator and finally BlockIndex. BlockIndex holds the starting block number, one offset per block
 * relative to the start of the BlockIndex entry and the block count.
 */
class Era1Builder {
  public:
    //! Append one block: numbers must be consecutive starting from the first added block
    //! \throws std::invalid_argument on a non-consecutive number or an oversized part
    void add(uint64_t block_number, const BlockTuple& block);

    //! Write the trailing Accumulator and BlockIndex entries and hand out the file content
    //! \throws std::logic_error if no block has been added
    Bytes finalize(const Bytes32& accumulator_root);

    size_t block_count() const { return offsets_.size(); }
    std::optional<uint64_t> starting_number() const { return starting_number_; }

  private:
    Bytes buffer_;
    std::vector<uint64_t> offsets_;
    std::optional<uint64_t> starting_number_;
};

}  // namespace erafetch::e2store
