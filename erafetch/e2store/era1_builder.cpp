// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "era1_builder.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

#include <boost/endian/conversion.hpp>

#include <erafetch/infra/common/ensure.hpp>

#include "entry.hpp"
#include "snappy_codec.hpp"

namespace erafetch::e2store {

Bytes32 total_difficulty_to_le(ByteView big_endian) {
    if (big_endian.size() > kBytes32Size) {
        throw std::invalid_argument{"total difficulty too large: " + std::to_string(big_endian.size()) + " bytes"};
    }
    Bytes32 little_endian{};
    std::reverse_copy(big_endian.begin(), big_endian.end(), little_endian.begin());
    return little_endian;
}

Bytes total_difficulty_to_be(const Bytes32& little_endian) {
    Bytes big_endian{little_endian.rbegin(), little_endian.rend()};
    const auto first_non_zero{big_endian.find_first_not_of(uint8_t{0})};
    big_endian.erase(0, first_non_zero == Bytes::npos ? big_endian.size() : first_non_zero);
    return big_endian;
}

void Era1Builder::add(uint64_t block_number, const BlockTuple& block) {
    if (!starting_number_) {
        append_entry(buffer_, EntryType::kVersion, {});
        starting_number_ = block_number;
    } else if (block_number != *starting_number_ + offsets_.size()) {
        throw std::invalid_argument{"non-consecutive block " + std::to_string(block_number) + ", expected " +
                                    std::to_string(*starting_number_ + offsets_.size())};
    }
    const Bytes32 total_difficulty{total_difficulty_to_le(block.total_difficulty)};

    offsets_.push_back(buffer_.size());
    append_entry(buffer_, EntryType::kCompressedHeader, snappy::framing_compress(block.header));
    append_entry(buffer_, EntryType::kCompressedBody, snappy::framing_compress(block.body));
    append_entry(buffer_, EntryType::kCompressedReceipts, snappy::framing_compress(block.receipts));
    append_entry(buffer_, EntryType::kTotalDifficulty, total_difficulty);
}

Bytes Era1Builder::finalize(const Bytes32& accumulator_root) {
    ensure(starting_number_.has_value(), "Era1Builder::finalize: no block added");

    append_entry(buffer_, EntryType::kAccumulator, accumulator_root);

    const auto count{offsets_.size()};
    Bytes index(16 + 8 * count, '\0');
    boost::endian::store_little_u64(&index[0], *starting_number_);
    // Offsets are relative to the start of the BlockIndex entry, hence negative
    const auto base{static_cast<int64_t>(buffer_.size())};
    for (size_t i{0}; i < count; ++i) {
        const int64_t relative{static_cast<int64_t>(offsets_[i]) - base};
        boost::endian::store_little_u64(&index[8 + i * 8], static_cast<uint64_t>(relative));
    }
    boost::endian::store_little_u64(&index[8 + count * 8], count);
    append_entry(buffer_, EntryType::kBlockIndex, index);

    Bytes era_file{std::move(buffer_)};
    buffer_.clear();
    offsets_.clear();
    starting_number_.reset();
    return era_file;
}

}  // namespace erafetch::e2store
