// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "era1_reader.hpp"

#include <fstream>
#include <algorithm>
#include <stdexcept>

#include <absl/strings/str_format.h>
#include <boost/endian/conversion.hpp>

#include "snappy_codec.hpp"

namespace erafetch::e2store {

namespace {

    Entry expect_entry(Reader& reader, EntryType type) {
        const size_t offset{reader.offset()};
        auto entry{reader.next()};
        if (!entry) {
            throw DecodingError{"unexpected end of data, expected " + to_string(type)};
        }
        if (entry->type != static_cast<uint16_t>(type)) {
            throw DecodingError{absl::StrFormat("unexpected entry %s at offset %d, expected %s",
                                                to_string(static_cast<EntryType>(entry->type)), offset,
                                                to_string(type))};
        }
        return std::move(*entry);
    }

    struct BlockIndex {
        uint64_t starting_number{0};
        std::vector<int64_t> offsets;
    };

    BlockIndex decode_block_index(ByteView data) {
        if (data.size() < 16 || data.size() % 8 != 0) {
            throw DecodingError{"malformed BlockIndex length " + std::to_string(data.size())};
        }
        const uint64_t count{boost::endian::load_little_u64(&data[data.size() - 8])};
        if (count != (data.size() - 16) / 8) {
            throw DecodingError{absl::StrFormat("BlockIndex count %d does not match its length %d", count, data.size())};
        }
        BlockIndex index;
        index.starting_number = boost::endian::load_little_u64(&data[0]);
        index.offsets.reserve(count);
        for (size_t i{0}; i < count; ++i) {
            index.offsets.push_back(static_cast<int64_t>(boost::endian::load_little_u64(&data[8 + i * 8])));
        }
        return index;
    }

    Bytes decompress_entry(const Entry& entry) {
        switch (static_cast<EntryType>(entry.type)) {
            case EntryType::kCompressedHeader:
            case EntryType::kCompressedBody:
            case EntryType::kCompressedReceipts:
                return snappy::framing_uncompress(entry.data);
            default:
                return entry.data;
        }
    }

}  // namespace

Era1File read_era1(ByteView data) {
    Reader reader{data};
    const auto version{expect_entry(reader, EntryType::kVersion)};
    if (!version.data.empty()) {
        throw DecodingError{"Version entry must be empty"};
    }

    Era1File file;
    std::vector<size_t> block_offsets;
    while (true) {
        const size_t offset{reader.offset()};
        auto entry{reader.next()};
        if (!entry) {
            throw DecodingError{"missing Accumulator entry"};
        }
        if (entry->type == static_cast<uint16_t>(EntryType::kAccumulator)) {
            if (entry->data.size() != kBytes32Size) {
                throw DecodingError{"Accumulator entry must be 32 bytes"};
            }
            std::copy(entry->data.begin(), entry->data.end(), file.accumulator_root.begin());
            break;
        }
        if (entry->type != static_cast<uint16_t>(EntryType::kCompressedHeader)) {
            throw DecodingError{absl::StrFormat("unexpected entry %s at offset %d, expected CompressedHeader",
                                                to_string(static_cast<EntryType>(entry->type)), offset)};
        }
        Era1Block block;
        block.header = snappy::framing_uncompress(entry->data);
        block.body = snappy::framing_uncompress(expect_entry(reader, EntryType::kCompressedBody).data);
        block.receipts = snappy::framing_uncompress(expect_entry(reader, EntryType::kCompressedReceipts).data);
        const auto total_difficulty{expect_entry(reader, EntryType::kTotalDifficulty)};
        if (total_difficulty.data.size() != kBytes32Size) {
            throw DecodingError{"TotalDifficulty entry must be 32 bytes"};
        }
        std::copy(total_difficulty.data.begin(), total_difficulty.data.end(), block.total_difficulty.begin());
        block_offsets.push_back(offset);
        file.blocks.push_back(std::move(block));
    }

    const size_t index_offset{reader.offset()};
    const auto index{decode_block_index(expect_entry(reader, EntryType::kBlockIndex).data)};
    if (!reader.at_end()) {
        throw DecodingError{"trailing data after BlockIndex"};
    }
    if (file.blocks.empty()) {
        throw DecodingError{"era1 file holds no block"};
    }
    if (index.offsets.size() != file.blocks.size()) {
        throw DecodingError{absl::StrFormat("BlockIndex count %d does not match %d blocks",
                                            index.offsets.size(), file.blocks.size())};
    }
    for (size_t i{0}; i < block_offsets.size(); ++i) {
        const int64_t expected{static_cast<int64_t>(block_offsets[i]) - static_cast<int64_t>(index_offset)};
        if (index.offsets[i] != expected) {
            throw DecodingError{absl::StrFormat("BlockIndex offset %d for block %d, expected %d",
                                                index.offsets[i], i, expected)};
        }
    }

    file.starting_number = index.starting_number;
    for (size_t i{0}; i < file.blocks.size(); ++i) {
        file.blocks[i].number = file.starting_number + i;
    }
    return file;
}

Bytes read_file(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size{std::filesystem::file_size(path, ec)};
    if (ec) {
        throw std::runtime_error{"cannot stat " + path.string() + ": " + ec.message()};
    }
    std::ifstream file{path, std::ios::binary};
    if (!file.is_open()) {
        throw std::runtime_error{"cannot open " + path.string()};
    }
    Bytes content(size, '\0');
    file.read(reinterpret_cast<char*>(content.data()), static_cast<std::streamsize>(size));
    if (static_cast<size_t>(file.gcount()) != size) {
        throw std::runtime_error{"short read from " + path.string()};
    }
    return content;
}

uint64_t read_block_count(ByteView data) {
    // BlockIndex is the last entry: its last 8 bytes are the count and it spans 8 + 16 + 8 * count bytes
    if (data.size() < kHeaderSize + 16) {
        throw DecodingError{"data too short for a BlockIndex"};
    }
    const uint64_t count{boost::endian::load_little_u64(&data[data.size() - 8])};
    if (count > (data.size() - kHeaderSize - 16) / 8) {
        throw DecodingError{"BlockIndex count " + std::to_string(count) + " exceeds data size"};
    }
    const size_t index_offset{data.size() - kHeaderSize - 16 - 8 * count};
    Reader reader{data.substr(index_offset)};
    expect_entry(reader, EntryType::kBlockIndex);
    if (!reader.at_end()) {
        throw DecodingError{"malformed BlockIndex entry"};
    }
    return count;
}

std::optional<EntryDifference> compare_entries(ByteView lhs, ByteView rhs) {
    Reader lhs_reader{lhs};
    Reader rhs_reader{rhs};
    for (size_t entry_index{0};; ++entry_index) {
        const auto lhs_entry{lhs_reader.next()};
        const auto rhs_entry{rhs_reader.next()};
        if (!lhs_entry && !rhs_entry) {
            return std::nullopt;
        }
        if (!lhs_entry || !rhs_entry) {
            return EntryDifference{entry_index, std::string{"entry count differs: "} +
                                                    (lhs_entry ? "first" : "second") + " file has more entries"};
        }
        if (lhs_entry->type != rhs_entry->type) {
            return EntryDifference{entry_index, "entry type differs: " +
                                                    to_string(static_cast<EntryType>(lhs_entry->type)) + " vs " +
                                                    to_string(static_cast<EntryType>(rhs_entry->type))};
        }
        const auto lhs_data{decompress_entry(*lhs_entry)};
        const auto rhs_data{decompress_entry(*rhs_entry)};
        if (lhs_data != rhs_data) {
            return EntryDifference{entry_index,
                                   absl::StrFormat("%s content differs: %d vs %d bytes",
                                                   to_string(static_cast<EntryType>(lhs_entry->type)),
                                                   lhs_data.size(), rhs_data.size())};
        }
    }
}

}  // namespace erafetch::e2store
