// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "entry.hpp"

#include <limits>

#include <absl/strings/str_format.h>
#include <boost/endian/conversion.hpp>

namespace erafetch::e2store {

std::string to_string(EntryType type) {
    switch (type) {
        case EntryType::kCompressedHeader:
            return "CompressedHeader";
        case EntryType::kCompressedBody:
            return "CompressedBody";
        case EntryType::kCompressedReceipts:
            return "CompressedReceipts";
        case EntryType::kTotalDifficulty:
            return "TotalDifficulty";
        case EntryType::kAccumulator:
            return "Accumulator";
        case EntryType::kVersion:
            return "Version";
        case EntryType::kBlockIndex:
            return "BlockIndex";
    }
    return absl::StrFormat("Unknown(0x%04x)", static_cast<uint16_t>(type));
}

void append_entry(Bytes& out, EntryType type, ByteView data) {
    if (data.size() > std::numeric_limits<uint32_t>::max()) {
        throw std::length_error{"e2store: entry " + to_string(type) + " too large: " + std::to_string(data.size())};
    }
    uint8_t header[kHeaderSize];
    boost::endian::store_little_u16(&header[0], static_cast<uint16_t>(type));
    boost::endian::store_little_u32(&header[2], static_cast<uint32_t>(data.size()));
    boost::endian::store_little_u16(&header[6], 0);
    out.append(header, kHeaderSize);
    out.append(data);
}

std::optional<Entry> Reader::next() {
    if (at_end()) {
        return std::nullopt;
    }
    const ByteView remaining{data_.substr(offset_)};
    if (remaining.size() < kHeaderSize) {
        throw DecodingError{absl::StrFormat("truncated entry header at offset %d", offset_)};
    }
    Entry entry;
    entry.type = boost::endian::load_little_u16(&remaining[0]);
    const uint32_t length{boost::endian::load_little_u32(&remaining[2])};
    const uint16_t reserved{boost::endian::load_little_u16(&remaining[6])};
    if (reserved != 0) {
        throw DecodingError{absl::StrFormat("non-zero reserved field at offset %d", offset_)};
    }
    if (remaining.size() - kHeaderSize < length) {
        throw DecodingError{absl::StrFormat("truncated entry data at offset %d: need %d bytes, have %d",
                                            offset_, length, remaining.size() - kHeaderSize)};
    }
    entry.data = Bytes{remaining.substr(kHeaderSize, length)};
    offset_ += kHeaderSize + length;
    return entry;
}

}  // namespace erafetch::e2store
