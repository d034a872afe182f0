// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include <erafetch/core/common/bytes.hpp>

namespace erafetch::snappy {

// Era1 entries carry snappy data in framing (a.k.a. stream) format
// Snappy framing format description: https://github.com/google/snappy/blob/main/framing_format.txt

constexpr size_t kChecksumSize{4};
constexpr size_t kChunkTypeSize{1};
constexpr size_t kChunkLengthSize{3};
constexpr size_t kChunkHeaderSize{kChunkTypeSize + kChunkLengthSize};

//! Stream identifier chunk: type 0xff, length 6, body "sNaPpY"
inline constexpr uint8_t kMagicChunk[]{0xff, 0x06, 0x00, 0x00, 's', 'N', 'a', 'P', 'p', 'Y'};

//! For the framing format: "the uncompressed data in a chunk must be no longer than 65536 bytes"
constexpr size_t kMaxBlockSize{65536};

//! Section 4. Chunk types
constexpr uint8_t kChunkTypeCompressedData = 0x00;
constexpr uint8_t kChunkTypeUncompressedData = 0x01;
constexpr uint8_t kChunkTypePadding = 0xfe;
constexpr uint8_t kChunkTypeStreamIdentifier = 0xff;

class SnappyError : public std::runtime_error {
  public:
    explicit SnappyError(const std::string& message) : std::runtime_error{"invalid snappy: " + message} {}
};

//! Compute masked CRC-32C as specified in section 3 of the framing format
uint32_t masked_crc32c(ByteView data);

//! Compress \p uncompressed into a framing-format stream, which always starts with the stream identifier
Bytes framing_compress(ByteView uncompressed);

//! Decompress a framing-format stream, verifying every chunk checksum
//! \throws SnappyError on malformed input
Bytes framing_uncompress(ByteView compressed);

}  // namespace erafetch::snappy
