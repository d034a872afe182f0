// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "snappy_codec.hpp"

#include <algorithm>
#include <iterator>

#include <boost/crc.hpp>
#include <boost/endian/conversion.hpp>
#include <snappy.h>

namespace erafetch::snappy {

//! Computation for CRC-32/ISCSI a.k.a. CRC-32/CASTAGNOLI, CRC-32C
//! https://reveng.sourceforge.io/crc-catalogue/17plus.htm
constexpr size_t kCrc32cBits{32};
constexpr uint32_t kCrc32cTruncPoly{0x1edc6f41};
constexpr uint32_t kCrc32cInitRem{0xffffffff};
constexpr uint32_t kCrc32cFinalXor{0xffffffff};
constexpr bool kCrc32cReflectIn{true};
constexpr bool kCrc32cReflectRem{true};

using crc32_castagnoli = boost::crc_optimal<
    kCrc32cBits,
    kCrc32cTruncPoly,
    kCrc32cInitRem,
    kCrc32cFinalXor,
    kCrc32cReflectIn,
    kCrc32cReflectRem>;

static uint32_t crc32c(ByteView data) {
    crc32_castagnoli result;
    result.process_bytes(data.data(), data.size());
    return result.checksum();
}

uint32_t masked_crc32c(ByteView data) {
    const uint32_t c = crc32c(data);
    return static_cast<uint32_t>(c >> 15 | c << 17) + 0xa282ead8;
}

static Bytes raw_compress(ByteView input) {
    Bytes output(::snappy::MaxCompressedLength(input.size()), '\0');
    size_t compressed_length{0};
    ::snappy::RawCompress(reinterpret_cast<const char*>(input.data()), input.size(),
                          reinterpret_cast<char*>(output.data()), &compressed_length);
    output.resize(compressed_length);
    return output;
}

static Bytes raw_uncompress(ByteView input) {
    const auto* data = reinterpret_cast<const char*>(input.data());
    size_t uncompressed_length{0};
    if (!::snappy::GetUncompressedLength(data, input.size(), &uncompressed_length)) {
        throw SnappyError{"invalid uncompressed length"};
    }
    if (uncompressed_length > kMaxBlockSize) {
        throw SnappyError{"max block size exceeded in compressed chunk"};
    }
    Bytes output(uncompressed_length, '\0');
    if (!::snappy::RawUncompress(data, input.size(), reinterpret_cast<char*>(output.data()))) {
        throw SnappyError{"corrupted compressed data"};
    }
    return output;
}

static void append_chunk_header(Bytes& out, uint8_t type, size_t length) {
    uint8_t header[kChunkHeaderSize];
    header[0] = type;
    boost::endian::store_little_u24(&header[1], static_cast<uint32_t>(length));
    out.append(header, kChunkHeaderSize);
}

Bytes framing_compress(ByteView uncompressed) {
    Bytes compressed{std::begin(kMagicChunk), std::end(kMagicChunk)};
    compressed.reserve(compressed.size() + ::snappy::MaxCompressedLength(uncompressed.size()) + kChunkHeaderSize + kChecksumSize);

    while (!uncompressed.empty()) {
        const ByteView block{uncompressed.substr(0, kMaxBlockSize)};
        uncompressed.remove_prefix(block.size());

        uint8_t checksum[kChecksumSize];
        boost::endian::store_little_u32(checksum, masked_crc32c(block));

        // Keep the compressed block only if the improvement is at least 12.5%
        const Bytes packed{raw_compress(block)};
        const bool use_compressed{packed.size() <= block.size() - block.size() / 8};
        const ByteView body{use_compressed ? ByteView{packed} : block};

        append_chunk_header(compressed, use_compressed ? kChunkTypeCompressedData : kChunkTypeUncompressedData,
                            kChecksumSize + body.size());
        compressed.append(checksum, kChecksumSize);
        compressed.append(body);
    }
    return compressed;
}

Bytes framing_uncompress(ByteView compressed) {
    Bytes uncompressed;
    bool stream_identifier_seen{false};

    while (!compressed.empty()) {
        if (compressed.size() < kChunkHeaderSize) {
            throw SnappyError{"unexpected EOF in chunk header"};
        }
        const uint8_t chunk_type{compressed[0]};
        const uint32_t chunk_length{boost::endian::load_little_u24(&compressed[1])};
        compressed.remove_prefix(kChunkHeaderSize);
        if (compressed.size() < chunk_length) {
            throw SnappyError{"unexpected EOF in chunk body"};
        }
        const ByteView body{compressed.substr(0, chunk_length)};
        compressed.remove_prefix(chunk_length);

        if (!stream_identifier_seen && chunk_type != kChunkTypeStreamIdentifier) {
            throw SnappyError{"bad stream identifier"};
        }

        switch (chunk_type) {
            case kChunkTypeStreamIdentifier: {
                // Section 4.1. Stream identifier, may be repeated when streams are concatenated
                const ByteView magic_body{&kMagicChunk[kChunkHeaderSize], sizeof(kMagicChunk) - kChunkHeaderSize};
                if (body != magic_body) {
                    throw SnappyError{"corrupted magic body"};
                }
                stream_identifier_seen = true;
                break;
            }
            case kChunkTypeCompressedData:
            case kChunkTypeUncompressedData: {
                // Section 4.2. Compressed data and 4.3. Uncompressed data
                if (body.size() < kChecksumSize) {
                    throw SnappyError{"chunk too short for checksum"};
                }
                const uint32_t checksum{boost::endian::load_little_u32(body.data())};
                const ByteView data{body.substr(kChecksumSize)};
                Bytes block;
                if (chunk_type == kChunkTypeCompressedData) {
                    block = raw_uncompress(data);
                } else {
                    if (data.size() > kMaxBlockSize) {
                        throw SnappyError{"max block size exceeded in uncompressed chunk"};
                    }
                    block = Bytes{data};
                }
                if (masked_crc32c(block) != checksum) {
                    throw SnappyError{"chunk checksum error"};
                }
                uncompressed.append(block);
                break;
            }
            case kChunkTypePadding:
                break;
            default: {
                if (chunk_type <= 0x7f) {
                    // Section 4.5. Reserved unskippable chunks (chunk types 0x02-0x7f)
                    throw SnappyError{"reserved unskippable chunk"};
                }
                // Section 4.6. Reserved skippable chunks (chunk types 0x80-0xfd)
            }
        }
    }
    if (!stream_identifier_seen) {
        throw SnappyError{"missing stream identifier"};
    }
    return uncompressed;
}

}  // namespace erafetch::snappy
