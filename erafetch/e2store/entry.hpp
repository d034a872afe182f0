// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <erafetch/core/common/bytes.hpp>

namespace erafetch::e2store {

//! Entry types used by era1 files
enum class EntryType : uint16_t {
    kCompressedHeader = 0x03,
    kCompressedBody = 0x04,
    kCompressedReceipts = 0x05,
    kTotalDifficulty = 0x06,
    kAccumulator = 0x07,
    kVersion = 0x3265,
    kBlockIndex = 0x3266,
};

std::string to_string(EntryType type);

//! Entry header: type u16 LE, length u32 LE, reserved u16 (always zero)
constexpr size_t kHeaderSize{8};

class DecodingError : public std::runtime_error {
  public:
    explicit DecodingError(const std::string& message) : std::runtime_error{"e2store: " + message} {}
};

//! A single typed record of an e2store file
struct Entry {
    uint16_t type{0};
    Bytes data;

    bool operator==(const Entry&) const = default;
};

//! Append the encoding of an entry to \p out
//! \throws std::length_error if data does not fit the u32 length field
void append_entry(Bytes& out, EntryType type, ByteView data);

//! Sequential decoder of e2store entries over an in-memory buffer
class Reader {
  public:
    explicit Reader(ByteView data) : data_{data} {}

    //! Return the next entry or std::nullopt at end of data
    //! \throws DecodingError on a truncated entry or a non-zero reserved field
    std::optional<Entry> next();

    //! Offset of the next entry from the start of the buffer
    size_t offset() const { return offset_; }

    bool at_end() const { return offset_ == data_.size(); }

  private:
    ByteView data_;
    size_t offset_{0};
};

}  // namespace erafetch::e2store
