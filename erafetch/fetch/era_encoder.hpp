// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <erafetch/core/common/bytes.hpp>

#include "types.hpp"

namespace erafetch::fetch {

//! Turns the complete block sequence of an era into the bytes of its output file
//! \warning encode() is called concurrently from the blocking thread pool
class EraEncoder {
  public:
    virtual ~EraEncoder() = default;

    //! \throws EncodeError
    virtual Bytes encode(EraIndex era, const std::vector<BlockRecord>& records) const = 0;
};

}  // namespace erafetch::fetch
