// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include <erafetch/infra/concurrency/task.hpp>

#include "types.hpp"

namespace erafetch::fetch {

//! An ordered stream of the blocks of one era
class BlockStream {
  public:
    virtual ~BlockStream() = default;

    //! The next block or std::nullopt at end of stream
    //! \throws FetchError or boost::system::system_error on stream failure
    virtual Task<std::optional<BlockRecord>> next() = 0;

    //! Release the stream: idempotent, a pending next() must complete promptly
    virtual void close() = 0;
};

//! The block streaming service
class BlockStreamClient {
  public:
    virtual ~BlockStreamClient() = default;

    //! Open the stream of the blocks of \p era
    //! \throws AuthError if \p credential is rejected, FetchError or boost::system::system_error otherwise
    virtual Task<std::unique_ptr<BlockStream>> open(EraIndex era, const Credential& credential) = 0;

    //! The number of blocks \p era must contain
    //! \throws FetchError if the count cannot be obtained
    virtual Task<uint64_t> expected_block_count(EraIndex era) = 0;
};

}  // namespace erafetch::fetch
