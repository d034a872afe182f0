// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include <erafetch/infra/concurrency/cancellation_token.hpp>
#include <erafetch/infra/concurrency/task.hpp>

#include "block_stream.hpp"
#include "types.hpp"

namespace erafetch::fetch {

/**
 * One attempt at ingesting the blocks of an era, strictly in order.
 * The session pulls records from a freshly opened stream until the expected count is reached and the stream
 * ends, checking that sequence numbers go 0, 1, 2... without gaps. Blocks are never buffered nor reordered.
 * The stream is closed on every exit path, cancellation included.
 */
class StreamSession {
  public:
    StreamSession(BlockStreamClient& client,
                  EraIndex era,
                  const Credential& credential,
                  concurrency::CancellationToken& cancellation_token,
                  std::optional<std::chrono::milliseconds> read_timeout = std::nullopt);

    //! Append the records of the era to \p records, which must be empty
    //! \throws TransientStreamError, ShortStreamError, AuthError, ProtocolError
    //! \throws boost::system::system_error with operation_canceled on cancellation
    Task<void> run(std::vector<BlockRecord>& records);

  private:
    Task<void> ingest(BlockStream& stream, uint64_t expected_count, std::vector<BlockRecord>& records);
    Task<std::optional<BlockRecord>> next_record(BlockStream& stream);

    BlockStreamClient& client_;
    EraIndex era_;
    const Credential& credential_;
    concurrency::CancellationToken& cancellation_token_;
    std::optional<std::chrono::milliseconds> read_timeout_;
};

}  // namespace erafetch::fetch
