// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <utility>

#include <erafetch/fetch/block_stream.hpp>

namespace erafetch::fetch::test_util {

//! The misbehaviour injected into one stream attempt
struct Fault {
    enum class Kind {
        kTransientAt,   // connection reset when block `at` is requested
        kShortAfter,    // stream ends after `at` blocks
        kAuthOnOpen,    // credential rejected
        kOutOfOrderAt,  // block `at` is delivered with the sequence of block `at + 1`
        kExtraBlock,    // one more block than expected before the end of stream
        kStallAt,       // block `at` never arrives until the stream is closed
    };

    Kind kind{Kind::kTransientAt};
    uint64_t at{0};
};

//! Deterministic content of block \p sequence of \p era
BlockPayload make_payload(EraIndex era, uint64_t sequence);

/**
 * Scriptable BlockStreamClient: every era holds blocks_per_era blocks and each attempt (1-based) of an era
 * can be assigned a fault. Streams deliver one block per `block_delay` using a timer cancelled by close().
 * \note to be used on a single-threaded executor
 */
class FakeBlockClient : public BlockStreamClient {
  public:
    explicit FakeBlockClient(uint64_t blocks_per_era, std::chrono::milliseconds block_delay = {})
        : blocks_per_era_{blocks_per_era}, block_delay_{block_delay} {}

    Task<std::unique_ptr<BlockStream>> open(EraIndex era, const Credential& credential) override;

    Task<uint64_t> expected_block_count(EraIndex /*era*/) override { co_return blocks_per_era_; }

    //! Inject \p fault in attempt number \p attempt of \p era
    void set_fault(EraIndex era, uint32_t attempt, Fault fault) { faults_[{era, attempt}] = fault; }

    //! Inject \p fault in every attempt of \p era
    void set_persistent_fault(EraIndex era, Fault fault) { persistent_faults_[era] = fault; }

    //! Reject any credential but \p token
    void require_token(std::string token) { required_token_ = std::move(token); }

    uint32_t open_count(EraIndex era) const;
    uint32_t total_open_count() const { return total_open_count_; }
    size_t open_streams() const { return open_streams_; }
    size_t max_open_streams() const { return max_open_streams_; }
    size_t closed_streams() const { return closed_streams_; }

  private:
    friend class FakeBlockStream;

    void on_stream_closed();

    uint64_t blocks_per_era_;
    std::chrono::milliseconds block_delay_;
    std::map<std::pair<EraIndex, uint32_t>, Fault> faults_;
    std::map<EraIndex, Fault> persistent_faults_;
    std::optional<std::string> required_token_;
    std::map<EraIndex, uint32_t> open_counts_;
    uint32_t total_open_count_{0};
    size_t open_streams_{0};
    size_t max_open_streams_{0};
    size_t closed_streams_{0};
};

}  // namespace erafetch::fetch::test_util
