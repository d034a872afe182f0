// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <erafetch/core/common/bytes.hpp>

#include "errors.hpp"

namespace erafetch::fetch {

using EraIndex = uint64_t;

//! Opaque token handed unmodified to the block stream service, never printed
class Credential {
  public:
    Credential() = default;
    explicit Credential(std::string token) : token_{std::move(token)} {}

    const std::string& token() const { return token_; }
    bool empty() const { return token_.empty(); }

    friend std::ostream& operator<<(std::ostream& out, const Credential&) { return out << "<redacted>"; }

  private:
    std::string token_;
};

//! The opaque content of one block, as received from the service
struct BlockPayload {
    Bytes header;            // RLP-encoded header
    Bytes body;              // RLP-encoded body
    Bytes receipts;          // RLP-encoded receipts
    Bytes total_difficulty;  // big-endian

    bool operator==(const BlockPayload&) const = default;
};

struct BlockRecord {
    uint64_t sequence{0};  // position within the era, starting from 0
    uint64_t number{0};    // absolute block number
    BlockPayload payload;
};

enum class EraState {
    kPending,
    kFetching,
    kRetrying,
    kEncoding,
    kWriting,
    kDone,
    kFailed,
};

std::string_view to_string(EraState state);

//! Whether the state machine allows moving from \p from to \p to
bool is_valid_transition(EraState from, EraState to);

//! Whether an era in this state holds an in-flight stream slot
inline bool is_in_flight(EraState state) { return state == EraState::kFetching || state == EraState::kRetrying; }

struct EraFailure {
    FetchErrorKind kind{FetchErrorKind::kProtocol};
    std::string reason;
};

//! Terminal fetch outcome: the complete ordered block sequence or the failure
using EraResult = std::variant<std::vector<BlockRecord>, EraFailure>;

//! Proof of a durable and atomic commit
struct WriteReceipt {
    EraIndex era{0};
    std::filesystem::path path;
    uint64_t byte_count{0};
    uint64_t block_count{0};
};

struct FailedEra {
    EraIndex era{0};
    EraFailure failure;
};

struct FetchReport {
    std::vector<WriteReceipt> receipts;
    std::vector<FailedEra> failures;
    //! Eras left unfinished because the run was cancelled
    std::vector<EraIndex> cancelled;

    bool success() const { return failures.empty() && cancelled.empty(); }
    std::vector<EraIndex> failed_eras() const;
};

//! Process exit status of a fetch run
constexpr int kExitSuccess{0};
constexpr int kExitFailedEras{1};
constexpr int kExitInvalidInput{2};
constexpr int kExitCancelled{130};

int to_exit_status(const FetchReport& report);

}  // namespace erafetch::fetch
