// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "era1_encoder.hpp"

#include <stdexcept>
#include <string>

#include <erafetch/e2store/era1_builder.hpp>

namespace erafetch::fetch {

Bytes Era1Encoder::encode(EraIndex era, const std::vector<BlockRecord>& records) const {
    if (records.empty()) {
        throw EncodeError{"era " + std::to_string(era) + " has no block"};
    }
    const auto accumulator_root{accumulators_.find(era)};
    if (!accumulator_root) {
        throw EncodeError{"no accumulator root for era " + std::to_string(era)};
    }

    e2store::Era1Builder builder;
    try {
        for (const auto& record : records) {
            builder.add(record.number, {
                                           .header = record.payload.header,
                                           .body = record.payload.body,
                                           .receipts = record.payload.receipts,
                                           .total_difficulty = record.payload.total_difficulty,
                                       });
        }
        return builder.finalize(*accumulator_root);
    } catch (const std::invalid_argument& ex) {
        throw EncodeError{"era " + std::to_string(era) + ": " + ex.what()};
    } catch (const std::length_error& ex) {
        throw EncodeError{"era " + std::to_string(era) + ": " + ex.what()};
    }
}

}  // namespace erafetch::fetch
