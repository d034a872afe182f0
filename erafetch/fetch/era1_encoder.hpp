// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <vector>

#include <erafetch/e2store/accumulator_table.hpp>

#include "era_encoder.hpp"

namespace erafetch::fetch {

//! EraEncoder producing era1 files, the accumulator root of each era being taken from a table
class Era1Encoder : public EraEncoder {
  public:
    explicit Era1Encoder(e2store::AccumulatorTable accumulators) : accumulators_{std::move(accumulators)} {}

    Bytes encode(EraIndex era, const std::vector<BlockRecord>& records) const override;

  private:
    e2store::AccumulatorTable accumulators_;
};

}  // namespace erafetch::fetch
