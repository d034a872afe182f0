// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <memory>

#include <boost/asio/any_io_executor.hpp>

#include "block_stream.hpp"

namespace erafetch::fetch {

/**
 * BlockStreamClient serving the blocks of an existing era1 mirror directory (e.g. a mounted archive) laid out
 * with the same file names as the output. Mirror files are read and decoded on the given blocking executor.
 * A missing mirror file is a transient failure because the mirror may still be syncing, a corrupted one is a
 * protocol failure. The credential is not used by a local mirror.
 */
class MirrorBlockClient : public BlockStreamClient {
  public:
    MirrorBlockClient(std::filesystem::path mirror_dir, boost::asio::any_io_executor blocking_executor);

    Task<std::unique_ptr<BlockStream>> open(EraIndex era, const Credential& credential) override;

    //! Reads the block index at the end of the mirror file on the blocking executor
    Task<uint64_t> expected_block_count(EraIndex era) override;

    std::filesystem::path mirror_path(EraIndex era) const;

  private:
    std::filesystem::path mirror_dir_;
    boost::asio::any_io_executor blocking_executor_;
};

}  // namespace erafetch::fetch
