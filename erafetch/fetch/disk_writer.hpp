// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <erafetch/core/common/bytes.hpp>
#include <erafetch/infra/concurrency/cancellation_token.hpp>

#include "types.hpp"

namespace erafetch::fetch {

//! Extension of the files being written, removed when the write is committed
inline constexpr std::string_view kTmpExtension{".tmp"};

/**
 * Commits era files atomically: the content is written to "<final>.tmp" in the output directory, synced,
 * renamed to "<final>" and the directory entry is synced. A file at a final path is therefore either absent
 * or complete. An existing final file is replaced as a whole. A failed directory sync happens after the rename,
 * so it is only logged and the commit still succeeds.
 * \note commit() is thread-safe, it runs on the blocking thread pool
 */
class DiskWriter {
  public:
    //! Makes the directory entries of a directory durable
    //! \throws WriteError on failure
    using DirectorySync = std::function<void(const std::filesystem::path&)>;

    //! \param sync_directory replaces the fsync of the output directory when set
    explicit DiskWriter(std::filesystem::path output_dir, DirectorySync sync_directory = {});

    //! The file name of an era, e.g. era-00042.era1
    static std::string era_file_name(EraIndex era);

    std::filesystem::path final_path(EraIndex era) const;
    std::filesystem::path temporary_path(EraIndex era) const;
    const std::filesystem::path& output_dir() const { return output_dir_; }

    //! Durably write \p content as the file of \p era
    //! \param cancellation_token checked before the rename, a cancelled commit leaves no file behind
    //! \throws WriteError on any I/O failure, the temporary file being removed
    //! \throws boost::system::system_error with operation_canceled if cancelled
    WriteReceipt commit(EraIndex era,
                        ByteView content,
                        uint64_t block_count,
                        const concurrency::CancellationToken* cancellation_token = nullptr);

    //! Temporary files of the commits in progress
    std::vector<std::filesystem::path> in_progress() const;

    //! Remove the temporary files of the commits in progress
    size_t remove_in_progress();

    //! Remove the era-*.era1.tmp files left behind by an interrupted run
    size_t sweep_stale_temporaries();

  private:
    void track(const std::filesystem::path& path);
    void untrack(const std::filesystem::path& path);

    std::filesystem::path output_dir_;
    DirectorySync sync_directory_;
    mutable std::mutex mutex_;
    std::set<std::filesystem::path> in_progress_;
};

}  // namespace erafetch::fetch
