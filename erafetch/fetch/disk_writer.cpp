// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "disk_writer.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>
#include <utility>

#include <absl/strings/match.h>
#include <absl/strings/str_format.h>

#include <erafetch/infra/common/log.hpp>

namespace erafetch::fetch {

namespace {

    std::string errno_message(int error) {
        return std::error_code{error, std::generic_category()}.message();
    }

    //! RAII owner of a POSIX file descriptor
    class FileDescriptor {
      public:
        explicit FileDescriptor(int fd) : fd_{fd} {}
        ~FileDescriptor() { close(); }

        FileDescriptor(const FileDescriptor&) = delete;
        FileDescriptor& operator=(const FileDescriptor&) = delete;

        int get() const { return fd_; }
        bool is_open() const { return fd_ >= 0; }

        //! \return errno of the failed close or 0
        int close() {
            if (fd_ < 0) return 0;
            const int result{::close(fd_)};
            fd_ = -1;
            return result == 0 ? 0 : errno;
        }

      private:
        int fd_;
    };

    void write_all(int fd, ByteView content, const std::filesystem::path& path) {
        while (!content.empty()) {
            const ssize_t written{::write(fd, content.data(), content.size())};
            if (written < 0) {
                if (errno == EINTR) continue;
                throw WriteError{"write " + path.string() + ": " + errno_message(errno)};
            }
            content.remove_prefix(static_cast<size_t>(written));
        }
    }

    void sync_directory(const std::filesystem::path& dir) {
        FileDescriptor dir_fd{::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC)};
        if (!dir_fd.is_open()) {
            throw WriteError{"open directory " + dir.string() + ": " + errno_message(errno)};
        }
        if (::fsync(dir_fd.get()) != 0) {
            throw WriteError{"fsync directory " + dir.string() + ": " + errno_message(errno)};
        }
    }

}  // namespace

DiskWriter::DiskWriter(std::filesystem::path output_dir, DirectorySync sync_directory)
    : output_dir_{std::move(output_dir)},
      sync_directory_{sync_directory ? std::move(sync_directory) : DirectorySync{fetch::sync_directory}} {}

std::string DiskWriter::era_file_name(EraIndex era) {
    return absl::StrFormat("era-%05d.era1", era);
}

std::filesystem::path DiskWriter::final_path(EraIndex era) const {
    return output_dir_ / era_file_name(era);
}

std::filesystem::path DiskWriter::temporary_path(EraIndex era) const {
    return output_dir_ / (era_file_name(era) + std::string{kTmpExtension});
}

WriteReceipt DiskWriter::commit(EraIndex era,
                                ByteView content,
                                uint64_t block_count,
                                const concurrency::CancellationToken* cancellation_token) {
    const auto tmp_path{temporary_path(era)};
    const auto path{final_path(era)};

    FileDescriptor fd{::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (!fd.is_open()) {
        throw WriteError{"open " + tmp_path.string() + ": " + errno_message(errno)};
    }
    track(tmp_path);

    try {
        write_all(fd.get(), content, tmp_path);
        if (::fsync(fd.get()) != 0) {
            throw WriteError{"fsync " + tmp_path.string() + ": " + errno_message(errno)};
        }
        if (const int error{fd.close()}; error != 0) {
            throw WriteError{"close " + tmp_path.string() + ": " + errno_message(error)};
        }
        if (cancellation_token) {
            cancellation_token->throw_if_cancelled();
        }
        std::error_code ec;
        std::filesystem::rename(tmp_path, path, ec);
        if (ec) {
            throw WriteError{"rename " + tmp_path.string() + " to " + path.string() + ": " + ec.message()};
        }
    } catch (...) {
        // Never leave a partial era behind, then let the failure through
        fd.close();
        std::error_code ec;
        std::filesystem::remove(tmp_path, ec);
        untrack(tmp_path);
        throw;
    }
    untrack(tmp_path);

    // The rename is durable only once the directory entry is synced, the file is complete anyway
    try {
        sync_directory_(output_dir_);
    } catch (const WriteError& ex) {
        ERAF_WARN_M("DiskWriter: directory sync failed", {"era", std::to_string(era), "error", ex.what()});
    }

    ERAF_DEBUG_M("DiskWriter", {"era", std::to_string(era), "path", path.string(), "bytes", std::to_string(content.size())});
    return WriteReceipt{
        .era = era,
        .path = path,
        .byte_count = content.size(),
        .block_count = block_count,
    };
}

std::vector<std::filesystem::path> DiskWriter::in_progress() const {
    std::scoped_lock lock{mutex_};
    return {in_progress_.begin(), in_progress_.end()};
}

size_t DiskWriter::remove_in_progress() {
    std::scoped_lock lock{mutex_};
    size_t removed{0};
    for (const auto& path : in_progress_) {
        std::error_code ec;
        if (std::filesystem::remove(path, ec)) {
            ++removed;
        } else if (ec) {
            ERAF_WARN_M("DiskWriter", {"remove", path.string(), "error", ec.message()});
        }
    }
    in_progress_.clear();
    return removed;
}

size_t DiskWriter::sweep_stale_temporaries() {
    std::error_code ec;
    std::filesystem::directory_iterator it{output_dir_, ec};
    if (ec) {
        ERAF_WARN_M("DiskWriter", {"sweep", output_dir_.string(), "error", ec.message()});
        return 0;
    }
    size_t removed{0};
    for (const auto& entry : it) {
        const std::string name{entry.path().filename().string()};
        if (!entry.is_regular_file(ec) || !absl::StartsWith(name, "era-") || !absl::EndsWith(name, ".era1.tmp")) {
            continue;
        }
        if (std::filesystem::remove(entry.path(), ec)) {
            ERAF_INFO_M("DiskWriter", {"removed stale", name});
            ++removed;
        }
    }
    return removed;
}

void DiskWriter::track(const std::filesystem::path& path) {
    std::scoped_lock lock{mutex_};
    in_progress_.insert(path);
}

void DiskWriter::untrack(const std::filesystem::path& path) {
    std::scoped_lock lock{mutex_};
    in_progress_.erase(path);
}

}  // namespace erafetch::fetch
