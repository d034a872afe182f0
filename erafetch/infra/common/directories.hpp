// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

namespace erafetch {

//! A filesystem directory, e.g. the output directory of the era files
class Directory {
  public:
    //! \param must_create : create the directory (and its parents) if missing
    //! \throws std::invalid_argument if the directory must be created and cannot be
    explicit Directory(std::filesystem::path path, bool must_create = false);
    virtual ~Directory() = default;

    Directory(const Directory&) = delete;
    Directory& operator=(const Directory&) = delete;

    bool exists() const;
    bool is_empty() const;

    //! Whether a file can actually be created and removed inside
    bool is_writable() const;

    const std::filesystem::path& path() const { return path_; }

    //! \throws std::invalid_argument if the directory cannot be created
    void create();

  protected:
    std::filesystem::path path_;
};

//! A uniquely named directory removed with its whole content on destruction
class TemporaryDirectory final : public Directory {
  public:
    //! Create the directory inside the OS temporary storage location
    TemporaryDirectory();

    //! Create the directory inside \p parent
    explicit TemporaryDirectory(const std::filesystem::path& parent);

    ~TemporaryDirectory() final;

  private:
    static std::filesystem::path make_unique_path(const std::filesystem::path& parent);
};

}  // namespace erafetch
