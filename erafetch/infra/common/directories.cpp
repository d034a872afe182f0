// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <unistd.h>

#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

#include <absl/strings/str_format.h>

namespace erafetch {

static std::string random_suffix() {
    thread_local std::mt19937_64 generator{std::random_device{}()};
    return absl::StrFormat("%016x", generator());
}

Directory::Directory(std::filesystem::path path, bool must_create)
    : path_{path.empty() ? std::filesystem::current_path() : std::move(path)} {
    if (must_create) {
        create();
    }
}

bool Directory::exists() const {
    std::error_code ec;
    return std::filesystem::is_directory(path_, ec);
}

bool Directory::is_empty() const {
    std::error_code ec;
    return exists() && std::filesystem::is_empty(path_, ec);
}

bool Directory::is_writable() const {
    if (!exists()) return false;
    const auto probe_path{path_ / (".probe-" + random_suffix())};
    if (!std::ofstream{probe_path, std::ios::binary}.is_open()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::remove(probe_path, ec) && !ec;
}

void Directory::create() {
    if (exists()) return;
    std::error_code ec;
    std::filesystem::create_directories(path_, ec);
    if (ec || !exists()) {
        throw std::invalid_argument{"directory " + path_.string() + " cannot be created" +
                                    (ec ? ": " + ec.message() : std::string{})};
    }
}

TemporaryDirectory::TemporaryDirectory() : TemporaryDirectory(std::filesystem::temp_directory_path()) {}

TemporaryDirectory::TemporaryDirectory(const std::filesystem::path& parent)
    : Directory{make_unique_path(parent), /*must_create=*/true} {}

TemporaryDirectory::~TemporaryDirectory() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

std::filesystem::path TemporaryDirectory::make_unique_path(const std::filesystem::path& parent) {
    const auto absolute_parent{std::filesystem::absolute(parent)};
    if (!std::filesystem::is_directory(absolute_parent)) {
        throw std::invalid_argument{"temporary parent " + absolute_parent.string() + " is not a directory"};
    }
    for (int attempt{0}; attempt < 100; ++attempt) {
        auto candidate{absolute_parent / absl::StrFormat("erafetch-%d-%s", ::getpid(), random_suffix())};
        if (!std::filesystem::exists(candidate)) {
            return candidate;
        }
    }
    throw std::runtime_error{"no unique temporary directory name available in " + absolute_parent.string()};
}

}  // namespace erafetch
