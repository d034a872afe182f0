// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "directories.hpp"

#include <fstream>

#include <catch2/catch_test_macros.hpp>

namespace erafetch {

TEST_CASE("Directory", "[erafetch][common][directories]") {
    SECTION("existing directory is writable") {
        TemporaryDirectory tmp_dir;
        CHECK(tmp_dir.exists());
        CHECK(tmp_dir.is_empty());
        CHECK(tmp_dir.is_writable());
        // the probe file must not be left behind
        CHECK(tmp_dir.is_empty());
    }

    SECTION("non-existent directory is created on demand") {
        TemporaryDirectory tmp_dir;
        const auto nested{tmp_dir.path() / "a" / "b"};
        Directory nested_dir{nested, /*must_create=*/false};
        CHECK_FALSE(nested_dir.exists());
        CHECK_FALSE(nested_dir.is_writable());
        nested_dir.create();
        CHECK(nested_dir.exists());
    }

    SECTION("nested temporary directory") {
        TemporaryDirectory parent;
        TemporaryDirectory child{parent.path()};
        CHECK(child.path().parent_path() == parent.path());
        std::ofstream{child.path() / "era-00000.era1"} << "x";
        CHECK_FALSE(child.is_empty());
        CHECK_FALSE(parent.is_empty());
    }

    SECTION("a file path is not a directory") {
        TemporaryDirectory tmp_dir;
        const auto file_path{tmp_dir.path() / "file"};
        std::ofstream{file_path} << "x";
        CHECK_THROWS_AS(Directory(file_path, /*must_create=*/true), std::invalid_argument);
    }
}

TEST_CASE("TemporaryDirectory removes its tree", "[erafetch][common][directories]") {
    std::filesystem::path tmp_path;
    {
        TemporaryDirectory tmp_dir;
        tmp_path = tmp_dir.path();
        std::ofstream{tmp_path / "era-00001.era1.tmp"} << "partial";
    }
    CHECK_FALSE(std::filesystem::exists(tmp_path));
}

}  // namespace erafetch
