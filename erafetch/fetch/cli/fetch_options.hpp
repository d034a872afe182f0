// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <string>

#include <CLI/CLI.hpp>

#include <erafetch/fetch/settings.hpp>

namespace erafetch::cmd::common {

//! Where the blocks come from and how to encode them
struct SourceSettings {
    std::filesystem::path mirror_dir;
    std::filesystem::path accumulators_file;
};

//! \brief Set up the options tuning concurrency, backpressure, retries and timeouts
void add_fetch_options(CLI::App& cli, fetch::FetchSettings& settings);

//! \brief Set up --source.mirror, --accumulators and --token (also read from ERA_STREAM_API_TOKEN)
void add_source_options(CLI::App& cli, SourceSettings& source_settings, fetch::Credential& credential);

//! \brief Set up the positional era range "<start>:<end>"
void add_option_era_range(CLI::App& cli, std::string& range);

}  // namespace erafetch::cmd::common
