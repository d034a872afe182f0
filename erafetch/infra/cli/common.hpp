// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>

#include <CLI/CLI.hpp>

#include <erafetch/infra/common/log.hpp>

namespace erafetch::cmd::common {

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Set up the positional option for the directory receiving the era files
void add_option_output_dir(CLI::App& cli, std::filesystem::path& output_dir);

}  // namespace erafetch::cmd::common
