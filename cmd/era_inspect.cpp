// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include <erafetch/core/common/util.hpp>
#include <erafetch/e2store/era1_reader.hpp>
#include <erafetch/infra/cli/common.hpp>
#include <erafetch/infra/common/log.hpp>

using namespace erafetch;
using namespace erafetch::cmd::common;

struct VerifySettings {
    std::vector<std::filesystem::path> files;
};

struct CompareSettings {
    std::filesystem::path first;
    std::filesystem::path second;
};

//! Decode and validate each file, print its block range
static int verify(const VerifySettings& settings) {
    int result{0};
    for (const auto& path : settings.files) {
        try {
            const auto file{e2store::read_era1(e2store::read_file(path))};
            const ByteView accumulator_root{file.accumulator_root.data(), file.accumulator_root.size()};
            std::cout << path.string() << ": blocks " << file.starting_number << "-" << file.last_number() << " ("
                      << file.blocks.size() << "), accumulator " << to_hex(accumulator_root, true) << "\n";
        } catch (const std::exception& ex) {
            std::cerr << path.string() << ": " << ex.what() << "\n";
            result = 1;
        }
    }
    return result;
}

//! Compare two era files entry by entry after decompression and report the first difference
static int compare(const CompareSettings& settings) {
    const auto first{e2store::read_file(settings.first)};
    const auto second{e2store::read_file(settings.second)};
    const auto difference{e2store::compare_entries(first, second)};
    if (!difference) {
        std::cout << "Files are identical\n";
        return 0;
    }
    std::cout << "Difference at entry " << difference->entry_index << ": " << difference->description << "\n";
    return 1;
}

int main(int argc, char* argv[]) {
    CLI::App cli{"era_inspect - check era1 files"};
    cli.require_subcommand(1);

    log::Settings log_settings;
    add_logging_options(cli, log_settings);

    VerifySettings verify_settings;
    auto& verify_cmd = *cli.add_subcommand("verify", "Decode and validate era1 files");
    verify_cmd.add_option("files", verify_settings.files, "The era1 files")->required()->check(CLI::ExistingFile);

    CompareSettings compare_settings;
    auto& compare_cmd = *cli.add_subcommand("compare", "Compare two era1 files entry by entry");
    compare_cmd.add_option("first", compare_settings.first, "The first era1 file")->required()->check(CLI::ExistingFile);
    compare_cmd.add_option("second", compare_settings.second, "The second era1 file")->required()->check(CLI::ExistingFile);

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        return cli.exit(pe);
    }

    try {
        log::init(log_settings);
        if (verify_cmd) {
            return verify(verify_settings);
        }
        return compare(compare_settings);
    } catch (const std::exception& e) {
        ERAF_CRIT << "era_inspect exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        ERAF_CRIT << "era_inspect exiting due to unexpected exception";
        return -3;
    }
}
