// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fetch_options.hpp"

#include <chrono>
#include <cstdint>

namespace erafetch::cmd::common {

//! Option holding a number of milliseconds
static CLI::Option* add_milliseconds_option(CLI::App& cli,
                                            const std::string& name,
                                            std::chrono::milliseconds& target,
                                            const std::string& description) {
    auto option = cli.add_option(name, [&target](const CLI::results_t& results) {
        uint64_t count{0};
        if (!CLI::detail::lexical_cast(results[0], count)) {
            return false;
        }
        target = std::chrono::milliseconds{count};
        return true;
    });
    option->description(description);
    option->type_name("MS");
    option->default_str(std::to_string(target.count()));
    return option;
}

void add_fetch_options(CLI::App& cli, fetch::FetchSettings& settings) {
    auto& fetch_opts = *cli.add_option_group("Fetch", "Fetch options");

    fetch_opts.add_option("--concurrency", settings.concurrency)
        ->description("Max number of eras streamed at the same time")
        ->check(CLI::Range(1, 256))
        ->capture_default_str();

    fetch_opts.add_option("--max-write-backlog", settings.max_write_backlog)
        ->description("No new era is admitted while more eras than this are being written")
        ->check(CLI::Range(0, 1024))
        ->capture_default_str();

    fetch_opts.add_option("--blocking-threads", settings.blocking_threads)
        ->description("Number of threads encoding and writing the era files")
        ->check(CLI::Range(1, 64))
        ->capture_default_str();

    fetch_opts.add_option("--retry.max-attempts", settings.retry.max_attempts)
        ->description("Max number of attempts per era, the first one included")
        ->check(CLI::Range(1, 100))
        ->capture_default_str();

    add_milliseconds_option(fetch_opts, "--retry.base-delay", settings.retry.base_delay,
                            "Delay before the second attempt of an era, doubled for each further one");
    add_milliseconds_option(fetch_opts, "--retry.max-delay", settings.retry.max_delay,
                            "Upper bound of the delay between two attempts");

    auto read_timeout = fetch_opts.add_option("--read-timeout", [&settings](const CLI::results_t& results) {
        uint64_t count{0};
        if (!CLI::detail::lexical_cast(results[0], count) || count == 0) {
            return false;
        }
        settings.read_timeout = std::chrono::milliseconds{count};
        return true;
    });
    read_timeout->description("Max time to wait for one block before the attempt fails, no limit if unset");
    read_timeout->type_name("MS");
}

void add_source_options(CLI::App& cli, SourceSettings& source_settings, fetch::Credential& credential) {
    auto& source_opts = *cli.add_option_group("Source", "Block source options");

    source_opts.add_option("--source.mirror", source_settings.mirror_dir)
        ->description("Directory of an era1 mirror to stream the blocks from")
        ->required()
        ->check(CLI::ExistingDirectory);

    source_opts.add_option("--accumulators", source_settings.accumulators_file)
        ->description("Text file with the header accumulator root of each era, one hex value per line")
        ->required()
        ->check(CLI::ExistingFile);

    auto token = source_opts.add_option("--token", [&credential](const CLI::results_t& results) {
        credential = fetch::Credential{results[0]};
        return true;
    });
    token->description("Token for the block stream service");
    token->envname("ERA_STREAM_API_TOKEN");
    token->type_name("TOKEN");
}

void add_option_era_range(CLI::App& cli, std::string& range) {
    cli.add_option("range", range, "Inclusive era range <start>:<end>, or <end> to start from era 0")
        ->required();
}

}  // namespace erafetch::cmd::common
