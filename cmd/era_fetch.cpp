// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include <exception>
#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <absl/strings/str_join.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include <erafetch/e2store/accumulator_table.hpp>
#include <erafetch/fetch/cli/fetch_options.hpp>
#include <erafetch/fetch/disk_writer.hpp>
#include <erafetch/fetch/era1_encoder.hpp>
#include <erafetch/fetch/mirror_block_client.hpp>
#include <erafetch/fetch/range_planner.hpp>
#include <erafetch/fetch/scheduler.hpp>
#include <erafetch/infra/cli/common.hpp>
#include <erafetch/infra/cli/shutdown_signal.hpp>
#include <erafetch/infra/common/directories.hpp>
#include <erafetch/infra/common/log.hpp>

using namespace erafetch;
using namespace erafetch::cmd::common;

struct EraFetchSettings {
    log::Settings log_settings;
    fetch::FetchSettings fetch_settings;
    SourceSettings source_settings;
    std::string range;
};

EraFetchSettings era_fetch_parse_cli_settings(int argc, char* argv[]) {
    CLI::App cli{"era_fetch - download pre-merge history into era1 files"};

    EraFetchSettings settings;
    add_option_output_dir(cli, settings.fetch_settings.output_dir);
    add_option_era_range(cli, settings.range);
    add_logging_options(cli, settings.log_settings);
    add_fetch_options(cli, settings.fetch_settings);
    add_source_options(cli, settings.source_settings, settings.fetch_settings.credential);

    try {
        cli.parse(argc, argv);
    } catch (const CLI::ParseError& pe) {
        cli.exit(pe);
        throw;
    }

    return settings;
}

//! Reject the invocations which cannot fetch anything, before any stream is opened
static std::optional<e2store::AccumulatorTable> validate_invocation(const EraFetchSettings& settings,
                                                                    fetch::EraRange& range) {
    try {
        range = fetch::parse_era_range(settings.range);
    } catch (const fetch::InvalidRangeError& ex) {
        ERAF_ERROR << ex.what();
        return std::nullopt;
    }

    try {
        const Directory output_dir{settings.fetch_settings.output_dir, /*must_create=*/true};
        if (!output_dir.is_writable()) {
            ERAF_ERROR << "Output directory " << output_dir.path().string() << " is not writable";
            return std::nullopt;
        }
    } catch (const std::exception& ex) {
        ERAF_ERROR << "Cannot create output directory: " << ex.what();
        return std::nullopt;
    }

    try {
        auto accumulators{e2store::AccumulatorTable::from_file(settings.source_settings.accumulators_file)};
        if (!accumulators.covers(range.start, range.end)) {
            ERAF_ERROR << "Accumulator table " << settings.source_settings.accumulators_file.string() << " holds "
                       << accumulators.size() << " roots, eras " << range.start << ":" << range.end
                       << " are not covered";
            return std::nullopt;
        }
        return accumulators;
    } catch (const std::exception& ex) {
        ERAF_ERROR << "Cannot load accumulator table: " << ex.what();
        return std::nullopt;
    }
}

int era_fetch_main(EraFetchSettings settings) {
    log::init(settings.log_settings);
    log::set_thread_name("main");

    fetch::EraRange range;
    auto accumulators{validate_invocation(settings, range)};
    if (!accumulators) {
        return fetch::kExitInvalidInput;
    }
    ERAF_INFO << "Fetching eras " << range.start << ":" << range.end << " into "
              << settings.fetch_settings.output_dir.string() << " with concurrency "
              << settings.fetch_settings.concurrency << " [credential=" << settings.fetch_settings.credential << "]";

    fetch::DiskWriter{settings.fetch_settings.output_dir}.sweep_stale_temporaries();

    boost::asio::io_context ioc;
    boost::asio::thread_pool mirror_pool{settings.fetch_settings.blocking_threads};
    fetch::MirrorBlockClient client{settings.source_settings.mirror_dir, mirror_pool.get_executor()};
    const fetch::Era1Encoder encoder{std::move(*accumulators)};
    fetch::EraFetchScheduler scheduler{settings.fetch_settings, client, encoder};

    ShutdownSignal shutdown_signal{ioc.get_executor()};
    shutdown_signal.on_signal([&scheduler](ShutdownSignal::SignalNumber) { scheduler.cancel(); });

    std::optional<fetch::FetchReport> report;
    std::exception_ptr run_failure;
    boost::asio::co_spawn(ioc, scheduler.run(fetch::plan_eras(range)),
                          [&](std::exception_ptr ex, fetch::FetchReport result) {
                              if (ex) {
                                  run_failure = ex;
                              } else {
                                  report = std::move(result);
                              }
                              shutdown_signal.cancel();
                          });
    ioc.run();
    mirror_pool.join();

    if (run_failure) {
        std::rethrow_exception(run_failure);
    }

    if (!report->failures.empty()) {
        std::cerr << "Failed eras: " << absl::StrJoin(report->failed_eras(), ",") << "\n";
        for (const auto& failed : report->failures) {
            ERAF_ERROR << "Era " << failed.era << " failed [" << fetch::to_string(failed.failure.kind)
                       << "]: " << failed.failure.reason;
        }
    }
    if (!report->cancelled.empty()) {
        ERAF_WARN << "Run cancelled, " << report->cancelled.size() << " eras not fetched";
    }
    ERAF_INFO << "Fetched " << report->receipts.size() << " of " << range.size() << " eras";
    return fetch::to_exit_status(*report);
}

int main(int argc, char* argv[]) {
    try {
        return era_fetch_main(era_fetch_parse_cli_settings(argc, argv));
    } catch (const CLI::ParseError& pe) {
        return pe.get_exit_code() == 0 ? fetch::kExitSuccess : fetch::kExitInvalidInput;
    } catch (const std::exception& e) {
        ERAF_CRIT << "era_fetch exiting due to exception: " << e.what();
        return -2;
    } catch (...) {
        ERAF_CRIT << "era_fetch exiting due to unexpected exception";
        return -3;
    }
}
