// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include <absl/strings/match.h>
#include <catch2/catch_test_macros.hpp>

#include <erafetch/infra/test_util/log.hpp>

namespace erafetch::log {

//! Custom LogBuffer just for testing to access buffered content
template <Level level>
class LogBufferForTest : public LogBuffer<level> {
  public:
    explicit LogBufferForTest() : LogBuffer<level>() {}
    explicit LogBufferForTest(std::string_view msg, const Args& args) : LogBuffer<level>(msg, args) {}

    std::string content() const { return LogBuffer<level>::ss_.str(); }
};

template <Level level>
void check_log_empty() {
    auto log_buffer = LogBufferForTest<level>();
    log_buffer << "test";
    CHECK(log_buffer.content().empty());
}

template <Level level>
void check_log_not_empty() {
    auto log_buffer = LogBufferForTest<level>();
    log_buffer << "test";
    CHECK(absl::StrContains(log_buffer.content(), "test"));
}

TEST_CASE("LogBuffer", "[erafetch][common][log]") {
    test_util::SetLogVerbosityGuard log_guard{get_verbosity()};

    // Temporarily override std::cerr with a string stream to avoid terminal output
    std::stringstream string_cerr;
    test_util::StreamSwap cerr_swap{std::cerr, string_cerr};
    Settings settings;
    settings.log_verbosity = Level::kInfo;
    init(settings);

    SECTION("nothing is stored for verbosity higher than configured") {
        check_log_empty<Level::kDebug>();
        check_log_empty<Level::kTrace>();
    }

    SECTION("content is stored for verbosity lower than or equal to configured") {
        check_log_not_empty<Level::kInfo>();
        check_log_not_empty<Level::kWarning>();
        check_log_not_empty<Level::kError>();
        check_log_not_empty<Level::kCritical>();
        check_log_not_empty<Level::kNone>();
    }

    SECTION("verbosity guard lowers the threshold") {
        test_util::SetLogVerbosityGuard guard{Level::kWarning};
        check_log_empty<Level::kInfo>();
        check_log_not_empty<Level::kWarning>();
    }

    SECTION("thread name is printed only when enabled") {
        set_thread_name("fetcher");
        auto log_buffer1 = LogBufferForTest<Level::kInfo>();
        log_buffer1 << "test";
        CHECK_FALSE(absl::StrContains(log_buffer1.content(), "fetcher"));

        Settings log_settings;
        log_settings.log_threads = true;
        init(log_settings);
        auto log_buffer2 = LogBufferForTest<Level::kInfo>();
        log_buffer2 << "test";
        CHECK(absl::StrContains(log_buffer2.content(), "fetcher"));
    }

    SECTION("key-value arguments are flushed without colors on non-TTY") {
        Settings log_settings;
        log_settings.log_nocolor = true;
        init(log_settings);
        LogBufferForTest<Level::kInfo>{"era committed", {"era", "42", "blocks", "8192"}};  // flush on dtor
        const auto output{string_cerr.str()};
        CHECK(absl::StrContains(output, "era committed"));
        CHECK(absl::StrContains(output, "era=42"));
        CHECK(absl::StrContains(output, "blocks=8192"));
    }
}

}  // namespace erafetch::log
