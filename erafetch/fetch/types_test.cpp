// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <sstream>

#include <catch2/catch_test_macros.hpp>

namespace erafetch::fetch {

TEST_CASE("FetchErrorKind retryability", "[erafetch][fetch][types]") {
    CHECK(is_retryable(FetchErrorKind::kTransientStream));
    CHECK(is_retryable(FetchErrorKind::kShortStream));
    CHECK_FALSE(is_retryable(FetchErrorKind::kAuth));
    CHECK_FALSE(is_retryable(FetchErrorKind::kProtocol));
    CHECK_FALSE(is_retryable(FetchErrorKind::kExhaustedRetries));
    CHECK_FALSE(is_retryable(FetchErrorKind::kEncode));
    CHECK_FALSE(is_retryable(FetchErrorKind::kWrite));
    CHECK_FALSE(is_retryable(FetchErrorKind::kInvalidRange));
}

TEST_CASE("FetchError carries its kind", "[erafetch][fetch][types]") {
    const ShortStreamError error{"stream ended after 10 of 8192 blocks"};
    CHECK(error.kind() == FetchErrorKind::kShortStream);
    CHECK(std::string{error.what()} == "stream ended after 10 of 8192 blocks");
    CHECK(to_string(AuthError{"x"}.kind()) == "Auth");
}

TEST_CASE("EraState transitions", "[erafetch][fetch][types]") {
    SECTION("happy path") {
        CHECK(is_valid_transition(EraState::kPending, EraState::kFetching));
        CHECK(is_valid_transition(EraState::kFetching, EraState::kEncoding));
        CHECK(is_valid_transition(EraState::kEncoding, EraState::kWriting));
        CHECK(is_valid_transition(EraState::kWriting, EraState::kDone));
    }
    SECTION("retry loop") {
        CHECK(is_valid_transition(EraState::kFetching, EraState::kRetrying));
        CHECK(is_valid_transition(EraState::kRetrying, EraState::kFetching));
        CHECK(is_valid_transition(EraState::kRetrying, EraState::kFailed));
    }
    SECTION("terminal states are final") {
        for (const auto to : {EraState::kPending, EraState::kFetching, EraState::kRetrying, EraState::kEncoding,
                              EraState::kWriting, EraState::kDone, EraState::kFailed}) {
            CHECK_FALSE(is_valid_transition(EraState::kDone, to));
            CHECK_FALSE(is_valid_transition(EraState::kFailed, to));
        }
    }
    SECTION("no shortcut") {
        CHECK_FALSE(is_valid_transition(EraState::kPending, EraState::kWriting));
        CHECK_FALSE(is_valid_transition(EraState::kFetching, EraState::kDone));
        CHECK_FALSE(is_valid_transition(EraState::kRetrying, EraState::kEncoding));
    }
    CHECK(is_in_flight(EraState::kFetching));
    CHECK(is_in_flight(EraState::kRetrying));
    CHECK_FALSE(is_in_flight(EraState::kEncoding));
    CHECK_FALSE(is_in_flight(EraState::kPending));
}

TEST_CASE("Credential is never printed", "[erafetch][fetch][types]") {
    const Credential credential{"s3cr3t-token"};
    std::ostringstream out;
    out << credential;
    CHECK(out.str() == "<redacted>");
    CHECK(credential.token() == "s3cr3t-token");
    CHECK(Credential{}.empty());
}

TEST_CASE("FetchReport exit status", "[erafetch][fetch][types]") {
    FetchReport report;
    CHECK(report.success());
    CHECK(to_exit_status(report) == kExitSuccess);

    report.failures.push_back(FailedEra{3, EraFailure{FetchErrorKind::kExhaustedRetries, "gave up"}});
    CHECK_FALSE(report.success());
    CHECK(report.failed_eras() == std::vector<EraIndex>{3});
    CHECK(to_exit_status(report) == kExitFailedEras);

    report.cancelled.push_back(4);
    CHECK(to_exit_status(report) == kExitCancelled);
}

}  // namespace erafetch::fetch
