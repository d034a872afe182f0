// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "errors.hpp"

namespace erafetch::fetch {

std::string_view to_string(FetchErrorKind kind) {
    switch (kind) {
        case FetchErrorKind::kInvalidRange:
            return "InvalidRange";
        case FetchErrorKind::kTransientStream:
            return "TransientStream";
        case FetchErrorKind::kShortStream:
            return "ShortStream";
        case FetchErrorKind::kAuth:
            return "Auth";
        case FetchErrorKind::kProtocol:
            return "Protocol";
        case FetchErrorKind::kExhaustedRetries:
            return "ExhaustedRetries";
        case FetchErrorKind::kEncode:
            return "Encode";
        case FetchErrorKind::kWrite:
            return "Write";
    }
    return "Unknown";
}

bool is_retryable(FetchErrorKind kind) {
    return kind == FetchErrorKind::kTransientStream || kind == FetchErrorKind::kShortStream;
}

}  // namespace erafetch::fetch
