// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace erafetch::log {

//! Severity of a log line, lines above the configured verbosity are dropped
enum class Level {
    kNone,  // always printed, e.g. build info
    kCritical,
    kError,
    kWarning,
    kInfo,
    kDebug,
    kTrace,
};

struct Settings {
    bool log_std_out{false};  // print to std::cout instead of std::cerr
    bool log_utc{true};       // timestamps in UTC instead of local time
    bool log_nocolor{false};
    bool log_threads{false};  // print the thread name
    Level log_verbosity{Level::kInfo};
    std::string log_file;  // also append every line to this file, without colors
};

//! \brief Apply \p settings to every subsequent log line
//! \throws std::runtime_error if the log file cannot be opened
//! \note Not thread safe: call once at startup before any worker thread is running
void init(const Settings& settings = {});

Level get_verbosity();

//! \note Not thread safe: meant for process startup and tests
void set_verbosity(Level level);

bool test_verbosity(Level level);

//! Name the calling thread in log lines (when Settings::log_threads is set)
void set_thread_name(const char* name);

//! Key-value pairs appended after the message: {"era", "42", "blocks", "8192"}
using Args = std::vector<std::string>;

//! Accumulates one log line and prints it on destruction
class BufferBase {
  public:
    explicit BufferBase(Level level);
    BufferBase(Level level, std::string_view msg, const Args& args);
    ~BufferBase();

    BufferBase(const BufferBase&) = delete;
    BufferBase& operator=(const BufferBase&) = delete;

    template <class T>
    BufferBase& operator<<(const T& value) {
        if (should_print_) ss_ << value;
        return *this;
    }
    BufferBase& operator<<(const Args& args) {
        append_args(args);
        return *this;
    }

  protected:
    void append_args(const Args& args);

    const bool should_print_;
    std::ostringstream ss_;
};

template <Level level>
class LogBuffer : public BufferBase {
  public:
    LogBuffer() : BufferBase(level) {}
    explicit LogBuffer(std::string_view msg, const Args& args = {}) : BufferBase(level, msg, args) {}
};

using Trace = LogBuffer<Level::kTrace>;
using Debug = LogBuffer<Level::kDebug>;
using Info = LogBuffer<Level::kInfo>;
using Warning = LogBuffer<Level::kWarning>;
using Error = LogBuffer<Level::kError>;
using Critical = LogBuffer<Level::kCritical>;
using Message = LogBuffer<Level::kNone>;

}  // namespace erafetch::log

// The arguments are evaluated only if the line is going to be printed
#define ERAF_LOGBUFFER(level_, ...)               \
    if (!erafetch::log::test_verbosity(level_)) { \
    } else                                        \
        erafetch::log::LogBuffer<level_>(__VA_ARGS__)

#define ERAF_TRACE_M(...) ERAF_LOGBUFFER(erafetch::log::Level::kTrace, __VA_ARGS__)
#define ERAF_DEBUG_M(...) ERAF_LOGBUFFER(erafetch::log::Level::kDebug, __VA_ARGS__)
#define ERAF_INFO_M(...) ERAF_LOGBUFFER(erafetch::log::Level::kInfo, __VA_ARGS__)
#define ERAF_WARN_M(...) ERAF_LOGBUFFER(erafetch::log::Level::kWarning, __VA_ARGS__)
#define ERAF_ERROR_M(...) ERAF_LOGBUFFER(erafetch::log::Level::kError, __VA_ARGS__)
#define ERAF_CRIT_M(...) ERAF_LOGBUFFER(erafetch::log::Level::kCritical, __VA_ARGS__)
#define ERAF_LOG_M(...) ERAF_LOGBUFFER(erafetch::log::Level::kNone, __VA_ARGS__)

#define ERAF_TRACE ERAF_TRACE_M()
#define ERAF_DEBUG ERAF_DEBUG_M()
#define ERAF_INFO ERAF_INFO_M()
#define ERAF_WARN ERAF_WARN_M()
#define ERAF_ERROR ERAF_ERROR_M()
#define ERAF_CRIT ERAF_CRIT_M()
#define ERAF_LOG ERAF_LOG_M()
