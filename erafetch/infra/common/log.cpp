// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>

#include <absl/strings/ascii.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include "terminal.hpp"

namespace erafetch::log {

namespace {

    //! Process-wide destination of the log lines
    struct Sink {
        Settings settings;
        absl::TimeZone time_zone{absl::UTCTimeZone()};
        std::mutex mutex;
        std::optional<std::ofstream> file;

        void write(std::string line) {
            if (settings.log_nocolor) {
                strip_colors(line);
            }
            std::scoped_lock lock{mutex};
            (settings.log_std_out ? std::cout : std::cerr) << line << '\n';
            if (file) {
                if (!settings.log_nocolor) {
                    strip_colors(line);
                }
                *file << line << '\n';
            }
        }
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

    thread_local std::string thread_name;

    //! Fixed width of the thread name column
    constexpr size_t kThreadNameWidth{11};

    //! Width of the message column when key-value arguments follow
    constexpr size_t kMessageWidth{41};

    struct LevelStyle {
        std::string_view tag;
        std::string_view color;
    };

    LevelStyle level_style(Level level) {
        switch (level) {
            case Level::kTrace:
                return {"TRACE", kColorCoal};
            case Level::kDebug:
                return {"DEBUG", kBackgroundPurple};
            case Level::kInfo:
                return {" INFO", kColorGreen};
            case Level::kWarning:
                return {" WARN", kColorYellowHigh};
            case Level::kError:
                return {"ERROR", kColorRed};
            case Level::kCritical:
                return {" CRIT", kBackgroundRed};
            case Level::kNone:
                break;
        }
        return {"     ", kColorReset};
    }

    const std::string& current_thread_name() {
        if (thread_name.empty()) {
            std::ostringstream id;
            id << std::this_thread::get_id();
            thread_name = id.str();
        }
        return thread_name;
    }

}  // namespace

void init(const Settings& settings) {
    auto& instance{sink()};
    instance.settings = settings;
    instance.time_zone = settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone();
    instance.file.reset();
    if (!settings.log_file.empty()) {
        instance.file.emplace(settings.log_file, std::ios::out | std::ios::app);
        if (!instance.file->is_open()) {
            instance.file.reset();
            throw std::runtime_error{"cannot open log file " + settings.log_file};
        }
    }
    if (!is_terminal_output(settings.log_std_out)) {
        instance.settings.log_nocolor = true;
    }
}

Level get_verbosity() { return sink().settings.log_verbosity; }

void set_verbosity(Level level) { sink().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings.log_verbosity; }

void set_thread_name(const char* name) {
    thread_name = name;
    thread_name.resize(kThreadNameWidth, ' ');
}

BufferBase::BufferBase(Level level) : should_print_{test_verbosity(level)} {
    if (!should_print_) return;

    const auto& settings{sink().settings};
    const auto [tag, color] = level_style(level);
    ss_ << kColorReset << " " << color << tag << kColorReset << " ";
    ss_ << kColorWhite << "[" << absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), sink().time_zone) << "] "
        << kColorReset;
    if (settings.log_threads) {
        ss_ << "[" << current_thread_name() << "] ";
    }
}

BufferBase::BufferBase(Level level, std::string_view msg, const Args& args) : BufferBase(level) {
    if (!should_print_) return;
    ss_ << msg;
    if (args.empty()) return;
    if (msg.size() < kMessageWidth) {
        ss_ << std::string(kMessageWidth - msg.size(), ' ');
    } else {
        ss_ << ' ';
    }
    append_args(args);
}

BufferBase::~BufferBase() {
    if (!should_print_) return;
    sink().write(ss_.str());
}

void BufferBase::append_args(const Args& args) {
    if (!should_print_) return;
    for (size_t i{0}; i < args.size(); i += 2) {
        ss_ << kColorGreen << absl::StripAsciiWhitespace(args[i]) << kColorReset << "=";
        if (i + 1 < args.size()) {
            ss_ << kColorWhite << args[i + 1] << kColorReset;
        }
        ss_ << ' ';
    }
}

}  // namespace erafetch::log
