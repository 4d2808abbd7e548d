// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include "../test_fixtures.h"

#include <catch2/catch_test_macros.hpp>

using namespace meshvault;
using namespace meshvault::logging;

// ============================================================================
// parse_log_level() tests
// ============================================================================

TEST_CASE("parse_log_level: valid level strings", "[logging][config]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warn") == spdlog::level::warn);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("error") == spdlog::level::err);
    REQUIRE(parse_log_level("critical") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
}

TEST_CASE("parse_log_level: unknown strings fall back to info", "[logging][config]") {
    REQUIRE(parse_log_level("") == spdlog::level::info);
    REQUIRE(parse_log_level("verbose") == spdlog::level::info);
    REQUIRE(parse_log_level("TRACE") == spdlog::level::info); // case sensitive
}

// ============================================================================
// parse_log_target() tests
// ============================================================================

TEST_CASE("parse_log_target: names round-trip", "[logging][config]") {
    for (LogTarget target : {LogTarget::Auto, LogTarget::Journal, LogTarget::Syslog,
                             LogTarget::File, LogTarget::Console}) {
        REQUIRE(parse_log_target(log_target_name(target)) == target);
    }
}

TEST_CASE("parse_log_target: unknown strings select auto", "[logging][config]") {
    REQUIRE(parse_log_target("") == LogTarget::Auto);
    REQUIRE(parse_log_target("stderr") == LogTarget::Auto);
}

// ============================================================================
// resolve_target() / log_file_beside() tests
// ============================================================================

TEST_CASE("resolve_target: explicit file and console are kept", "[logging]") {
    REQUIRE(resolve_target(LogTarget::File) == LogTarget::File);
    REQUIRE(resolve_target(LogTarget::Console) == LogTarget::Console);
}

TEST_CASE("resolve_target: auto picks a concrete target", "[logging]") {
    LogTarget target = resolve_target(LogTarget::Auto);
    REQUIRE(target != LogTarget::Auto);
#ifdef __linux__
    REQUIRE((target == LogTarget::Journal || target == LogTarget::Syslog));
    REQUIRE(resolve_target(LogTarget::Syslog) == LogTarget::Syslog);
#endif
#if defined(__linux__) && !defined(MESHVAULT_HAS_SYSTEMD)
    REQUIRE(target == LogTarget::Syslog);
    REQUIRE(resolve_target(LogTarget::Journal) == LogTarget::Syslog);
#endif
}

TEST_CASE("log_file_beside: log sits next to the config file", "[logging]") {
    REQUIRE(log_file_beside("/etc/meshvault/meshvault.json") == "/etc/meshvault/meshvault.log");
    REQUIRE(log_file_beside("meshvault.json") == "meshvault.log");
    REQUIRE(log_file_beside("/home/pi/printer_data/config/mv") ==
            "/home/pi/printer_data/config/mv.log");
    REQUIRE(log_file_beside("/var/lib/meshvault/") == "/var/lib/meshvault/meshvault.log");
}

// ============================================================================
// init() tests
// ============================================================================

namespace {

size_t sink_count() {
    return spdlog::default_logger()->sinks().size();
}

/// Leave later tests with a plain console logger
void reset_to_console() {
    LogConfig console;
    console.target = LogTarget::Console;
    console.level = spdlog::level::warn;
    init(console);
}

} // namespace

TEST_CASE_METHOD(TempDirFixture, "logging::init: file target writes to the given path",
                 "[logging]") {
    LogConfig config;
    config.level = spdlog::level::debug;
    config.target = LogTarget::File;
    config.file_path = file("logs/meshvault.log");
    config.enable_console = false;

    init(config);
    spdlog::info("[Logging] file target test line");
    spdlog::default_logger()->flush();

    REQUIRE(spdlog::get_level() == spdlog::level::debug);
    REQUIRE(sink_count() == 1);
    REQUIRE(exists(file("logs/meshvault.log")));
    REQUIRE(read_file(file("logs/meshvault.log")).find("file target test line") !=
            std::string::npos);

    // Back to console so later tests do not write into the removed directory
    reset_to_console();
}

TEST_CASE_METHOD(TempDirFixture, "logging::init: unusable log file falls back to stdout",
                 "[logging]") {
    write_file(file("blocker"), "not a directory");

    LogConfig config;
    config.target = LogTarget::File;
    config.file_path = file("blocker/meshvault.log");

    SECTION("with console enabled") {
        REQUIRE_NOTHROW(init(config));
        REQUIRE(sink_count() == 1);
    }

    SECTION("with console disabled") {
        config.enable_console = false;
        REQUIRE_NOTHROW(init(config));
        REQUIRE(sink_count() == 1);
    }

    REQUIRE_FALSE(exists(file("blocker/meshvault.log")));
    reset_to_console();
}

TEST_CASE("logging::init: console target", "[logging]") {
    LogConfig config;
    config.target = LogTarget::Console;

    SECTION("console only") {
        init(config);
        REQUIRE(sink_count() == 1);
    }

    SECTION("a logger with no sinks gets stdout") {
        config.enable_console = false;
        init(config);
        REQUIRE(sink_count() == 1);
    }

    REQUIRE(spdlog::default_logger()->name() == "meshvault");
    reset_to_console();
}

#ifdef __linux__
TEST_CASE("logging::init: syslog target adds a sink beside the console", "[logging]") {
    LogConfig config;
    config.target = LogTarget::Syslog;
    init(config);
    REQUIRE(sink_count() == 2);
    reset_to_console();
}
#endif
