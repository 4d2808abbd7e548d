// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

#ifdef __linux__
#ifdef MESHVAULT_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace meshvault {
namespace logging {

namespace {

constexpr size_t LOG_FILE_MAX_SIZE = 5 * 1024 * 1024;
constexpr size_t LOG_FILE_COUNT = 3;

/// Sink for a resolved target; nullptr for Console or when it cannot be opened
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File: {
        const std::string path = file_path.empty() ? DEFAULT_LOG_FILE : file_path;
        try {
            std::filesystem::path parent = std::filesystem::path(path).parent_path();
            if (!parent.empty()) {
                std::error_code ec;
                std::filesystem::create_directories(parent, ec);
            }
            return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, LOG_FILE_MAX_SIZE,
                                                                          LOG_FILE_COUNT);
        } catch (const spdlog::spdlog_ex& e) {
            fprintf(stderr, "[Logging] Cannot open log file %s: %s\n", path.c_str(), e.what());
            return nullptr;
        }
    }
#ifdef __linux__
#ifdef MESHVAULT_HAS_SYSTEMD
    case LogTarget::Journal:
        return std::make_shared<spdlog::sinks::systemd_sink_mt>("meshvault");
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>("meshvault", LOG_PID, LOG_DAEMON,
                                                               false);
#endif
    default:
        return nullptr;
    }
}

} // namespace

LogTarget resolve_target(LogTarget requested) {
    switch (requested) {
    case LogTarget::Auto:
#if defined(__linux__) && defined(MESHVAULT_HAS_SYSTEMD)
    {
        std::error_code ec;
        if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
            return LogTarget::Journal;
        }
    }
#endif
#ifdef __linux__
        return LogTarget::Syslog;
#else
        return LogTarget::Console;
#endif
    case LogTarget::Journal:
#if defined(__linux__) && defined(MESHVAULT_HAS_SYSTEMD)
        return LogTarget::Journal;
#elif defined(__linux__)
        return LogTarget::Syslog;
#else
        return LogTarget::Console;
#endif
    case LogTarget::Syslog:
#ifdef __linux__
        return LogTarget::Syslog;
#else
        return LogTarget::Console;
#endif
    case LogTarget::File:
    case LogTarget::Console:
        return requested;
    }
    return LogTarget::Console;
}

void init(const LogConfig& config) {
    const LogTarget target = resolve_target(config.target);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    spdlog::sink_ptr target_sink = make_target_sink(target, config.file_path);
    if (target_sink) {
        sinks.push_back(target_sink);
    }

    // Never end up with a logger that writes nowhere
    if (sinks.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("meshvault", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);

    spdlog::debug("[Logging] Initialized: target={}{}, sinks={}, level={}",
                  log_target_name(target), target_sink ? "" : " (unavailable)", sinks.size(),
                  spdlog::level::to_string_view(config.level));
}

std::string log_file_beside(const std::string& config_path) {
    std::filesystem::path path(config_path);
    if (path.filename().empty()) {
        return (path / DEFAULT_LOG_FILE).string();
    }
    return path.replace_extension(".log").string();
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

spdlog::level::level_enum parse_log_level(const std::string& str) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return spdlog::level::info;
}

} // namespace logging
} // namespace meshvault
