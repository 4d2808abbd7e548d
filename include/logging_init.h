// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup for the daemon: console sink plus one selected target
 */

#include <spdlog/spdlog.h>

#include <string>

namespace meshvault {
namespace logging {

enum class LogTarget {
    Auto,    ///< Journal if available, else syslog on Linux; console elsewhere
    Journal, ///< systemd journal (needs MESHVAULT_HAS_SYSTEMD, else syslog)
    Syslog,  ///< Traditional syslog
    File,    ///< Rotating log file, 5MB x 3
    Console  ///< stdout only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< LogTarget::File destination (empty = DEFAULT_LOG_FILE)
    bool enable_console = true;
};

/// Used for LogTarget::File when no path is configured
constexpr const char* DEFAULT_LOG_FILE = "meshvault.log";

/**
 * @brief Install the "meshvault" logger as spdlog's default logger
 *
 * Never throws. A target that cannot be opened is reported on stderr and the
 * logger falls back to stdout; the logger always has at least one sink.
 */
void init(const LogConfig& config);

/**
 * @brief Target actually used on this build for a requested one
 *
 * Resolves Auto, and maps targets this build cannot provide onto the
 * nearest one it can (Journal -> Syslog -> Console).
 */
LogTarget resolve_target(LogTarget requested);

/**
 * @brief Log file that sits beside the config file
 *
 * "/etc/meshvault/meshvault.json" -> "/etc/meshvault/meshvault.log"
 */
std::string log_file_beside(const std::string& config_path);

/// @brief "auto", "journal", "syslog", "file", "console"; unknown -> Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Map a config "log_level" string to an spdlog level
 *
 * @return info for unrecognized names
 */
spdlog::level::level_enum parse_log_level(const std::string& str);

} // namespace logging
} // namespace meshvault
