// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the meshvault daemon
 */

#include <string>

namespace meshvault {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; ///< -c/--config (empty = MESHVAULT_CONFIG or default)
    bool once = false;       ///< --once: single refresh, then exit

    // Logging
    int verbosity = 0;     ///< -v = debug, -vv = trace
    std::string log_dest;  ///< --log-dest override (empty = from config)
    std::string log_file;  ///< --log-file override (empty = from config)

    int exit_code = 0; ///< Exit status when parse_cli_args() returns false
};

/// Config file used when neither -c nor MESHVAULT_CONFIG is given
constexpr const char* DEFAULT_CONFIG_PATH = "meshvault.json";

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true to continue startup, false if help/version was shown or an
 *         error occurred (args.exit_code holds the status to exit with)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Config path from CLI, then MESHVAULT_CONFIG, then DEFAULT_CONFIG_PATH
 */
std::string resolve_config_path(const CliArgs& args);

/// @brief Version string baked in at build time
const char* meshvault_version();

} // namespace meshvault
