// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#ifndef MESHVAULT_VERSION
#define MESHVAULT_VERSION "0.0.0-dev"
#endif

namespace meshvault {

namespace {

void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Keeps probe, bed mesh and Z-offset history from a Moonraker printer on disk.\n");
    printf("Options:\n");
    printf("  -c, --config <path>  Config file (default: %s, env MESHVAULT_CONFIG)\n",
           DEFAULT_CONFIG_PATH);
    printf("  --once               Connect, run one full refresh, and exit\n");
    printf("  -v, --verbose        Increase verbosity (-v=debug, -vv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
    printf("\nEnvironment overrides:\n");
    printf("  MOONRAKER_HOST, MOONRAKER_PORT, PROBE_DATA_FILE, MESH_DATA_FILE,\n");
    printf("  Z_OFFSET_DATA_FILE, SYNC_INTERVAL_HOURS, RETRY_DELAY_SECONDS,\n");
    printf("  SETTLE_DELAY_SECONDS\n");
}

} // namespace

const char* meshvault_version() {
    return MESHVAULT_VERSION;
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        // Config file
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires a path argument\n", argv[i]);
                args.exit_code = 1;
                return false;
            }
            args.config_path = argv[++i];
        } else if (strncmp(argv[i], "--config=", 9) == 0) {
            args.config_path = argv[i] + 9;
        }
        // One-shot mode
        else if (strcmp(argv[i], "--once") == 0) {
            args.once = true;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Logging destination
        else if (strcmp(argv[i], "--log-dest") == 0 || strncmp(argv[i], "--log-dest=", 11) == 0) {
            const char* value = nullptr;
            if (strncmp(argv[i], "--log-dest=", 11) == 0) {
                value = argv[i] + 11;
            } else if (i + 1 < argc) {
                value = argv[++i];
            } else {
                printf("Error: --log-dest requires an argument\n");
                args.exit_code = 1;
                return false;
            }
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                args.exit_code = 1;
                return false;
            }
        } else if (strcmp(argv[i], "--log-file") == 0 || strncmp(argv[i], "--log-file=", 11) == 0) {
            if (strncmp(argv[i], "--log-file=", 11) == 0) {
                args.log_file = argv[i] + 11;
            } else if (i + 1 < argc) {
                args.log_file = argv[++i];
            } else {
                printf("Error: --log-file requires a path argument\n");
                args.exit_code = 1;
                return false;
            }
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            args.exit_code = 0;
            return false;
        }
        // Version
        else if (strcmp(argv[i], "-V") == 0 || strcmp(argv[i], "--version") == 0) {
            printf("meshvault %s\n", meshvault_version());
            args.exit_code = 0;
            return false;
        } else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            args.exit_code = 1;
            return false;
        }
    }

    return true;
}

std::string resolve_config_path(const CliArgs& args) {
    if (!args.config_path.empty()) {
        return args.config_path;
    }
    const char* env = std::getenv("MESHVAULT_CONFIG");
    if (env && env[0] != '\0') {
        return env;
    }
    return DEFAULT_CONFIG_PATH;
}

} // namespace meshvault
