// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file main.cpp
 * @brief meshvault daemon entry point
 *
 * The supervisor runs on a worker thread; the main thread only watches for
 * SIGINT/SIGTERM and turns them into request_shutdown().
 */

#include "cli_args.h"
#include "config.h"
#include "logging_init.h"
#include "moonraker_events.h"
#include "sync_engine.h"
#include "trigger_supervisor.h"
#include "websocket_transport.h"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace meshvault;

static volatile sig_atomic_t g_quit = 0;

static void signal_handler(int sig) {
    (void)sig;
    g_quit = 1;
}

static void setup_signal_handlers() {
    signal(SIGTERM, signal_handler);
    signal(SIGINT, signal_handler);
}

static spdlog::level::level_enum verbosity_level(int verbosity,
                                                 spdlog::level::level_enum configured) {
    if (verbosity >= 2) {
        return spdlog::level::trace;
    }
    if (verbosity == 1) {
        return spdlog::level::debug;
    }
    return configured;
}

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.exit_code;
    }

    // Console-only until the config says otherwise
    logging::LogConfig boot_log;
    boot_log.level = verbosity_level(args.verbosity, spdlog::level::info);
    boot_log.target = logging::LogTarget::Console;
    logging::init(boot_log);

    std::string config_path = resolve_config_path(args);
    Config* config = Config::get_instance();
    config->init(config_path);

    logging::LogConfig log_config;
    std::vector<std::string> missing;
    SupervisorSettings settings;
    uint32_t keepalive_ms = 0;
    std::string probes_path;
    std::string meshes_path;
    std::string offsets_path;
    try {
        log_config.level =
            verbosity_level(args.verbosity,
                            logging::parse_log_level(config->get<std::string>("/log_level", "info")));
        log_config.target = logging::parse_log_target(
            args.log_dest.empty() ? config->get<std::string>("/log_dest", "console")
                                  : args.log_dest);
        log_config.file_path =
            args.log_file.empty() ? config->get<std::string>("/log_file", "") : args.log_file;
        if (log_config.file_path.empty()) {
            log_config.file_path = logging::log_file_beside(config_path);
        }

        missing = config->missing_required();
        if (missing.empty()) {
            settings = config->supervisor_settings();
            keepalive_ms = config->keepalive_interval_ms();
            probes_path = config->get<std::string>("/stores/probes");
            meshes_path = config->get<std::string>("/stores/meshes");
            offsets_path = config->get<std::string>("/stores/z_offsets");
        }
    } catch (const json::exception& e) {
        spdlog::critical("[Main] Invalid configuration in {}: {}", config_path, e.what());
        return 1;
    }

    logging::init(log_config);

    spdlog::info("[Main] meshvault {} starting (config: {})", meshvault_version(), config_path);

    if (!missing.empty()) {
        for (const auto& key : missing) {
            spdlog::critical("[Main] Required setting {} is not set", key);
        }
        spdlog::critical("[Main] Set them in {} or through the environment "
                         "(MOONRAKER_HOST, PROBE_DATA_FILE, MESH_DATA_FILE, Z_OFFSET_DATA_FILE)",
                         config_path);
        return 1;
    }

    EventEmitter events;
    MeasurementStores stores(probes_path, meshes_path, offsets_path, &events);

    TransportFactory factory = [keepalive_ms, &events]() -> std::unique_ptr<MoonrakerTransport> {
        return std::make_unique<WebSocketTransport>(keepalive_ms, &events);
    };

    TriggerSupervisor supervisor(settings, factory, stores, events);

    setup_signal_handlers();

    std::atomic_bool finished{false};
    bool once_ok = false;
    std::thread worker([&]() {
        if (args.once) {
            once_ok = supervisor.run_once();
        } else {
            supervisor.run();
        }
        finished.store(true);
    });

    while (!finished.load()) {
        if (g_quit) {
            spdlog::info("[Main] User interrupted, shutting down");
            supervisor.request_shutdown();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    worker.join();

    spdlog::info("[Main] Exiting");
    spdlog::shutdown();

    if (args.once) {
        return once_ok ? 0 : 1;
    }
    return 0;
}
