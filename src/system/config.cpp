// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "record_store.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <sys/stat.h>

namespace meshvault {

Config* Config::instance{NULL};

namespace {

/// Copy keys present in defaults but absent from target; recurses into objects
bool fill_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key())) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified = fill_missing(target[it.key()], it.value()) || modified;
        }
    }
    return modified;
}

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && value[0] != '\0') ? value : nullptr;
}

void override_string(json& data, const char* env_name, const char* json_ptr) {
    if (const char* value = env_value(env_name)) {
        data[json::json_pointer(json_ptr)] = std::string(value);
        spdlog::debug("[Config] {} overridden by {}", json_ptr, env_name);
    }
}

void override_int(json& data, const char* env_name, const char* json_ptr) {
    const char* value = env_value(env_name);
    if (!value) {
        return;
    }
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        data[json::json_pointer(json_ptr)] = parsed;
        spdlog::debug("[Config] {} overridden by {}={}", json_ptr, env_name, parsed);
    } catch (const std::logic_error& e) {
        spdlog::warn("[Config] Ignoring {}='{}': not an integer ({})", env_name, value, e.what());
    }
}

void override_double(json& data, const char* env_name, const char* json_ptr) {
    const char* value = env_value(env_name);
    if (!value) {
        return;
    }
    try {
        size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument("trailing characters");
        }
        data[json::json_pointer(json_ptr)] = parsed;
        spdlog::debug("[Config] {} overridden by {}={}", json_ptr, env_name, parsed);
    } catch (const std::logic_error& e) {
        spdlog::warn("[Config] Ignoring {}='{}': not a number ({})", env_name, value, e.what());
    }
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == NULL) {
        instance = new Config();
    }
    return instance;
}

json Config::get_default_config() {
    return {{"moonraker",
             {{"host", ""},
              {"port", 7125},
              {"connect_timeout_ms", 10000},
              {"request_timeout_ms", 30000},
              {"keepalive_interval_ms", 10000}}},
            {"stores", {{"probes", ""}, {"meshes", ""}, {"z_offsets", ""}}},
            {"sync",
             {{"interval_hours", 6.0},
              {"retry_delay_sec", 30},
              {"settle_delay_sec", 30},
              {"trigger_marker", DEFAULT_MESH_COMPLETE_MARKER}}},
            {"log_level", "info"},
            {"log_dest", "console"},
            {"log_file", ""}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::ifstream(config_path));
            if (!data.is_object()) {
                throw std::runtime_error(std::string("top level is ") + data.type_name() +
                                         ", expected object");
            }
        } catch (const std::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (fill_missing(data, get_default_config())) {
            spdlog::debug("[Config] Added missing default keys");
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Continuing with in-memory configuration");
    }

    apply_env_overrides();

    spdlog::debug("[Config] initialized: moonraker={}:{}",
                  get<std::string>("/moonraker/host", ""), get<int>("/moonraker/port", 7125));
}

void Config::apply_env_overrides() {
    override_string(data, "MOONRAKER_HOST", "/moonraker/host");
    override_int(data, "MOONRAKER_PORT", "/moonraker/port");
    override_string(data, "PROBE_DATA_FILE", "/stores/probes");
    override_string(data, "MESH_DATA_FILE", "/stores/meshes");
    override_string(data, "Z_OFFSET_DATA_FILE", "/stores/z_offsets");
    override_double(data, "SYNC_INTERVAL_HOURS", "/sync/interval_hours");
    override_int(data, "RETRY_DELAY_SECONDS", "/sync/retry_delay_sec");
    override_int(data, "SETTLE_DELAY_SECONDS", "/sync/settle_delay_sec");
}

std::vector<std::string> Config::missing_required() {
    static const char* const required[] = {"/moonraker/host", "/stores/probes", "/stores/meshes",
                                           "/stores/z_offsets"};
    std::vector<std::string> missing;
    for (const char* key : required) {
        json::json_pointer ptr(key);
        if (!data.contains(ptr) || !data[ptr].is_string() ||
            data[ptr].get<std::string>().empty()) {
            missing.emplace_back(key);
        }
    }
    return missing;
}

std::string Config::moonraker_url() {
    return "ws://" + get<std::string>("/moonraker/host", "") + ":" +
           std::to_string(get<int>("/moonraker/port", 7125)) + "/websocket";
}

SupervisorSettings Config::supervisor_settings() {
    SupervisorSettings settings;
    settings.url = moonraker_url();
    settings.connect_timeout_ms =
        positive_ms("/moonraker/connect_timeout_ms", settings.connect_timeout_ms);
    settings.request_timeout_ms =
        positive_ms("/moonraker/request_timeout_ms", settings.request_timeout_ms);

    double hours = get<double>("/sync/interval_hours", 6.0);
    if (!(hours > 0.0)) {
        spdlog::warn("[Config] sync.interval_hours must be positive (got {}), using 6", hours);
        hours = 6.0;
    }
    settings.sync_interval =
        std::chrono::milliseconds(static_cast<int64_t>(std::llround(hours * 3600.0 * 1000.0)));

    int retry = get<int>("/sync/retry_delay_sec", 30);
    settings.retry_delay = std::chrono::seconds(retry < 0 ? 0 : retry);

    int settle = get<int>("/sync/settle_delay_sec", 30);
    settings.settle_delay = std::chrono::seconds(settle < 0 ? 0 : settle);

    settings.trigger_marker =
        get<std::string>("/sync/trigger_marker", DEFAULT_MESH_COMPLETE_MARKER);
    return settings;
}

uint32_t Config::keepalive_interval_ms() {
    return positive_ms("/moonraker/keepalive_interval_ms", 10000);
}

uint32_t Config::positive_ms(const std::string& json_ptr, uint32_t default_value) {
    int64_t value = get<int64_t>(json_ptr, default_value);
    if (value <= 0 || value > static_cast<int64_t>(UINT32_MAX)) {
        spdlog::warn("[Config] {} must be between 1 and {} ms (got {}), using {}", json_ptr,
                     UINT32_MAX, value, default_value);
        return default_value;
    }
    return static_cast<uint32_t>(value);
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);
    try {
        store_detail::write_atomic(path, data.dump(2) + "\n");
    } catch (const StoreWriteError& e) {
        spdlog::error("[Config] {}", e.what());
        return false;
    }
    spdlog::trace("[Config] saved successfully to {}", path);
    return true;
}

} // namespace meshvault
