// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "trigger_supervisor.h"

#include "spdlog/spdlog.h"

#include <cstdint>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace meshvault {

/**
 * @brief Daemon configuration manager (singleton)
 *
 * Loads configuration from a JSON file and applies environment overrides.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Initialized once at startup on the main
 * thread; workers receive the derived SupervisorSettings by value.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/etc/meshvault.json");
 *
 * std::string host = cfg->get<std::string>("/moonraker/host", "127.0.0.1");
 * cfg->set<int>("/moonraker/port", 7125);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

    /// Milliseconds setting in [1, UINT32_MAX], else @p default_value
    uint32_t positive_ms(const std::string& json_ptr, uint32_t default_value);

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails to
     * parse is backed up to <path>.corrupt and replaced with defaults. Keys
     * missing from an existing file are filled in from defaults and saved.
     * Environment overrides are applied last and never written back.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/moonraker/host")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found or of another type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * @return Configuration value, or default_value if the path doesn't exist
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist. In-memory only until
     * save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get JSON sub-object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Write configuration to disk (temp file + rename)
     *
     * @return false if the file could not be written
     */
    bool save();

    /**
     * @brief Apply MOONRAKER_HOST, MOONRAKER_PORT, *_DATA_FILE and delay overrides
     *
     * Unparseable numeric values are logged and ignored.
     */
    void apply_env_overrides();

    /**
     * @brief JSON pointers of required settings that are empty
     *
     * Required: /moonraker/host, /stores/probes, /stores/meshes, /stores/z_offsets
     */
    std::vector<std::string> missing_required();

    /// @brief ws://<host>:<port>/websocket
    std::string moonraker_url();

    /**
     * @brief Connection and trigger settings for the supervisor
     *
     * Non-positive timeouts and intervals fall back to their defaults;
     * negative delays become 0.
     *
     * @throws nlohmann::json::type_error if a setting has the wrong type
     */
    SupervisorSettings supervisor_settings();

    /// @brief WebSocket ping interval, defaulting like the timeouts
    uint32_t keepalive_interval_ms();

    std::string get_path();

    /// @brief Default configuration document
    static json get_default_config();

    static Config* get_instance();
};

} // namespace meshvault
