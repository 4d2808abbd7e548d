// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file measurement_types.h
 * @brief Record types persisted by the measurement stores
 *
 * Each record serializes to one JSON object inside its store's array document.
 * from_json() uses at() so a record missing a field raises json::out_of_range,
 * which the store treats as a malformed file.
 */

#pragma once

#include <array>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace meshvault {

/**
 * @brief One bed-probe point parsed from the G-code console history
 *
 * Identity key is the server timestamp of the console line.
 */
struct ProbeRecord {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
    double timestamp = 0.0; ///< Moonraker gcode_store "time"

    bool operator==(const ProbeRecord& other) const {
        return x == other.x && y == other.y && z == other.z && timestamp == other.timestamp;
    }
};

/**
 * @brief One probe Z-offset measurement parsed from the G-code console history
 */
struct OffsetRecord {
    double z_offset = 0.0;
    double timestamp = 0.0; ///< Moonraker gcode_store "time"

    bool operator==(const OffsetRecord& other) const {
        return z_offset == other.z_offset && timestamp == other.timestamp;
    }
};

/**
 * @brief A captured bed mesh
 *
 * Two snapshots describe the same mesh iff their probed_matrix values are
 * equal; the timestamp is the client capture time and plays no part in it.
 */
struct MeshSnapshot {
    double timestamp = 0.0;                       ///< Client wall clock, seconds since epoch
    std::string profile_name;                     ///< Active profile (e.g., "default")
    std::array<double, 2> mesh_min{{0.0, 0.0}};   ///< Min X,Y coordinates
    std::array<double, 2> mesh_max{{0.0, 0.0}};   ///< Max X,Y coordinates
    std::vector<std::vector<double>> probed_matrix; ///< Z height grid (row-major order)

    bool same_mesh(const MeshSnapshot& other) const {
        return probed_matrix == other.probed_matrix;
    }
};

inline void to_json(json& j, const ProbeRecord& r) {
    j = json{{"x", r.x}, {"y", r.y}, {"z", r.z}, {"timestamp", r.timestamp}};
}

inline void from_json(const json& j, ProbeRecord& r) {
    j.at("x").get_to(r.x);
    j.at("y").get_to(r.y);
    j.at("z").get_to(r.z);
    j.at("timestamp").get_to(r.timestamp);
}

inline void to_json(json& j, const OffsetRecord& r) {
    j = json{{"z_offset", r.z_offset}, {"timestamp", r.timestamp}};
}

inline void from_json(const json& j, OffsetRecord& r) {
    j.at("z_offset").get_to(r.z_offset);
    j.at("timestamp").get_to(r.timestamp);
}

inline void to_json(json& j, const MeshSnapshot& m) {
    j = json{{"timestamp", m.timestamp},
             {"profile_name", m.profile_name},
             {"mesh_min", m.mesh_min},
             {"mesh_max", m.mesh_max},
             {"probed_matrix", m.probed_matrix}};
}

inline void from_json(const json& j, MeshSnapshot& m) {
    j.at("timestamp").get_to(m.timestamp);
    const auto& name = j.at("profile_name");
    m.profile_name = name.is_null() ? std::string() : name.get<std::string>();
    j.at("mesh_min").get_to(m.mesh_min);
    j.at("mesh_max").get_to(m.mesh_max);
    j.at("probed_matrix").get_to(m.probed_matrix);
}

} // namespace meshvault
