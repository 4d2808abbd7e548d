// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file measurement_extractors.h
 * @brief Map raw Moonraker payloads into typed measurement records
 *
 * All functions are pure: no I/O, no logging side effects beyond debug output.
 */

#pragma once

#include "measurement_types.h"
#include "moonraker_rpc_channel.h"

#include <optional>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace meshvault {

/// Console line Klipper prints once BED_MESH_CALIBRATE finishes
constexpr const char* DEFAULT_MESH_COMPLETE_MARKER = "Mesh Bed Leveling Complete";

/**
 * @brief Extract probe points from a server.gcode_store result
 *
 * Accepts either the full result object ({"gcode_store": [...]}) or the entry
 * array itself. Each entry is {message, time, type}; only messages starting
 * with "probe at <x>,<y> is z=<z>" produce a record.
 */
std::vector<ProbeRecord> extract_probes(const json& gcode_store);

/**
 * @brief Extract Z-offset measurements from a server.gcode_store result
 *
 * Matches "probe: z_offset: <value>" anywhere in the message, which may span
 * several lines.
 */
std::vector<OffsetRecord> extract_offsets(const json& gcode_store);

/**
 * @brief Extract the active bed mesh from a printer.objects.query result
 *
 * @param objects_result Reply result, {"status": {"bed_mesh": {...}}, ...}
 * @param now Capture timestamp in seconds since the epoch
 * @return std::nullopt if bed_mesh is absent, not an object, or has no probed_matrix
 */
std::optional<MeshSnapshot> extract_mesh(const json& objects_result, double now);

/// @brief extract_mesh() stamped with the current wall-clock time
std::optional<MeshSnapshot> extract_mesh(const json& objects_result);

/**
 * @brief True if a notification is the console line announcing a finished mesh
 *
 * Requires method "notify_gcode_response" and params[0] containing @p marker.
 */
bool is_mesh_complete_marker(const RpcFrame& notification,
                             const std::string& marker = DEFAULT_MESH_COMPLETE_MARKER);

/// @brief Current wall-clock time in (fractional) seconds since the epoch
double wall_clock_seconds();

} // namespace meshvault
