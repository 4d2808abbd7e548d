// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "measurement_extractors.h"

#include <spdlog/spdlog.h>

#include <chrono>
#include <regex>
#include <stdexcept>

namespace meshvault {

namespace {

const std::regex& probe_pattern() {
    static const std::regex pattern(R"(probe at ([\d.]+),([\d.]+) is z=([-\d.]+))");
    return pattern;
}

const std::regex& offset_pattern() {
    static const std::regex pattern(R"(probe: z_offset: ([-\d.]+))");
    return pattern;
}

/// Strict string -> double; rejects trailing garbage such as "1.2.3"
bool parse_number(const std::string& text, double& out) {
    try {
        size_t consumed = 0;
        out = std::stod(text, &consumed);
        return consumed == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

/// Accept {"gcode_store": [...]} or the bare array
const json* entry_array(const json& gcode_store) {
    if (gcode_store.is_array()) {
        return &gcode_store;
    }
    if (gcode_store.is_object()) {
        auto it = gcode_store.find("gcode_store");
        if (it != gcode_store.end() && it->is_array()) {
            return &(*it);
        }
    }
    return nullptr;
}

/// Message text and numeric time of a console entry, or false to skip it
bool entry_fields(const json& entry, std::string& message, double& time) {
    if (!entry.is_object()) {
        return false;
    }
    auto msg = entry.find("message");
    auto t = entry.find("time");
    if (msg == entry.end() || !msg->is_string() || t == entry.end() || !t->is_number()) {
        return false;
    }
    message = msg->get<std::string>();
    time = t->get<double>();
    return true;
}

bool parse_bounds(const json& bed_mesh, const char* key, std::array<double, 2>& out) {
    auto it = bed_mesh.find(key);
    if (it != bed_mesh.end() && it->is_array() && it->size() >= 2 && (*it)[0].is_number() &&
        (*it)[1].is_number()) {
        out[0] = (*it)[0].get<double>();
        out[1] = (*it)[1].get<double>();
        return true;
    }
    out = {{0.0, 0.0}};
    return false;
}

} // namespace

std::vector<ProbeRecord> extract_probes(const json& gcode_store) {
    std::vector<ProbeRecord> records;
    const json* entries = entry_array(gcode_store);
    if (!entries) {
        spdlog::debug("[Extractors] gcode_store payload has no entry array");
        return records;
    }

    std::string message;
    double time = 0.0;
    for (const auto& entry : *entries) {
        if (!entry_fields(entry, message, time)) {
            continue;
        }

        std::smatch match;
        if (!std::regex_search(message, match, probe_pattern(),
                               std::regex_constants::match_continuous)) {
            continue;
        }

        ProbeRecord record;
        if (!parse_number(match[1].str(), record.x) || !parse_number(match[2].str(), record.y) ||
            !parse_number(match[3].str(), record.z)) {
            continue;
        }
        record.timestamp = time;
        records.push_back(record);
    }

    spdlog::debug("[Extractors] Found {} probe points in {} gcode_store entries", records.size(),
                  entries->size());
    return records;
}

std::vector<OffsetRecord> extract_offsets(const json& gcode_store) {
    std::vector<OffsetRecord> records;
    const json* entries = entry_array(gcode_store);
    if (!entries) {
        spdlog::debug("[Extractors] gcode_store payload has no entry array");
        return records;
    }

    std::string message;
    double time = 0.0;
    for (const auto& entry : *entries) {
        if (!entry_fields(entry, message, time)) {
            continue;
        }

        std::smatch match;
        if (!std::regex_search(message, match, offset_pattern())) {
            continue;
        }

        OffsetRecord record;
        if (!parse_number(match[1].str(), record.z_offset)) {
            continue;
        }
        record.timestamp = time;
        records.push_back(record);
    }

    spdlog::debug("[Extractors] Found {} Z-offset entries in {} gcode_store entries",
                  records.size(), entries->size());
    return records;
}

std::optional<MeshSnapshot> extract_mesh(const json& objects_result, double now) {
    if (!objects_result.is_object()) {
        return std::nullopt;
    }
    auto status = objects_result.find("status");
    if (status == objects_result.end() || !status->is_object()) {
        return std::nullopt;
    }
    auto bed_mesh_it = status->find("bed_mesh");
    if (bed_mesh_it == status->end() || !bed_mesh_it->is_object()) {
        return std::nullopt;
    }
    const json& bed_mesh = *bed_mesh_it;
    if (!bed_mesh.contains("probed_matrix")) {
        return std::nullopt;
    }

    MeshSnapshot mesh;
    mesh.timestamp = now;

    if (bed_mesh.contains("profile_name") && bed_mesh["profile_name"].is_string()) {
        mesh.profile_name = bed_mesh["profile_name"].get<std::string>();
    }

    // Parse probed_matrix (2D array of Z heights)
    const json& matrix = bed_mesh["probed_matrix"];
    if (matrix.is_array()) {
        for (const auto& row : matrix) {
            if (!row.is_array()) {
                continue;
            }
            std::vector<double> row_vec;
            row_vec.reserve(row.size());
            for (const auto& val : row) {
                if (val.is_number()) {
                    row_vec.push_back(val.get<double>());
                }
            }
            mesh.probed_matrix.push_back(std::move(row_vec));
        }
    }

    parse_bounds(bed_mesh, "mesh_min", mesh.mesh_min);
    parse_bounds(bed_mesh, "mesh_max", mesh.mesh_max);

    spdlog::debug("[Extractors] Found bed mesh '{}' ({} rows)", mesh.profile_name,
                  mesh.probed_matrix.size());
    return mesh;
}

std::optional<MeshSnapshot> extract_mesh(const json& objects_result) {
    return extract_mesh(objects_result, wall_clock_seconds());
}

bool is_mesh_complete_marker(const RpcFrame& notification, const std::string& marker) {
    if (notification.is_reply() || notification.method != "notify_gcode_response") {
        return false;
    }
    if (!notification.params.is_array() || notification.params.empty() ||
        !notification.params[0].is_string()) {
        return false;
    }
    return notification.params[0].get<std::string>().find(marker) != std::string::npos;
}

double wall_clock_seconds() {
    auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_epoch).count();
}

} // namespace meshvault
