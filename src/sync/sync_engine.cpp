// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sync_engine.h"

#include "measurement_extractors.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <optional>
#include <vector>

namespace meshvault {

namespace {

constexpr const char* GCODE_STORE_METHOD = "server.gcode_store";
constexpr const char* OBJECTS_QUERY_METHOD = "printer.objects.query";

template <typename Record>
SyncResult merge_into(RecordStore<Record>& store, const std::vector<Record>& fetched) {
    size_t added = 0;
    store.update([&](std::vector<Record>& records) {
        std::vector<Record> fresh = merge_by_timestamp(records, fetched);
        if (fresh.empty()) {
            return false;
        }
        records.insert(records.end(), fresh.begin(), fresh.end());
        added = fresh.size();
        return true;
    });
    return added > 0 ? SyncResult::updated(added) : SyncResult::no_new_data();
}

} // namespace

const char* sync_outcome_name(SyncOutcome outcome) {
    switch (outcome) {
    case SyncOutcome::UPDATED:
        return "UPDATED";
    case SyncOutcome::NO_NEW_DATA:
        return "NO_NEW_DATA";
    }
    return "UNKNOWN";
}

SyncEngine::SyncEngine(MoonrakerRequester& requester, MeasurementStores& stores,
                       EventEmitter& events)
    : requester_(requester), stores_(stores), events_(events), clock_(&wall_clock_seconds) {}

SyncResult SyncEngine::sync_probes() {
    spdlog::info("[Sync Engine] Requesting G-code store for probe data");
    json result = requester_.request(GCODE_STORE_METHOD, json::object());

    std::vector<ProbeRecord> fetched = extract_probes(result);
    spdlog::info("[Sync Engine] Found {} probe points in gcode_store", fetched.size());

    SyncResult outcome =
        fetched.empty() ? SyncResult::no_new_data() : merge_into(stores_.probes, fetched);
    report("probe", outcome);
    return outcome;
}

SyncResult SyncEngine::sync_offsets() {
    spdlog::info("[Sync Engine] Requesting G-code store for Z-offset data");
    json result = requester_.request(GCODE_STORE_METHOD, json::object());

    std::vector<OffsetRecord> fetched = extract_offsets(result);
    spdlog::info("[Sync Engine] Found {} Z-offset entries in gcode_store", fetched.size());

    SyncResult outcome =
        fetched.empty() ? SyncResult::no_new_data() : merge_into(stores_.offsets, fetched);
    report("z-offset", outcome);
    return outcome;
}

SyncResult SyncEngine::sync_mesh() {
    spdlog::info("[Sync Engine] Requesting bed mesh data");
    json params = {{"objects", {{"bed_mesh", nullptr}}}};
    json result = requester_.request(OBJECTS_QUERY_METHOD, params);

    std::optional<MeshSnapshot> mesh = extract_mesh(result, clock_());
    if (!mesh) {
        spdlog::info("[Sync Engine] Printer reported no bed mesh");
        SyncResult outcome = SyncResult::no_new_data();
        report("mesh", outcome);
        return outcome;
    }
    spdlog::info("[Sync Engine] Found bed mesh '{}'", mesh->profile_name);

    bool added = stores_.meshes.update([&](std::vector<MeshSnapshot>& meshes) {
        if (!is_new_mesh(meshes, *mesh)) {
            return false;
        }
        meshes.push_back(*mesh);
        return true;
    });

    SyncResult outcome = added ? SyncResult::updated(1) : SyncResult::no_new_data();
    report("mesh", outcome);
    return outcome;
}

RefreshReport SyncEngine::refresh(const std::string& reason) {
    spdlog::info("[Sync Engine] --- Starting {} data refresh ---", reason);
    events_.emit(MoonrakerEventType::REFRESH_STARTED, "Data refresh started", false, reason);

    RefreshReport result;
    try {
        result.probes = sync_probes();
        result.mesh = sync_mesh();
        result.offsets = sync_offsets();
    } catch (const std::exception& e) {
        spdlog::error("[Sync Engine] {} data refresh failed: {}", reason, e.what());
        events_.emit(MoonrakerEventType::REFRESH_FAILED,
                     fmt::format("Data refresh ({}) failed: {}", reason, e.what()), true, reason);
        throw;
    }

    spdlog::info("[Sync Engine] --- {} data refresh complete ({} new records) ---", reason,
                 result.total_added());
    events_.emit(MoonrakerEventType::REFRESH_COMPLETE,
                 fmt::format("Data refresh complete, {} new records", result.total_added()), false,
                 reason);
    return result;
}

void SyncEngine::report(const std::string& kind, const SyncResult& result) {
    if (result.outcome == SyncOutcome::UPDATED) {
        spdlog::info("[Sync Engine] Added {} new {} records", result.added, kind);
        events_.emit(MoonrakerEventType::RECORDS_ADDED,
                     fmt::format("Added {} new {} records", result.added, kind), false, kind);
    } else {
        spdlog::info("[Sync Engine] {} data is already up-to-date", kind);
        events_.emit(MoonrakerEventType::NO_NEW_DATA, kind + " data is already up-to-date", false,
                     kind);
    }
}

} // namespace meshvault
