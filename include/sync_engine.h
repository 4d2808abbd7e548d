// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file sync_engine.h
 * @brief Fetch -> extract -> merge -> save for each measurement kind
 */

#pragma once

#include "moonraker_events.h"
#include "moonraker_request.h"
#include "record_store.h"

#include <cstddef>
#include <functional>
#include <string>
#include <utility>

namespace meshvault {

/**
 * @brief The three stores one daemon keeps in sync
 */
struct MeasurementStores {
    MeasurementStores(const std::string& probes_path, const std::string& meshes_path,
                      const std::string& offsets_path, EventEmitter* events = nullptr)
        : probes("probe", probes_path, events), meshes("mesh", meshes_path, events),
          offsets("z-offset", offsets_path, events) {}

    ProbeStore probes;
    MeshStore meshes;
    OffsetStore offsets;
};

enum class SyncOutcome {
    UPDATED,    ///< Records were appended and the store saved
    NO_NEW_DATA ///< Nothing new upstream; the store file was not touched
};

const char* sync_outcome_name(SyncOutcome outcome);

struct SyncResult {
    SyncOutcome outcome = SyncOutcome::NO_NEW_DATA;
    size_t added = 0;

    static SyncResult updated(size_t count) {
        return SyncResult{SyncOutcome::UPDATED, count};
    }
    static SyncResult no_new_data() {
        return SyncResult{};
    }
};

/**
 * @brief Outcome of one full refresh (probes, then mesh, then offsets)
 */
struct RefreshReport {
    SyncResult probes;
    SyncResult mesh;
    SyncResult offsets;

    size_t total_added() const {
        return probes.added + mesh.added + offsets.added;
    }
    bool any_updated() const {
        return probes.outcome == SyncOutcome::UPDATED || mesh.outcome == SyncOutcome::UPDATED ||
               offsets.outcome == SyncOutcome::UPDATED;
    }
};

/**
 * @brief Orchestrates the sync of all measurement kinds over one requester
 *
 * Stateless apart from its collaborators; safe to call from the listener and
 * timer threads at once (each store serializes its own update()).
 *
 * Every sync operation propagates request failures (RpcError,
 * RequestTimeoutError, TransportError, NotConnectedError) and StoreWriteError
 * unchanged. Stores saved earlier in the same refresh stay saved.
 */
class SyncEngine {
  public:
    using Clock = std::function<double()>;

    SyncEngine(MoonrakerRequester& requester, MeasurementStores& stores, EventEmitter& events);

    /// @brief server.gcode_store -> probe points -> merge by timestamp
    SyncResult sync_probes();

    /// @brief server.gcode_store -> Z-offsets -> merge by timestamp
    SyncResult sync_offsets();

    /// @brief printer.objects.query bed_mesh -> append if it differs from the last snapshot
    SyncResult sync_mesh();

    /**
     * @brief Run probes, mesh, offsets in sequence
     *
     * @param reason Label for logs and events ("initial", "trigger", "scheduled")
     * @throws whatever the failing operation threw, after emitting REFRESH_FAILED
     */
    RefreshReport refresh(const std::string& reason = "manual");

    /// @brief Override the capture clock for mesh snapshots (tests)
    void set_clock(Clock clock) {
        clock_ = std::move(clock);
    }

  private:
    void report(const std::string& kind, const SyncResult& result);

    MoonrakerRequester& requester_;
    MeasurementStores& stores_;
    EventEmitter& events_;
    Clock clock_;
};

} // namespace meshvault
