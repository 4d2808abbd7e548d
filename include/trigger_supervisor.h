// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file trigger_supervisor.h
 * @brief Connection state machine driving the event and periodic sync triggers
 *
 * One connection epoch = one transport, one RpcChannel, one ResponseRouter.
 * Within an epoch the supervisor runs an initial refresh, then two threads:
 *   - listener: waits for the mesh-complete console line, settles, refreshes
 *   - timer: sleeps the sync interval, refreshes, repeats
 * A connection-level failure anywhere ends the epoch; after the retry delay a
 * new epoch starts. request_shutdown() is the only way out of run().
 */

#pragma once

#include "measurement_extractors.h"
#include "moonraker_events.h"
#include "moonraker_rpc_channel.h"
#include "moonraker_transport.h"
#include "sync_engine.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace meshvault {

enum class SupervisorState {
    DISCONNECTED, ///< Between epochs (waiting out the retry delay)
    CONNECTING,   ///< Opening the transport
    SYNCING,      ///< Initial refresh of a new epoch
    RUNNING,      ///< Listener and timer active
    STOPPED       ///< Terminal
};

const char* supervisor_state_name(SupervisorState state);

struct SupervisorSettings {
    std::string url; ///< ws://<host>:<port>/websocket
    uint32_t connect_timeout_ms = 10000;
    uint32_t request_timeout_ms = 30000;
    std::chrono::milliseconds sync_interval{std::chrono::hours(6)};
    std::chrono::milliseconds retry_delay{std::chrono::seconds(30)};
    std::chrono::milliseconds settle_delay{std::chrono::seconds(30)};
    std::string trigger_marker = DEFAULT_MESH_COMPLETE_MARKER;
};

/**
 * @brief Unbounded hand-off of notifications from the reader thread
 *
 * push() never blocks, so the router's reader is never held up by refresh
 * work on the listener thread.
 */
class NotificationQueue {
  public:
    void push(RpcFrame frame);

    /**
     * @brief Block until a frame is available or the queue is closed
     *
     * @return false once the queue is closed (pending frames are discarded)
     */
    bool pop(RpcFrame& out);

    void close();
    bool is_closed() const;
    size_t size() const;

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<RpcFrame> frames_;
    bool closed_ = false;
};

class TriggerSupervisor {
  public:
    TriggerSupervisor(SupervisorSettings settings, TransportFactory factory,
                      MeasurementStores& stores, EventEmitter& events);
    ~TriggerSupervisor();

    TriggerSupervisor(const TriggerSupervisor&) = delete;
    TriggerSupervisor& operator=(const TriggerSupervisor&) = delete;

    /**
     * @brief Connect, sync, watch and reconnect until request_shutdown()
     *
     * Blocks the calling thread.
     */
    void run();

    /**
     * @brief Connect, run one full refresh, disconnect
     *
     * @return true if the refresh completed
     */
    bool run_once();

    /**
     * @brief Wake every wait, close the live connection, make run() return
     *
     * Safe to call from any thread, any number of times.
     */
    void request_shutdown();

    SupervisorState state() const {
        return state_.load();
    }

    /// @brief Number of connection attempts made so far
    uint64_t connection_attempts() const {
        return connection_attempts_.load();
    }

    bool is_shutdown_requested() const {
        return shutdown_.load();
    }

  private:
    struct Epoch;

    void run_epoch();
    bool open_epoch(Epoch& epoch);
    void close_epoch(Epoch& epoch);
    void end_epoch(Epoch& epoch, const std::string& reason);

    void listener_loop(Epoch& epoch);
    void timer_loop(Epoch& epoch);

    /**
     * @brief Refresh with the failure policy applied
     *
     * @return false if the epoch must end (connection-level failure)
     */
    bool guarded_refresh(Epoch& epoch, const std::string& reason);

    /// @return true if the full delay elapsed, false if the epoch ended or shutdown
    bool wait_in_epoch(Epoch& epoch, std::chrono::milliseconds delay);

    /// @return true if the full delay elapsed, false on shutdown
    bool wait_unless_shutdown(std::chrono::milliseconds delay);

    void set_state(SupervisorState state);

    SupervisorSettings settings_;
    TransportFactory factory_;
    MeasurementStores& stores_;
    EventEmitter& events_;

    std::atomic<SupervisorState> state_{SupervisorState::DISCONNECTED};
    std::atomic_bool shutdown_{false};
    std::atomic_uint64_t connection_attempts_{0};

    // Guards shutdown waits, Epoch::ended and current_epoch_
    std::mutex wait_mutex_;
    std::condition_variable wake_cv_;
    Epoch* current_epoch_ = nullptr;
};

} // namespace meshvault
