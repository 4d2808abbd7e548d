// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <functional>
#include <mutex>
#include <string>

namespace meshvault {

/**
 * @brief Event types emitted by the sync core
 *
 * These mirror what the components log, so outcomes can be observed in tests
 * (and by an embedding application) without scraping log text.
 */
enum class MoonrakerEventType {
    CONNECTING,          ///< Connection attempt started
    CONNECTED,           ///< WebSocket open, router running
    CONNECTION_FAILED,   ///< Connection attempt failed
    CONNECTION_LOST,     ///< Established connection went away
    RECONNECT_SCHEDULED, ///< Waiting retry delay before reconnecting
    RPC_ERROR,           ///< JSON-RPC request failed
    REQUEST_TIMEOUT,     ///< JSON-RPC request timed out
    MESSAGE_OVERSIZED,   ///< Received message exceeds size limit
    TRIGGER_DETECTED,    ///< Mesh-complete marker seen on the console stream
    REFRESH_STARTED,     ///< Full refresh started (details = reason)
    REFRESH_COMPLETE,    ///< Full refresh finished
    REFRESH_FAILED,      ///< Full refresh aborted by an error
    RECORDS_ADDED,       ///< New records saved (details = record kind)
    NO_NEW_DATA,         ///< Sync found nothing new (details = record kind)
    STORE_RECOVERED,     ///< Unreadable store file moved aside and reset
    SHUTDOWN             ///< Shutdown requested
};

/// @brief Human-readable name for an event type
const char* event_type_name(MoonrakerEventType type);

/**
 * @brief Event structure passed to event handlers
 */
struct MoonrakerEvent {
    MoonrakerEventType type;
    std::string message; ///< Human-readable message
    std::string details; ///< Additional details (optional)
    bool is_error;       ///< true for errors, false for warnings/info
};

/**
 * @brief Callback type for event handlers
 */
using MoonrakerEventCallback = std::function<void(const MoonrakerEvent&)>;

/**
 * @brief Thread-safe single-handler event dispatcher
 *
 * Only one handler can be registered at a time. Registering a new handler
 * replaces the previous one. With no handler registered, events are logged
 * and dropped.
 */
class EventEmitter {
  public:
    EventEmitter() = default;

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    /**
     * @brief Register callback for events
     *
     * @param cb Callback function, or nullptr to unregister
     */
    void register_event_handler(MoonrakerEventCallback cb);

    /**
     * @brief Emit event to registered handler
     *
     * Thread-safe. The handler is invoked outside the internal lock, so it may
     * itself emit events.
     */
    void emit(MoonrakerEventType type, const std::string& message, bool is_error = false,
              const std::string& details = "");

  private:
    MoonrakerEventCallback handler_;
    mutable std::mutex handler_mutex_;
};

} // namespace meshvault
