// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "moonraker_events.h"

#include <spdlog/spdlog.h>

namespace meshvault {

const char* event_type_name(MoonrakerEventType type) {
    switch (type) {
    case MoonrakerEventType::CONNECTING:
        return "CONNECTING";
    case MoonrakerEventType::CONNECTED:
        return "CONNECTED";
    case MoonrakerEventType::CONNECTION_FAILED:
        return "CONNECTION_FAILED";
    case MoonrakerEventType::CONNECTION_LOST:
        return "CONNECTION_LOST";
    case MoonrakerEventType::RECONNECT_SCHEDULED:
        return "RECONNECT_SCHEDULED";
    case MoonrakerEventType::RPC_ERROR:
        return "RPC_ERROR";
    case MoonrakerEventType::REQUEST_TIMEOUT:
        return "REQUEST_TIMEOUT";
    case MoonrakerEventType::MESSAGE_OVERSIZED:
        return "MESSAGE_OVERSIZED";
    case MoonrakerEventType::TRIGGER_DETECTED:
        return "TRIGGER_DETECTED";
    case MoonrakerEventType::REFRESH_STARTED:
        return "REFRESH_STARTED";
    case MoonrakerEventType::REFRESH_COMPLETE:
        return "REFRESH_COMPLETE";
    case MoonrakerEventType::REFRESH_FAILED:
        return "REFRESH_FAILED";
    case MoonrakerEventType::RECORDS_ADDED:
        return "RECORDS_ADDED";
    case MoonrakerEventType::NO_NEW_DATA:
        return "NO_NEW_DATA";
    case MoonrakerEventType::STORE_RECOVERED:
        return "STORE_RECOVERED";
    case MoonrakerEventType::SHUTDOWN:
        return "SHUTDOWN";
    }
    return "UNKNOWN";
}

void EventEmitter::register_event_handler(MoonrakerEventCallback cb) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    handler_ = std::move(cb);
    spdlog::debug("[Events] Event handler {}", handler_ ? "registered" : "unregistered");
}

void EventEmitter::emit(MoonrakerEventType type, const std::string& message, bool is_error,
                        const std::string& details) {
    MoonrakerEventCallback handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = handler_;
    }

    if (handler) {
        MoonrakerEvent evt{type, message, details, is_error};
        try {
            handler(evt);
        } catch (const std::exception& e) {
            spdlog::error("[Events] Event handler threw exception: {}", e.what());
        }
    } else if (is_error) {
        spdlog::debug("[Events] {} (error): {}", event_type_name(type), message);
    } else {
        spdlog::trace("[Events] {}: {}", event_type_name(type), message);
    }
}

} // namespace meshvault
