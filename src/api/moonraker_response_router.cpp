// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file moonraker_response_router.cpp
 * @brief Demultiplexes one JSON-RPC stream into per-request replies and notifications
 *
 * @pattern Pending-request map keyed by id, two-phase lock (copy under lock, invoke outside)
 * @threading reader_loop() is the only caller of RpcChannel::receive_frame();
 *            request() blocks its caller on a std::future
 */

#include "moonraker_response_router.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <vector>

namespace meshvault {

ResponseRouter::ResponseRouter(RpcChannel& channel, EventEmitter& events)
    : channel_(channel), events_(events) {}

ResponseRouter::~ResponseRouter() {
    stop();
}

void ResponseRouter::start() {
    if (started_.exchange(true)) {
        spdlog::warn("[Response Router] start() called twice, ignoring");
        return;
    }
    if (!channel_.is_connected()) {
        throw NotConnectedError();
    }
    reader_ = std::thread(&ResponseRouter::reader_loop, this);
    spdlog::debug("[Response Router] Reader thread started");
}

void ResponseRouter::stop() {
    // Closing the channel wakes the reader out of receive_frame()
    channel_.close();
    if (reader_.joinable()) {
        reader_.join();
        spdlog::debug("[Response Router] Reader thread joined");
    }
    closed_.store(true);
}

json ResponseRouter::request(const std::string& method, const json& params) {
    return request(method, params, 0);
}

json ResponseRouter::request(const std::string& method, const json& params, uint32_t timeout_ms) {
    const uint32_t timeout = (timeout_ms > 0) ? timeout_ms : default_request_timeout_ms_;

    if (closed_.load()) {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        throw TransportError(close_reason_.empty() ? "router closed" : close_reason_, method);
    }

    auto slot = std::make_shared<std::promise<json>>();
    std::future<json> result = slot->get_future();
    RequestId registered_id = INVALID_REQUEST_ID;

    try {
        // Register the slot before the frame leaves, so even an instant reply
        // finds it in the map
        channel_.call(method, params, [&](RequestId id) {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            if (closed_.load()) {
                throw TransportError(close_reason_, method);
            }
            PendingRequest request;
            request.id = id;
            request.method = method;
            request.slot = slot;
            request.timestamp = std::chrono::steady_clock::now();
            request.timeout_ms = timeout;
            pending_requests_.emplace(id, std::move(request));
            registered_id = id;
            spdlog::trace("[Response Router] Registered request {} for method {}, total "
                          "pending: {}",
                          id, method, pending_requests_.size());
        });
    } catch (const MoonrakerException&) {
        if (registered_id != INVALID_REQUEST_ID) {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            pending_requests_.erase(registered_id);
        }
        throw;
    }

    if (result.wait_for(std::chrono::milliseconds(timeout)) == std::future_status::timeout) {
        bool removed = false;
        uint32_t elapsed = 0;
        {
            std::lock_guard<std::mutex> lock(requests_mutex_);
            auto it = pending_requests_.find(registered_id);
            if (it != pending_requests_.end()) {
                elapsed = it->second.get_elapsed_ms();
                pending_requests_.erase(it);
                removed = true;
            }
        }
        if (removed) {
            spdlog::warn("[Response Router] Request {} ({}) timed out after {}ms", registered_id,
                         method, elapsed);
            events_.emit(MoonrakerEventType::REQUEST_TIMEOUT,
                         fmt::format("Printer command '{}' timed out after {}ms", method, timeout),
                         false, method);
            throw RequestTimeoutError(method, timeout);
        }
        // Reply was routed between the timeout and the erase: fall through
    }

    return result.get();
}

SubscriptionId ResponseRouter::subscribe(NotificationCallback cb) {
    if (!cb) {
        spdlog::warn("[Response Router] subscribe called with null callback");
        return INVALID_SUBSCRIPTION_ID;
    }

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    SubscriptionId id = next_subscription_id_++;
    notify_callbacks_.emplace(id, std::move(cb));
    spdlog::debug("[Response Router] Registered notification callback with ID {}", id);
    return id;
}

bool ResponseRouter::unsubscribe(SubscriptionId id) {
    if (id == INVALID_SUBSCRIPTION_ID) {
        return false;
    }

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    auto it = notify_callbacks_.find(id);
    if (it != notify_callbacks_.end()) {
        notify_callbacks_.erase(it);
        spdlog::debug("[Response Router] Unsubscribed notification callback ID {}", id);
        return true;
    }
    return false;
}

void ResponseRouter::set_on_closed(ClosedCallback cb) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    on_closed_ = std::move(cb);
}

size_t ResponseRouter::pending_count() const {
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

void ResponseRouter::reader_loop() {
    spdlog::debug("[Response Router] Reader thread running");
    MoonrakerError reason;

    try {
        while (true) {
            RpcFrame frame = channel_.receive_frame();
            if (frame.is_reply()) {
                route_reply(frame);
            } else {
                dispatch_notification(frame);
            }
        }
    } catch (const MoonrakerException& e) {
        reason = e.error();
    } catch (const std::exception& e) {
        reason = MoonrakerError::connection_lost("", e.what());
    }

    if (reason.type != MoonrakerErrorType::CONNECTION_LOST) {
        reason = MoonrakerError::connection_lost(reason.method, reason.message);
    }

    if (channel_.is_connected()) {
        spdlog::warn("[Response Router] Connection lost: {}", reason.message);
        events_.emit(MoonrakerEventType::CONNECTION_LOST,
                     "Connection to printer lost: " + reason.message, true);
    } else {
        spdlog::debug("[Response Router] Reader stopping: {}", reason.message);
    }

    fail_all_pending(reason);

    ClosedCallback on_closed;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        on_closed = on_closed_;
    }
    if (on_closed) {
        try {
            on_closed(reason);
        } catch (const std::exception& e) {
            spdlog::error("[Response Router] Closed callback threw exception: {}", e.what());
        }
    }
    spdlog::debug("[Response Router] Reader thread exiting");
}

void ResponseRouter::route_reply(const RpcFrame& frame) {
    spdlog::trace("[Response Router] Got response for id={}", frame.id);

    std::shared_ptr<std::promise<json>> slot;
    std::string method_name;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        auto it = pending_requests_.find(frame.id);
        if (it == pending_requests_.end()) {
            spdlog::debug("[Response Router] Reply for unknown request {} dropped (timed out?)",
                          frame.id);
            return;
        }
        slot = it->second.slot;
        method_name = it->second.method;
        pending_requests_.erase(it);
    } // Lock released here

    if (frame.has_error()) {
        MoonrakerError error = MoonrakerError::from_json_rpc(frame.error, method_name);
        spdlog::error("[Response Router] Request {} failed: {}", method_name, error.message);
        events_.emit(MoonrakerEventType::RPC_ERROR,
                     fmt::format("Printer command '{}' failed: {}", method_name, error.message),
                     true, method_name);
        slot->set_exception(std::make_exception_ptr(RpcError(error)));
    } else {
        slot->set_value(frame.result);
    }
}

void ResponseRouter::dispatch_notification(const RpcFrame& frame) {
    std::vector<NotificationCallback> callbacks_to_invoke;
    {
        std::lock_guard<std::mutex> lock(callbacks_mutex_);
        callbacks_to_invoke.reserve(notify_callbacks_.size());
        for (const auto& [id, cb] : notify_callbacks_) {
            callbacks_to_invoke.push_back(cb);
        }
    }

    spdlog::trace("[Response Router] Notification {} -> {} subscribers", frame.method,
                  callbacks_to_invoke.size());

    for (auto& cb : callbacks_to_invoke) {
        try {
            cb(frame);
        } catch (const std::exception& e) {
            spdlog::error("[Response Router] Callback for {} threw exception: {}", frame.method,
                          e.what());
        }
    }
}

void ResponseRouter::fail_all_pending(const MoonrakerError& error) {
    std::map<uint64_t, PendingRequest> doomed;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        closed_.store(true);
        close_reason_ = error.message;
        doomed.swap(pending_requests_);
    }

    if (!doomed.empty()) {
        spdlog::debug("[Response Router] Failing {} pending requests: {}", doomed.size(),
                      error.message);
    }
    for (auto& [id, request] : doomed) {
        request.slot->set_exception(
            std::make_exception_ptr(TransportError(error.message, request.method)));
    }
}

} // namespace meshvault
