// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moonraker_error.h"
#include "moonraker_events.h"
#include "moonraker_request.h"
#include "moonraker_rpc_channel.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace meshvault {

/// @brief Identifier for notification subscriptions (valid IDs > 0)
using SubscriptionId = uint64_t;

/** @brief Invalid subscription ID constant */
constexpr SubscriptionId INVALID_SUBSCRIPTION_ID = 0;

/**
 * @brief Single reader that fans inbound frames out to their consumers
 *
 * Replies and notifications share one WebSocket stream. The router owns the
 * only thread that reads from the RpcChannel:
 *   - a reply is delivered to the caller blocked in request() for that id
 *   - a notification is delivered to every subscriber
 * Nothing read off the wire is dropped because some other consumer was waiting
 * for a different kind of frame.
 *
 * When the reader fails (connection lost or closed by stop()), every pending
 * request fails with TransportError, the closed callback fires, and later
 * request() calls fail immediately.
 *
 * Threading: request() may be called concurrently from any thread except the
 * reader thread itself (i.e. not from inside a notification callback).
 */
class ResponseRouter : public MoonrakerRequester {
  public:
    using NotificationCallback = std::function<void(const RpcFrame&)>;
    using ClosedCallback = std::function<void(const MoonrakerError&)>;

    ResponseRouter(RpcChannel& channel, EventEmitter& events);
    ~ResponseRouter() override;

    ResponseRouter(const ResponseRouter&) = delete;
    ResponseRouter& operator=(const ResponseRouter&) = delete;

    /**
     * @brief Start the reader thread
     *
     * The channel must already be connected.
     */
    void start();

    /**
     * @brief Close the channel and join the reader thread (idempotent)
     */
    void stop();

    /**
     * @brief Send a request and block until its reply is routed
     *
     * Uses the default request timeout.
     */
    json request(const std::string& method, const json& params) override;

    /**
     * @brief Send a request and block until its reply is routed
     *
     * @param timeout_ms Timeout override (0 = use default)
     * @return The reply's "result" member
     * @throws RpcError if Moonraker answered with an error
     * @throws RequestTimeoutError if no reply arrived in time
     * @throws TransportError if the connection failed or the router is closed
     * @throws NotConnectedError if the channel was never connected
     */
    json request(const std::string& method, const json& params, uint32_t timeout_ms);

    /**
     * @brief Register callback for notifications
     *
     * Callbacks run on the reader thread and must not block on request().
     *
     * @return Subscription ID for later unsubscription (0 = invalid)
     */
    SubscriptionId subscribe(NotificationCallback cb);

    /**
     * @brief Remove a notification callback
     *
     * @return true if subscription was found and removed
     */
    bool unsubscribe(SubscriptionId id);

    /**
     * @brief Set callback invoked once when the reader stops
     */
    void set_on_closed(ClosedCallback cb);

    void set_default_timeout(uint32_t timeout_ms) {
        default_request_timeout_ms_ = timeout_ms;
    }

    uint32_t get_default_timeout() const {
        return default_request_timeout_ms_;
    }

    bool is_closed() const {
        return closed_.load();
    }

    /// @brief Number of requests still awaiting a reply
    size_t pending_count() const;

  private:
    void reader_loop();
    void route_reply(const RpcFrame& frame);
    void dispatch_notification(const RpcFrame& frame);
    void fail_all_pending(const MoonrakerError& error);

    RpcChannel& channel_;
    EventEmitter& events_;
    std::thread reader_;
    std::atomic_bool started_{false};
    std::atomic_bool closed_{false};
    uint32_t default_request_timeout_ms_{30000};

    // Pending requests keyed by request ID
    std::map<uint64_t, PendingRequest> pending_requests_;
    std::string close_reason_;
    mutable std::mutex requests_mutex_; // Protect pending_requests_, close_reason_

    std::map<SubscriptionId, NotificationCallback> notify_callbacks_;
    SubscriptionId next_subscription_id_{1};
    ClosedCallback on_closed_;
    std::mutex callbacks_mutex_; // Protect notify_callbacks_ and on_closed_
};

} // namespace meshvault
