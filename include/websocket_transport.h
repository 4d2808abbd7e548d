// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "inbound_frame_queue.h"
#include "moonraker_events.h"
#include "moonraker_transport.h"

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>

namespace hv {
class WebSocketClient;
}

namespace meshvault {

/**
 * @brief MoonrakerTransport on top of libhv's WebSocketClient
 *
 * libhv delivers frames on its own event-loop thread through onmessage; this
 * class queues them (bounded) so the RPC layer can pull them with a blocking
 * receive(). A reader that falls too far behind loses the connection.
 * libhv auto-reconnect is disabled: reconnection belongs to the supervisor,
 * which builds a new transport for every connection epoch.
 */
class WebSocketTransport : public MoonrakerTransport {
  public:
    /// Frames above this size close the connection
    static constexpr size_t MAX_MESSAGE_SIZE = 5 * 1024 * 1024;

    /// Unread frames allowed before the connection is closed
    static constexpr size_t MAX_QUEUED_FRAMES = 4096;

    /**
     * @param keepalive_interval_ms WebSocket ping interval
     * @param events Optional sink for MESSAGE_OVERSIZED
     */
    explicit WebSocketTransport(uint32_t keepalive_interval_ms = 10000,
                                EventEmitter* events = nullptr);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void open(const std::string& url, uint32_t timeout_ms) override;
    void send(const std::string& text) override;
    std::string receive() override;
    void close() override;
    bool is_open() const override;

  private:
    void mark_closed(const std::string& reason);

    enum class State { IDLE, CONNECTING, OPEN, CLOSED };

    std::unique_ptr<hv::WebSocketClient> ws_; // Set once in open(), under mutex_
    uint32_t keepalive_interval_ms_;
    EventEmitter* events_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    State state_ = State::IDLE;
    std::string close_reason_;
    InboundFrameQueue inbound_{MAX_QUEUED_FRAMES};
};

} // namespace meshvault
