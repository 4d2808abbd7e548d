// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file websocket_transport.cpp
 * @brief libhv WebSocket transport with a blocking receive queue
 *
 * @pattern libhv WebSocketClient callbacks feed a bounded InboundFrameQueue
 * @threading onopen/onmessage/onclose run on libhv's event loop thread;
 *            receive() runs on the response router's reader thread
 */

#include "websocket_transport.h"

#include "moonraker_error.h"

#include <spdlog/spdlog.h>

#include <chrono>

#include "hv/WebSocketClient.h"

namespace meshvault {

WebSocketTransport::WebSocketTransport(uint32_t keepalive_interval_ms, EventEmitter* events)
    : keepalive_interval_ms_(keepalive_interval_ms), events_(events) {}

WebSocketTransport::~WebSocketTransport() {
    if (ws_) {
        ws_->setReconnect(nullptr);
        ws_->onopen = []() {};
        ws_->onmessage = [](const std::string&) {};
        ws_->onclose = []() {};
        ws_->close();
    }
    // ws_ destructor stops the libhv event loop thread
}

void WebSocketTransport::open(const std::string& url, uint32_t timeout_ms) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::IDLE) {
            throw TransportError("transport already used; create a new one per connection");
        }
        state_ = State::CONNECTING;
    }

    auto client = std::make_unique<hv::WebSocketClient>();
    client->setConnectTimeout(static_cast<int>(timeout_ms));
    client->setPingInterval(static_cast<int>(keepalive_interval_ms_));
    client->setReconnect(nullptr);

    client->onopen = [this, url]() {
        spdlog::debug("[WebSocket Transport] Connected to {}", url);
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::CONNECTING) {
            state_ = State::OPEN;
        }
        cv_.notify_all();
    };

    client->onmessage = [this](const std::string& msg) {
        if (msg.size() > MAX_MESSAGE_SIZE) {
            spdlog::error("[WebSocket Transport] Message too large: {} bytes (max: {})",
                          msg.size(), MAX_MESSAGE_SIZE);
            if (events_) {
                events_->emit(MoonrakerEventType::MESSAGE_OVERSIZED,
                              "Printer sent a message that was too large to process", true,
                              std::to_string(msg.size()) + " bytes");
            }
            mark_closed("oversized message (" + std::to_string(msg.size()) + " bytes)");
            ws_->close();
            return;
        }

        spdlog::trace("[WebSocket Transport] onmessage received {} bytes", msg.size());
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::OPEN) {
                return;
            }
        }
        if (!inbound_.push(msg)) {
            spdlog::error("[WebSocket Transport] {} unread frames queued, closing connection",
                          inbound_.capacity());
            mark_closed("inbound queue full (" + std::to_string(inbound_.capacity()) +
                        " unread frames)");
            ws_->close();
        }
    };

    client->onclose = [this]() {
        spdlog::debug("[WebSocket Transport] onclose callback invoked");
        mark_closed("WebSocket connection closed");
    };

    {
        std::lock_guard<std::mutex> lock(mutex_);
        ws_ = std::move(client);
    }

    spdlog::debug("[WebSocket Transport] Connecting to {}", url);
    http_headers headers;
    int result = ws_->open(url.c_str(), headers);
    if (result != 0) {
        mark_closed("open() failed with code " + std::to_string(result));
    }

    // libhv enforces the connect timeout itself; the extra margin covers the
    // WebSocket upgrade handshake that follows the TCP connect.
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms) +
                    std::chrono::seconds(2);

    std::unique_lock<std::mutex> lock(mutex_);
    bool settled = cv_.wait_until(lock, deadline, [this]() { return state_ != State::CONNECTING; });
    if (!settled) {
        state_ = State::CLOSED;
        close_reason_ = "connection timed out after " + std::to_string(timeout_ms) + "ms";
    }
    if (state_ != State::OPEN) {
        std::string reason = close_reason_;
        lock.unlock();
        inbound_.close(reason);
        ws_->close();
        throw TransportError("Failed to connect to " + url + ": " + reason);
    }
}

void WebSocketTransport::send(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::IDLE) {
            throw NotConnectedError();
        }
        if (state_ != State::OPEN) {
            throw TransportError(close_reason_.empty() ? "connection not open" : close_reason_);
        }
    }

    int result = ws_->send(text);
    spdlog::trace("[WebSocket Transport] send() returned {}", result);
    if (result < 0) {
        throw TransportError("send failed with code " + std::to_string(result));
    }
}

std::string WebSocketTransport::receive() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == State::IDLE) {
            throw NotConnectedError();
        }
    }
    return inbound_.pop();
}

void WebSocketTransport::close() {
    bool was_open = false;
    hv::WebSocketClient* ws = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        was_open = (state_ == State::OPEN || state_ == State::CONNECTING);
        ws = ws_.get();
    }
    mark_closed("closed by client");
    if (ws && was_open) {
        spdlog::debug("[WebSocket Transport] Closing connection");
        ws->close();
    }
}

bool WebSocketTransport::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == State::OPEN;
}

void WebSocketTransport::mark_closed(const std::string& reason) {
    std::string first_reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != State::CLOSED) {
            state_ = State::CLOSED;
            close_reason_ = reason;
        }
        first_reason = close_reason_;
    }
    cv_.notify_all();
    inbound_.close(first_reason);
}

} // namespace meshvault
