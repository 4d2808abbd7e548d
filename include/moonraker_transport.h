// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace meshvault {

/**
 * @brief Text-frame transport to a Moonraker server
 *
 * Abstract so the RPC layer can run against a scripted transport in tests.
 * Implementations report socket-level failures by throwing TransportError and
 * use before open() by throwing NotConnectedError.
 *
 * Threading: send() may be called from any thread. receive() is called by a
 * single reader thread. close() may be called from any thread and must wake a
 * blocked receive().
 */
class MoonrakerTransport {
  public:
    virtual ~MoonrakerTransport() = default;

    /**
     * @brief Open the connection, blocking until it is usable
     *
     * @param url WebSocket URL (e.g., "ws://127.0.0.1:7125/websocket")
     * @param timeout_ms Give up after this long
     * @throws TransportError if the connection cannot be established
     */
    virtual void open(const std::string& url, uint32_t timeout_ms) = 0;

    /**
     * @brief Send one text frame
     *
     * @throws NotConnectedError if open() never succeeded
     * @throws TransportError if the connection is closed or the send fails
     */
    virtual void send(const std::string& text) = 0;

    /**
     * @brief Block until the next inbound text frame arrives
     *
     * Frames already received are returned before a close is reported.
     *
     * @throws NotConnectedError if open() never succeeded
     * @throws TransportError once the connection is closed
     */
    virtual std::string receive() = 0;

    /**
     * @brief Close the connection (idempotent)
     */
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

/// @brief Creates a fresh transport for each connection epoch
using TransportFactory = std::function<std::unique_ptr<MoonrakerTransport>()>;

} // namespace meshvault
