// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "moonraker_error.h"
#include "moonraker_transport.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace meshvault {

/// @brief Unique identifier for JSON-RPC requests (valid IDs > 0)
using RequestId = uint64_t;

/// @brief Invalid request ID constant
constexpr RequestId INVALID_REQUEST_ID = 0;

/**
 * @brief One parsed inbound JSON-RPC frame
 *
 * Either a reply to request `id` (with result or error) or an unsolicited
 * notification (method + params, no id).
 */
struct RpcFrame {
    enum class Kind { REPLY, NOTIFICATION };

    Kind kind = Kind::NOTIFICATION;

    // REPLY
    RequestId id = INVALID_REQUEST_ID;
    json result;
    json error; ///< null unless the server answered with an error

    // NOTIFICATION
    std::string method;
    json params;

    bool is_reply() const {
        return kind == Kind::REPLY;
    }
    bool has_error() const {
        return kind == Kind::REPLY && !error.is_null();
    }
};

/**
 * @brief JSON-RPC 2.0 envelope layer over a MoonrakerTransport
 *
 * Assigns request IDs (starting at 1, reset by every connect()), serializes
 * requests and parses inbound frames. It never waits for replies and never
 * retries; correlation belongs to ResponseRouter.
 *
 * Threading: call() may be used from several threads (sends are serialized).
 * receive_frame() must only be called from a single reader thread.
 */
class RpcChannel {
  public:
    explicit RpcChannel(MoonrakerTransport& transport);

    RpcChannel(const RpcChannel&) = delete;
    RpcChannel& operator=(const RpcChannel&) = delete;

    /**
     * @brief Open the transport and start a new request-id sequence
     *
     * @throws TransportError if the transport cannot connect
     */
    void connect(const std::string& url, uint32_t timeout_ms);

    /**
     * @brief Send a JSON-RPC request without waiting for its reply
     *
     * @param method RPC method name (e.g., "server.gcode_store")
     * @param params JSON parameters (null is sent as an empty object)
     * @param on_assigned Invoked with the new id before the frame is sent, so a
     *                    caller can register for the reply without racing it
     * @return The request id
     * @throws NotConnectedError if connect() has not succeeded
     * @throws TransportError if the send fails
     */
    RequestId call(const std::string& method, const json& params = json::object(),
                   const std::function<void(RequestId)>& on_assigned = nullptr);

    /**
     * @brief Block until the next well-formed frame arrives
     *
     * Frames that are not JSON objects or carry neither an integer id nor a
     * string method are logged and skipped.
     *
     * @throws NotConnectedError if connect() has not succeeded
     * @throws TransportError when the connection fails or closes
     */
    RpcFrame receive_frame();

    /**
     * @brief Close the transport (idempotent); wakes a blocked receive_frame()
     */
    void close();

    bool is_connected() const {
        return connected_.load();
    }

    /// @brief Id of the most recently issued request (0 if none this connection)
    RequestId last_request_id() const {
        return request_id_.load();
    }

    /**
     * @brief Parse raw frame text
     *
     * @return false if the text is not a usable JSON-RPC frame
     */
    static bool parse_frame(const std::string& text, RpcFrame& out);

  private:
    MoonrakerTransport& transport_;
    std::atomic_bool connected_{false};
    std::atomic_uint64_t request_id_{0};
    std::mutex send_mutex_;
};

} // namespace meshvault
