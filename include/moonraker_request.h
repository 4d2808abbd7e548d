// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace meshvault {

/**
 * @brief Structure to track pending JSON-RPC requests
 *
 * The result slot is a one-shot promise fulfilled by the response router's
 * reader thread with the reply's "result", or failed with an exception.
 */
struct PendingRequest {
    uint64_t id;        ///< JSON-RPC request ID
    std::string method; ///< Method name for logging
    std::shared_ptr<std::promise<json>> slot;         ///< One-shot result slot
    std::chrono::steady_clock::time_point timestamp; ///< When request was sent
    uint32_t timeout_ms;                              ///< Timeout in milliseconds

    bool is_timed_out() const {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - timestamp);
        return elapsed.count() > timeout_ms;
    }

    uint32_t get_elapsed_ms() const {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - timestamp);
        return static_cast<uint32_t>(elapsed.count());
    }
};

/**
 * @brief Anything that can perform a blocking JSON-RPC round trip
 *
 * Implemented by ResponseRouter; the sync engine depends only on this so it
 * can be driven by a scripted requester in tests.
 */
class MoonrakerRequester {
  public:
    virtual ~MoonrakerRequester() = default;

    /**
     * @brief Send a request and wait for its reply
     *
     * @return The reply's "result" member
     * @throws RpcError, RequestTimeoutError, TransportError, NotConnectedError
     */
    virtual json request(const std::string& method, const json& params) = 0;
};

} // namespace meshvault
