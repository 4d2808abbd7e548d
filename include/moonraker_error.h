// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace meshvault {

/**
 * @brief Error types for Moonraker operations
 */
enum class MoonrakerErrorType {
    NONE,            // No error
    NOT_CONNECTED,   // Operation attempted without a live transport
    CONNECTION_LOST, // Socket-level failure or stream closed
    TIMEOUT,         // Request timed out
    JSON_RPC_ERROR,  // JSON-RPC error reply from Moonraker
    PARSE_ERROR,     // JSON parsing failed
    NOT_READY,       // Klipper not in ready state
    UNKNOWN          // Unknown error
};

/**
 * @brief Error information for Moonraker operations
 */
struct MoonrakerError {
    MoonrakerErrorType type = MoonrakerErrorType::NONE;
    int code = 0;        // JSON-RPC error code if applicable
    std::string message; // Human-readable error message
    std::string method;  // Method that caused the error
    json details;        // Additional error details from Moonraker

    bool has_error() const {
        return type != MoonrakerErrorType::NONE;
    }

    /**
     * @brief True for failures that mean the connection is unusable
     *
     * The supervisor tears down the connection epoch and reconnects on these.
     * JSON-RPC error replies are not included: the server answered, so the
     * socket is still healthy.
     */
    bool is_connection_failure() const {
        return type == MoonrakerErrorType::NOT_CONNECTED ||
               type == MoonrakerErrorType::CONNECTION_LOST ||
               type == MoonrakerErrorType::TIMEOUT;
    }

    std::string get_type_string() const {
        switch (type) {
        case MoonrakerErrorType::NONE:
            return "NONE";
        case MoonrakerErrorType::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case MoonrakerErrorType::CONNECTION_LOST:
            return "CONNECTION_LOST";
        case MoonrakerErrorType::TIMEOUT:
            return "TIMEOUT";
        case MoonrakerErrorType::JSON_RPC_ERROR:
            return "JSON_RPC_ERROR";
        case MoonrakerErrorType::PARSE_ERROR:
            return "PARSE_ERROR";
        case MoonrakerErrorType::NOT_READY:
            return "NOT_READY";
        case MoonrakerErrorType::UNKNOWN:
            return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    /**
     * @brief Create error from JSON-RPC error response
     */
    static MoonrakerError from_json_rpc(const json& error_obj, const std::string& method_name) {
        MoonrakerError err;
        err.type = MoonrakerErrorType::JSON_RPC_ERROR;
        err.method = method_name;

        if (error_obj.is_object()) {
            if (error_obj.contains("code") && error_obj["code"].is_number_integer()) {
                err.code = error_obj["code"].get<int>();
            }
            if (error_obj.contains("message") && error_obj["message"].is_string()) {
                err.message = error_obj["message"].get<std::string>();
            }
            if (error_obj.contains("data")) {
                err.details = error_obj["data"];
            }
        } else if (error_obj.is_string()) {
            err.message = error_obj.get<std::string>();
        }

        if (err.message.find("not ready") != std::string::npos) {
            err.type = MoonrakerErrorType::NOT_READY;
        }

        return err;
    }

    static MoonrakerError timeout(const std::string& method_name, uint32_t timeout_ms) {
        MoonrakerError err;
        err.type = MoonrakerErrorType::TIMEOUT;
        err.method = method_name;
        err.message = "Request timeout after " + std::to_string(timeout_ms) + "ms";
        return err;
    }

    static MoonrakerError connection_lost(const std::string& method_name = "",
                                          const std::string& reason = "") {
        MoonrakerError err;
        err.type = MoonrakerErrorType::CONNECTION_LOST;
        err.method = method_name;
        err.message = reason.empty() ? "WebSocket connection lost" : reason;
        return err;
    }

    static MoonrakerError not_connected(const std::string& method_name = "") {
        MoonrakerError err;
        err.type = MoonrakerErrorType::NOT_CONNECTED;
        err.method = method_name;
        err.message = "Not connected to Moonraker";
        return err;
    }

    static MoonrakerError parse_error(const std::string& what,
                                      const std::string& method_name = "") {
        MoonrakerError err;
        err.type = MoonrakerErrorType::PARSE_ERROR;
        err.method = method_name;
        err.message = "JSON parse error: " + what;
        return err;
    }
};

/**
 * @brief Base exception for failed Moonraker operations
 *
 * Carries the MoonrakerError describing the failure so callers can branch on
 * error.type without string matching.
 */
class MoonrakerException : public std::runtime_error {
  public:
    explicit MoonrakerException(MoonrakerError error)
        : std::runtime_error(describe(error)), error_(std::move(error)) {}

    const MoonrakerError& error() const noexcept {
        return error_;
    }

  private:
    static std::string describe(const MoonrakerError& error) {
        if (error.method.empty()) {
            return error.message;
        }
        return error.method + ": " + error.message;
    }

    MoonrakerError error_;
};

/// @brief Operation attempted before a transport was opened
class NotConnectedError : public MoonrakerException {
  public:
    explicit NotConnectedError(const std::string& method = "")
        : MoonrakerException(MoonrakerError::not_connected(method)) {}
};

/// @brief Socket-level failure: the connection is gone
class TransportError : public MoonrakerException {
  public:
    explicit TransportError(const std::string& reason, const std::string& method = "")
        : MoonrakerException(MoonrakerError::connection_lost(method, reason)) {}
};

/// @brief No reply arrived within the request timeout
class RequestTimeoutError : public MoonrakerException {
  public:
    RequestTimeoutError(const std::string& method, uint32_t timeout_ms)
        : MoonrakerException(MoonrakerError::timeout(method, timeout_ms)) {}
};

/// @brief Moonraker answered the request with a JSON-RPC error
class RpcError : public MoonrakerException {
  public:
    explicit RpcError(MoonrakerError error) : MoonrakerException(std::move(error)) {}
};

} // namespace meshvault
