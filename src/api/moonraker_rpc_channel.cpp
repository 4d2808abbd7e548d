// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "moonraker_rpc_channel.h"

#include <spdlog/spdlog.h>

namespace meshvault {

RpcChannel::RpcChannel(MoonrakerTransport& transport) : transport_(transport) {}

void RpcChannel::connect(const std::string& url, uint32_t timeout_ms) {
    spdlog::debug("[RPC Channel] Connecting to {} (timeout {}ms)", url, timeout_ms);
    transport_.open(url, timeout_ms);

    // New connection, new id sequence
    request_id_.store(0);
    connected_.store(true);
}

RequestId RpcChannel::call(const std::string& method, const json& params,
                           const std::function<void(RequestId)>& on_assigned) {
    if (!connected_.load()) {
        throw NotConnectedError(method);
    }

    // Id assignment and send happen under one lock so ids hit the wire in order
    std::lock_guard<std::mutex> lock(send_mutex_);
    RequestId id = request_id_.fetch_add(1) + 1;

    json rpc;
    rpc["jsonrpc"] = "2.0";
    rpc["method"] = method;
    rpc["params"] = params.is_null() ? json::object() : params;
    rpc["id"] = id;

    if (on_assigned) {
        on_assigned(id);
    }

    spdlog::trace("[RPC Channel] send: {}", rpc.dump());
    try {
        transport_.send(rpc.dump());
    } catch (const MoonrakerException& e) {
        spdlog::error("[RPC Channel] Failed to send request {} ({}): {}", id, method, e.what());
        throw;
    }
    return id;
}

RpcFrame RpcChannel::receive_frame() {
    if (!connected_.load()) {
        throw NotConnectedError();
    }

    while (true) {
        std::string text = transport_.receive();

        if (text.size() > 50000) {
            spdlog::debug("[RPC Channel] Received large message: {} bytes", text.size());
        }

        RpcFrame frame;
        if (parse_frame(text, frame)) {
            return frame;
        }
    }
}

void RpcChannel::close() {
    if (connected_.exchange(false)) {
        spdlog::debug("[RPC Channel] Closing (last request id {})", request_id_.load());
    }
    transport_.close();
}

bool RpcChannel::parse_frame(const std::string& text, RpcFrame& out) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        spdlog::warn("[RPC Channel] JSON parse error, frame skipped: {}", e.what());
        return false;
    }

    if (!j.is_object()) {
        spdlog::warn("[RPC Channel] Frame is not a JSON object ({}), skipped", j.type_name());
        return false;
    }

    // Replies carry an id
    if (j.contains("id") && !j["id"].is_null()) {
        if (!j["id"].is_number_integer()) {
            spdlog::warn("[RPC Channel] Invalid 'id' type in response: {}", j["id"].type_name());
            return false;
        }
        out.kind = RpcFrame::Kind::REPLY;
        out.id = j["id"].get<RequestId>();
        if (j.contains("error") && !j["error"].is_null()) {
            out.error = j["error"];
        } else {
            out.result = j.contains("result") ? j["result"] : json();
        }
        return true;
    }

    // Notifications carry a method and no id
    if (j.contains("method")) {
        if (!j["method"].is_string()) {
            spdlog::warn("[RPC Channel] Invalid 'method' type in notification: {}",
                         j["method"].type_name());
            return false;
        }
        out.kind = RpcFrame::Kind::NOTIFICATION;
        out.method = j["method"].get<std::string>();
        out.params = j.contains("params") ? j["params"] : json::array();
        return true;
    }

    spdlog::warn("[RPC Channel] Frame has neither id nor method, skipped");
    return false;
}

} // namespace meshvault
