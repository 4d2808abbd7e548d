// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_TRANSPORT_H
#define MOCK_TRANSPORT_H

/**
 * @file mock_transport.h
 * @brief In-memory MoonrakerTransport and a scripted Moonraker server
 *
 * MockTransport:
 * - Records every frame sent
 * - Hands each sent request to a responder hook that may inject replies,
 *   notifications or a connection failure
 * - Lets tests inject arbitrary inbound frames and fail the link on demand
 *
 * MockMoonrakerServer builds a fresh MockTransport per connection (as the
 * supervisor's factory does) and answers requests from per-method scripts.
 *
 * @example
 * MockMoonrakerServer server;
 * server.set_result("server.gcode_store", {{"gcode_store", json::array()}});
 * TriggerSupervisor supervisor(settings, server.factory(), stores, events);
 */

#include "moonraker_error.h"
#include "moonraker_transport.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "hv/json.hpp"

using json = nlohmann::json;
using namespace meshvault;

class MockTransport : public MoonrakerTransport {
  public:
    /// Invoked after each send() with the parsed request (outside the mock's lock)
    using Responder = std::function<void(MockTransport&, const json& request)>;

    MockTransport() = default;
    ~MockTransport() override {
        std::function<void(MockTransport*)> on_destroy;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            on_destroy = on_destroy_;
        }
        if (on_destroy) {
            on_destroy(this);
        }
    }

    MockTransport(const MockTransport&) = delete;
    MockTransport& operator=(const MockTransport&) = delete;

    void open(const std::string& url, uint32_t timeout_ms) override {
        (void)timeout_ms;
        std::lock_guard<std::mutex> lock(mutex_);
        if (refuse_open_) {
            throw TransportError("Failed to connect to " + url + ": connection refused");
        }
        if (closed_) {
            throw TransportError("Failed to connect to " + url + ": " + close_reason_);
        }
        opened_ = true;
        url_ = url;
    }

    void send(const std::string& text) override {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!opened_) {
                throw NotConnectedError();
            }
            if (closed_) {
                throw TransportError(close_reason_);
            }
            if (fail_sends_) {
                throw TransportError("send failed");
            }
            sent_.push_back(text);
            responder = responder_;
        }
        cv_.notify_all();

        if (responder) {
            responder(*this, json::parse(text));
        }
    }

    std::string receive() override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!opened_) {
            throw NotConnectedError();
        }
        cv_.wait(lock, [this] { return !inbound_.empty() || closed_; });
        if (!inbound_.empty()) {
            std::string text = std::move(inbound_.front());
            inbound_.pop_front();
            return text;
        }
        throw TransportError(close_reason_);
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                closed_ = true;
                close_reason_ = "closed by client";
            }
        }
        cv_.notify_all();
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_ && !closed_;
    }

    // =========================================================================
    // Test Control Methods
    // =========================================================================

    void set_responder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void set_refuse_open(bool refuse) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_open_ = refuse;
    }

    void set_fail_sends(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_sends_ = fail;
    }

    void set_on_destroy(std::function<void(MockTransport*)> cb) {
        std::lock_guard<std::mutex> lock(mutex_);
        on_destroy_ = std::move(cb);
    }

    /// @brief Queue a raw inbound text frame
    void inject(const std::string& text) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            inbound_.push_back(text);
        }
        cv_.notify_all();
    }

    void inject_json(const json& frame) {
        inject(frame.dump());
    }

    void inject_reply(uint64_t id, const json& result) {
        inject_json({{"jsonrpc", "2.0"}, {"id", id}, {"result", result}});
    }

    void inject_error_reply(uint64_t id, int code, const std::string& message) {
        inject_json({{"jsonrpc", "2.0"},
                     {"id", id},
                     {"error", {{"code", code}, {"message", message}}}});
    }

    void inject_notification(const std::string& method, const json& params) {
        inject_json({{"jsonrpc", "2.0"}, {"method", method}, {"params", params}});
    }

    /// @brief Simulate the server going away; queued frames still drain first
    void fail(const std::string& reason = "connection reset by peer") {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                closed_ = true;
                close_reason_ = reason;
            }
        }
        cv_.notify_all();
    }

    std::vector<json> sent_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<json> out;
        out.reserve(sent_.size());
        for (const auto& text : sent_) {
            out.push_back(json::parse(text));
        }
        return out;
    }

    size_t sent_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_.size();
    }

    /// @brief Block until at least @p count frames were sent
    bool wait_for_sent(size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [&] { return sent_.size() >= count; });
    }

    bool was_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::string url() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return url_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool opened_ = false;
    bool closed_ = false;
    bool refuse_open_ = false;
    bool fail_sends_ = false;
    std::string close_reason_;
    std::string url_;
    std::deque<std::string> inbound_;
    std::vector<std::string> sent_;
    Responder responder_;
    std::function<void(MockTransport*)> on_destroy_;
};

/**
 * @brief Scripted Moonraker server shared across connection epochs
 *
 * Methods without a script get an empty object result.
 */
class MockMoonrakerServer {
  public:
    /// Full control over one request; reply through the transport (or don't)
    using Handler = std::function<void(MockTransport&, const json& request)>;

    ~MockMoonrakerServer() {
        // Detach from transports that outlive the server
        std::lock_guard<std::mutex> lock(mutex_);
        if (current_) {
            current_->set_on_destroy(nullptr);
        }
    }

    TransportFactory factory() {
        return [this]() -> std::unique_ptr<MoonrakerTransport> {
            auto transport = std::make_unique<MockTransport>();
            std::lock_guard<std::mutex> lock(mutex_);
            transport->set_refuse_open(refuse_connections_);
            transport->set_responder(
                [this](MockTransport& t, const json& request) { respond(t, request); });
            transport->set_on_destroy([this](MockTransport* t) {
                std::lock_guard<std::mutex> inner(mutex_);
                if (current_ == t) {
                    current_ = nullptr;
                }
            });
            if (!refuse_connections_) {
                connections_++;
            }
            current_ = transport.get();
            return transport;
        };
    }

    void set_result(const std::string& method, const json& result) {
        set_handler(method, [result](MockTransport& t, const json& request) {
            t.inject_reply(request["id"].get<uint64_t>(), result);
        });
    }

    void set_error(const std::string& method, int code, const std::string& message) {
        set_handler(method, [code, message](MockTransport& t, const json& request) {
            t.inject_error_reply(request["id"].get<uint64_t>(), code, message);
        });
    }

    /// @brief Never answer this method (the request will time out)
    void set_silent(const std::string& method) {
        set_handler(method, [](MockTransport&, const json&) {});
    }

    void set_handler(const std::string& method, Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_[method] = std::move(handler);
    }

    void set_refuse_connections(bool refuse) {
        std::lock_guard<std::mutex> lock(mutex_);
        refuse_connections_ = refuse;
    }

    /// @brief Send a notification on the live connection
    bool notify(const std::string& method, const json& params) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_) {
            return false;
        }
        current_->inject_notification(method, params);
        return true;
    }

    /// @brief Fail the live connection
    bool drop_connection(const std::string& reason = "connection reset by peer") {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!current_) {
            return false;
        }
        current_->fail(reason);
        return true;
    }

    int connections() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return connections_;
    }

    int request_count(const std::string& method) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_counts_.find(method);
        return it == request_counts_.end() ? 0 : it->second;
    }

  private:
    void respond(MockTransport& transport, const json& request) {
        std::string method = request.value("method", "");
        Handler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            request_counts_[method]++;
            auto it = handlers_.find(method);
            if (it != handlers_.end()) {
                handler = it->second;
            }
        }
        if (handler) {
            handler(transport, request);
        } else {
            transport.inject_reply(request["id"].get<uint64_t>(), json::object());
        }
    }

    mutable std::mutex mutex_;
    std::map<std::string, Handler> handlers_;
    std::map<std::string, int> request_counts_;
    MockTransport* current_ = nullptr;
    bool refuse_connections_ = false;
    int connections_ = 0;
};

#endif // MOCK_TRANSPORT_H
