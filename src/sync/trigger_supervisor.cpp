// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
/**
 * @file trigger_supervisor.cpp
 * @brief Reconnect loop, initial sync, and the listener/timer trigger threads
 *
 * @threading run() owns the epoch. Listener and timer threads only touch the
 *            epoch through the router, the notification queue and the
 *            interruptible waits; the reader thread ends the epoch through the
 *            router's closed callback.
 */

#include "trigger_supervisor.h"

#include "moonraker_error.h"
#include "moonraker_response_router.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <functional>
#include <memory>
#include <thread>
#include <utility>

namespace meshvault {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos) {
        return "";
    }
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

double to_hours(std::chrono::milliseconds ms) {
    return std::chrono::duration<double, std::ratio<3600>>(ms).count();
}

double to_seconds(std::chrono::milliseconds ms) {
    return std::chrono::duration<double>(ms).count();
}

} // namespace

const char* supervisor_state_name(SupervisorState state) {
    switch (state) {
    case SupervisorState::DISCONNECTED:
        return "DISCONNECTED";
    case SupervisorState::CONNECTING:
        return "CONNECTING";
    case SupervisorState::SYNCING:
        return "SYNCING";
    case SupervisorState::RUNNING:
        return "RUNNING";
    case SupervisorState::STOPPED:
        return "STOPPED";
    }
    return "UNKNOWN";
}

// ============================================================================
// NotificationQueue
// ============================================================================

void NotificationQueue::push(RpcFrame frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
}

bool NotificationQueue::pop(RpcFrame& out) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !frames_.empty(); });
    if (closed_) {
        return false;
    }
    out = std::move(frames_.front());
    frames_.pop_front();
    return true;
}

void NotificationQueue::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        frames_.clear();
    }
    cv_.notify_all();
}

bool NotificationQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t NotificationQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

// ============================================================================
// TriggerSupervisor
// ============================================================================

struct TriggerSupervisor::Epoch {
    uint64_t number = 0;
    std::unique_ptr<MoonrakerTransport> transport;
    std::unique_ptr<RpcChannel> channel;
    std::unique_ptr<ResponseRouter> router;
    std::unique_ptr<SyncEngine> engine;
    NotificationQueue notifications;
    std::thread listener;
    std::thread timer;

    // Guarded by TriggerSupervisor::wait_mutex_
    bool ended = false;
    std::string end_reason;
};

TriggerSupervisor::TriggerSupervisor(SupervisorSettings settings, TransportFactory factory,
                                     MeasurementStores& stores, EventEmitter& events)
    : settings_(std::move(settings)), factory_(std::move(factory)), stores_(stores),
      events_(events) {}

TriggerSupervisor::~TriggerSupervisor() {
    request_shutdown();
}

void TriggerSupervisor::run() {
    spdlog::info("[Supervisor] Starting: url={}, interval={}h, retry={}s, settle={}s",
                 settings_.url, to_hours(settings_.sync_interval),
                 to_seconds(settings_.retry_delay), to_seconds(settings_.settle_delay));

    while (!shutdown_.load()) {
        run_epoch();
        if (shutdown_.load()) {
            break;
        }

        set_state(SupervisorState::DISCONNECTED);
        spdlog::info("[Supervisor] Retrying connection in {} seconds...",
                     to_seconds(settings_.retry_delay));
        events_.emit(MoonrakerEventType::RECONNECT_SCHEDULED,
                     fmt::format("Reconnecting in {}s", to_seconds(settings_.retry_delay)));
        wait_unless_shutdown(settings_.retry_delay);
    }

    set_state(SupervisorState::STOPPED);
    spdlog::info("[Supervisor] Stopped");
    events_.emit(MoonrakerEventType::SHUTDOWN, "Shutting down");
}

bool TriggerSupervisor::run_once() {
    Epoch epoch;
    bool ok = false;

    if (open_epoch(epoch)) {
        set_state(SupervisorState::SYNCING);
        try {
            epoch.engine->refresh("one-shot");
            ok = true;
        } catch (const std::exception& e) {
            spdlog::error("[Supervisor] One-shot refresh failed: {}", e.what());
        }
    }

    close_epoch(epoch);
    set_state(SupervisorState::STOPPED);
    return ok;
}

void TriggerSupervisor::request_shutdown() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!shutdown_.exchange(true)) {
            spdlog::info("[Supervisor] Shutdown requested");
        }
        // Interrupts an in-flight connect or request on the live epoch
        if (current_epoch_ && current_epoch_->channel) {
            current_epoch_->channel->close();
        }
    }
    wake_cv_.notify_all();
}

void TriggerSupervisor::run_epoch() {
    Epoch epoch;

    if (open_epoch(epoch)) {
        set_state(SupervisorState::SYNCING);
        if (guarded_refresh(epoch, "initial")) {
            set_state(SupervisorState::RUNNING);
            epoch.listener = std::thread(&TriggerSupervisor::listener_loop, this, std::ref(epoch));
            epoch.timer = std::thread(&TriggerSupervisor::timer_loop, this, std::ref(epoch));

            std::unique_lock<std::mutex> lock(wait_mutex_);
            wake_cv_.wait(lock, [&] { return shutdown_.load() || epoch.ended; });
        }
    }

    close_epoch(epoch);
}

bool TriggerSupervisor::open_epoch(Epoch& epoch) {
    epoch.number = ++connection_attempts_;
    set_state(SupervisorState::CONNECTING);
    spdlog::info("[Supervisor] Connecting to {} (attempt {})", settings_.url, epoch.number);
    events_.emit(MoonrakerEventType::CONNECTING, "Connecting to " + settings_.url);

    try {
        std::unique_ptr<MoonrakerTransport> transport = factory_ ? factory_() : nullptr;
        if (!transport) {
            throw TransportError("no transport available");
        }

        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            if (shutdown_.load()) {
                return false;
            }
            epoch.transport = std::move(transport);
            epoch.channel = std::make_unique<RpcChannel>(*epoch.transport);
            current_epoch_ = &epoch;
        }

        epoch.channel->connect(settings_.url, settings_.connect_timeout_ms);

        epoch.router = std::make_unique<ResponseRouter>(*epoch.channel, events_);
        epoch.router->set_default_timeout(settings_.request_timeout_ms);
        epoch.router->subscribe(
            [&epoch](const RpcFrame& frame) { epoch.notifications.push(frame); });
        epoch.router->set_on_closed(
            [this, &epoch](const MoonrakerError& error) { end_epoch(epoch, error.message); });
        epoch.router->start();
    } catch (const MoonrakerException& e) {
        if (shutdown_.load()) {
            spdlog::debug("[Supervisor] Connect interrupted by shutdown: {}", e.what());
        } else {
            spdlog::warn("[Supervisor] Connection attempt failed: {}", e.what());
            events_.emit(MoonrakerEventType::CONNECTION_FAILED,
                         "Connection to printer failed: " + std::string(e.what()), true);
        }
        return false;
    }

    epoch.engine = std::make_unique<SyncEngine>(*epoch.router, stores_, events_);
    spdlog::info("[Supervisor] Connected to Moonraker");
    events_.emit(MoonrakerEventType::CONNECTED, "Connected to " + settings_.url);
    return true;
}

void TriggerSupervisor::close_epoch(Epoch& epoch) {
    end_epoch(epoch, "closing");
    epoch.notifications.close();

    // Closing the channel fails every in-flight request, which unblocks both tasks
    if (epoch.router) {
        epoch.router->stop();
    } else if (epoch.channel) {
        epoch.channel->close();
    }

    if (epoch.listener.joinable()) {
        epoch.listener.join();
    }
    if (epoch.timer.joinable()) {
        epoch.timer.join();
    }

    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (current_epoch_ == &epoch) {
            current_epoch_ = nullptr;
        }
    }
    spdlog::debug("[Supervisor] Epoch {} closed", epoch.number);
}

void TriggerSupervisor::end_epoch(Epoch& epoch, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (epoch.ended) {
            return;
        }
        epoch.ended = true;
        epoch.end_reason = reason;
    }
    wake_cv_.notify_all();
    spdlog::debug("[Supervisor] Epoch {} ending: {}", epoch.number, reason);
}

void TriggerSupervisor::listener_loop(Epoch& epoch) {
    spdlog::info("[Supervisor] Listening for '{}' trigger...", settings_.trigger_marker);

    RpcFrame frame;
    while (epoch.notifications.pop(frame)) {
        if (!is_mesh_complete_marker(frame, settings_.trigger_marker)) {
            continue;
        }

        std::string line = trim(frame.params[0].get<std::string>());
        spdlog::info("[Supervisor] TRIGGER DETECTED: {}", line);
        events_.emit(MoonrakerEventType::TRIGGER_DETECTED, "Mesh calibration finished", false,
                     line);

        spdlog::info("[Supervisor] Waiting {} seconds for mesh data to stabilize...",
                     to_seconds(settings_.settle_delay));
        if (!wait_in_epoch(epoch, settings_.settle_delay)) {
            break;
        }
        if (!guarded_refresh(epoch, "trigger")) {
            break;
        }
        spdlog::info("[Supervisor] Resuming listening for trigger...");
    }
    spdlog::debug("[Supervisor] Listener exiting");
}

void TriggerSupervisor::timer_loop(Epoch& epoch) {
    const double hours = to_hours(settings_.sync_interval);
    while (true) {
        spdlog::info("[Supervisor] Periodic sync sleeping for {} hours...", hours);
        if (!wait_in_epoch(epoch, settings_.sync_interval)) {
            break;
        }
        spdlog::info("[Supervisor] Waking up for scheduled {}-hour sync", hours);
        if (!guarded_refresh(epoch, "scheduled")) {
            break;
        }
    }
    spdlog::debug("[Supervisor] Timer exiting");
}

bool TriggerSupervisor::guarded_refresh(Epoch& epoch, const std::string& reason) {
    try {
        epoch.engine->refresh(reason);
        return true;
    } catch (const RpcError& e) {
        // Printer answered (e.g. Klipper not ready): this refresh failed, link is fine
        spdlog::warn("[Supervisor] {} refresh rejected by printer, staying connected: {}", reason,
                     e.what());
        return true;
    } catch (const StoreWriteError& e) {
        spdlog::error("[Supervisor] {} refresh could not save {}: {}", reason, e.path(),
                      e.what());
        return true;
    } catch (const MoonrakerException& e) {
        if (shutdown_.load()) {
            spdlog::debug("[Supervisor] {} refresh interrupted by shutdown", reason);
        } else {
            spdlog::warn("[Supervisor] Connection to Moonraker lost or failed: {}", e.what());
        }
        end_epoch(epoch, e.what());
        return false;
    } catch (const std::exception& e) {
        spdlog::error("[Supervisor] Unexpected error during {} refresh: {}", reason, e.what());
        end_epoch(epoch, e.what());
        return false;
    }
}

bool TriggerSupervisor::wait_in_epoch(Epoch& epoch, std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wake_cv_.wait_for(lock, delay, [&] { return shutdown_.load() || epoch.ended; });
}

bool TriggerSupervisor::wait_unless_shutdown(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    return !wake_cv_.wait_for(lock, delay, [this] { return shutdown_.load(); });
}

void TriggerSupervisor::set_state(SupervisorState state) {
    SupervisorState old_state = state_.exchange(state);
    if (old_state != state) {
        spdlog::debug("[Supervisor] State: {} -> {}", supervisor_state_name(old_state),
                      supervisor_state_name(state));
    }
}

} // namespace meshvault
