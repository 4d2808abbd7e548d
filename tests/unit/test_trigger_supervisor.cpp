// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "moonraker_events.h"
#include "sync_engine.h"
#include "trigger_supervisor.h"

#include "../mocks/mock_transport.h"
#include "../test_fixtures.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <catch2/catch_test_macros.hpp>

using namespace meshvault;
using namespace std::chrono_literals;

namespace {

json console_history() {
    return {{"gcode_store",
             {{{"message", "probe at 1.0,2.0 is z=-0.05"}, {"time", 100.0}},
              {{"message", "probe at 3.0,4.0 is z=0.02"}, {"time", 101.0}},
              {{"message", "probe: z_offset: -0.123"}, {"time", 102.0}}}}};
}

json bed_mesh_status(double corner) {
    return {{"status",
             {{"bed_mesh",
               {{"profile_name", "default"},
                {"mesh_min", {10.0, 10.0}},
                {"mesh_max", {200.0, 200.0}},
                {"probed_matrix", {{corner, 0.2}, {0.3, 0.4}}}}}}}};
}

} // namespace

// ============================================================================
// Fixture
// ============================================================================

class SupervisorFixture : public TempDirFixture {
  public:
    SupervisorFixture()
        : recorder(events),
          stores(file("probes.json"), file("meshes.json"), file("offsets.json"), &events) {
        settings.url = "ws://printer.local:7125/websocket";
        settings.connect_timeout_ms = 1000;
        settings.request_timeout_ms = 2000;
        settings.sync_interval = 1h;
        settings.retry_delay = 10ms;
        settings.settle_delay = 10ms;

        server.set_result("server.gcode_store", console_history());
        server.set_result("printer.objects.query", bed_mesh_status(0.1));
    }

    ~SupervisorFixture() {
        stop();
    }

    void start() {
        supervisor =
            std::make_unique<TriggerSupervisor>(settings, server.factory(), stores, events);
        runner = std::thread([this] { supervisor->run(); });
    }

    void stop() {
        if (supervisor) {
            supervisor->request_shutdown();
        }
        if (runner.joinable()) {
            runner.join();
        }
    }

    /// @brief request_shutdown() and measure how long run() takes to return
    std::chrono::milliseconds timed_stop() {
        auto started = std::chrono::steady_clock::now();
        stop();
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    }

    bool wait_for_state(SupervisorState state) {
        return wait_until([&] { return supervisor->state() == state; });
    }

  protected:
    MockMoonrakerServer server;
    EventEmitter events;
    EventRecorder recorder;
    MeasurementStores stores;
    SupervisorSettings settings;
    std::unique_ptr<TriggerSupervisor> supervisor;
    std::thread runner;
};

// ============================================================================
// One-shot mode
// ============================================================================

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: run_once syncs every store",
                 "[supervisor]") {
    TriggerSupervisor once(settings, server.factory(), stores, events);

    REQUIRE(once.run_once());
    REQUIRE(once.state() == SupervisorState::STOPPED);
    REQUIRE(server.connections() == 1);

    REQUIRE(stores.probes.load().size() == 2);
    REQUIRE(stores.meshes.load().size() == 1);
    REQUIRE(stores.offsets.load().size() == 1);
    REQUIRE(recorder.count(MoonrakerEventType::REFRESH_COMPLETE) == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: run_once reports connection failure",
                 "[supervisor]") {
    server.set_refuse_connections(true);
    TriggerSupervisor once(settings, server.factory(), stores, events);

    REQUIRE_FALSE(once.run_once());
    REQUIRE(once.state() == SupervisorState::STOPPED);
    REQUIRE(recorder.count(MoonrakerEventType::CONNECTION_FAILED) == 1);
    REQUIRE_FALSE(exists(file("probes.json")));
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: run_once fails on a missing factory",
                 "[supervisor]") {
    TriggerSupervisor once(settings, nullptr, stores, events);
    REQUIRE_FALSE(once.run_once());
    REQUIRE(recorder.count(MoonrakerEventType::CONNECTION_FAILED) == 1);
}

// ============================================================================
// Long-running mode
// ============================================================================

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: initial sync then running",
                 "[supervisor]") {
    start();
    REQUIRE(wait_for_state(SupervisorState::RUNNING));

    REQUIRE(server.request_count("server.gcode_store") == 2);
    REQUIRE(server.request_count("printer.objects.query") == 1);
    REQUIRE(stores.probes.load().size() == 2);
    REQUIRE(recorder.count(MoonrakerEventType::CONNECTED) == 1);

    auto started = recorder.of_type(MoonrakerEventType::REFRESH_STARTED);
    REQUIRE(started.size() == 1);
    REQUIRE(started[0].details == "initial");

    stop();
    REQUIRE(supervisor->state() == SupervisorState::STOPPED);
    REQUIRE(recorder.count(MoonrakerEventType::SHUTDOWN) == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: mesh-complete marker triggers a refresh",
                 "[supervisor]") {
    start();
    REQUIRE(wait_for_state(SupervisorState::RUNNING));
    REQUIRE(server.request_count("printer.objects.query") == 1);

    server.set_result("printer.objects.query", bed_mesh_status(0.9));
    REQUIRE(server.notify("notify_gcode_response",
        json::array({"// Mesh Bed Leveling Complete\n"})));

    REQUIRE(wait_until([&] { return server.request_count("printer.objects.query") == 2; }));
    REQUIRE(wait_until([&] { return stores.meshes.load().size() == 2; }));

    auto triggers = recorder.of_type(MoonrakerEventType::TRIGGER_DETECTED);
    REQUIRE(triggers.size() == 1);
    REQUIRE(triggers[0].details == "// Mesh Bed Leveling Complete");

    SECTION("a second marker triggers another refresh") {
        REQUIRE(server.notify("notify_gcode_response",
            json::array({"// Mesh Bed Leveling Complete"})));
        REQUIRE(wait_until([&] { return server.request_count("printer.objects.query") == 3; }));
        // Same mesh as the last snapshot: not stored again
        REQUIRE(wait_until(
            [&] { return recorder.count(MoonrakerEventType::REFRESH_COMPLETE) == 3; }));
        REQUIRE(stores.meshes.load().size() == 2);
    }
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: other notifications are ignored",
                 "[supervisor]") {
    start();
    REQUIRE(wait_for_state(SupervisorState::RUNNING));

    REQUIRE(server.notify("notify_gcode_response", json::array({"probe at 1.0,2.0 is z=-0.05"})));
    REQUIRE(server.notify("notify_status_update",
        json::array({{{"bed_mesh", json::object()}}, 12.5})));
    std::this_thread::sleep_for(100ms);

    REQUIRE(server.request_count("printer.objects.query") == 1);
    REQUIRE_FALSE(recorder.has(MoonrakerEventType::TRIGGER_DETECTED));
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: custom trigger marker", "[supervisor]") {
    settings.trigger_marker = "MESHVAULT_SYNC";
    start();
    REQUIRE(wait_for_state(SupervisorState::RUNNING));

    REQUIRE(server.notify("notify_gcode_response", json::array({"// Mesh Bed Leveling Complete"})));
    REQUIRE(server.notify("notify_gcode_response", json::array({"MESHVAULT_SYNC"})));

    REQUIRE(wait_until([&] { return server.request_count("printer.objects.query") == 2; }));
    REQUIRE(recorder.count(MoonrakerEventType::TRIGGER_DETECTED) == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: periodic timer refreshes",
                 "[supervisor]") {
    settings.sync_interval = 30ms;
    start();

    REQUIRE(wait_until([&] {
        return recorder.count(MoonrakerEventType::REFRESH_COMPLETE) >= 3;
    }));

    bool saw_scheduled = false;
    for (const auto& evt : recorder.of_type(MoonrakerEventType::REFRESH_STARTED)) {
        saw_scheduled = saw_scheduled || evt.details == "scheduled";
    }
    REQUIRE(saw_scheduled);
    REQUIRE(server.connections() == 1);
}

// ============================================================================
// Failures and reconnection
// ============================================================================

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: reconnects after the connection drops",
                 "[supervisor]") {
    start();
    REQUIRE(wait_for_state(SupervisorState::RUNNING));
    REQUIRE(server.connections() == 1);

    REQUIRE(server.drop_connection());

    REQUIRE(wait_until([&] { return server.connections() == 2; }));
    REQUIRE(wait_for_state(SupervisorState::RUNNING));
    REQUIRE(recorder.count(MoonrakerEventType::CONNECTION_LOST) >= 1);
    REQUIRE(recorder.count(MoonrakerEventType::RECONNECT_SCHEDULED) >= 1);
    REQUIRE(supervisor->connection_attempts() >= 2);

    // Second epoch's initial refresh found nothing new
    REQUIRE(stores.probes.load().size() == 2);
    REQUIRE(stores.meshes.load().size() == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: keeps retrying while the printer is down",
                 "[supervisor]") {
    server.set_refuse_connections(true);
    start();

    REQUIRE(wait_until(
        [&] { return recorder.count(MoonrakerEventType::CONNECTION_FAILED) >= 3; }));
    REQUIRE(supervisor->connection_attempts() >= 3);

    server.set_refuse_connections(false);
    REQUIRE(wait_for_state(SupervisorState::RUNNING));
    REQUIRE(stores.probes.load().size() == 2);
}

TEST_CASE_METHOD(SupervisorFixture,
                 "TriggerSupervisor: connection lost mid-refresh keeps completed stores",
                 "[supervisor]") {
    std::atomic_int mesh_queries{0};
    server.set_handler("printer.objects.query", [&](MockTransport& t, const json& request) {
        if (mesh_queries++ == 0) {
            t.fail("connection reset by peer");
            return;
        }
        t.inject_reply(request["id"].get<uint64_t>(), bed_mesh_status(0.1));
    });
    start();

    REQUIRE(wait_until([&] { return server.connections() == 2; }));
    REQUIRE(wait_for_state(SupervisorState::RUNNING));

    REQUIRE(recorder.count(MoonrakerEventType::REFRESH_FAILED) == 1);
    REQUIRE(stores.probes.load().size() == 2);
    REQUIRE(stores.meshes.load().size() == 1);
    REQUIRE(stores.offsets.load().size() == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: RPC error keeps the connection",
                 "[supervisor]") {
    server.set_error("printer.objects.query", 503, "Klippy host not ready");
    start();

    REQUIRE(wait_for_state(SupervisorState::RUNNING));
    REQUIRE(recorder.count(MoonrakerEventType::REFRESH_FAILED) == 1);
    REQUIRE(recorder.count(MoonrakerEventType::RPC_ERROR) == 1);

    // Probes were saved before the rejected mesh query; offsets never ran
    REQUIRE(stores.probes.load().size() == 2);
    REQUIRE_FALSE(exists(file("offsets.json")));

    std::this_thread::sleep_for(50ms);
    REQUIRE(server.connections() == 1);
    REQUIRE(supervisor->state() == SupervisorState::RUNNING);
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: store write failure keeps the connection",
                 "[supervisor]") {
    write_file(file("blocker"), "not a directory");
    MeasurementStores broken(file("blocker/probes.json"), file("meshes.json"),
                             file("offsets.json"), &events);
    auto local = std::make_unique<TriggerSupervisor>(settings, server.factory(), broken, events);
    std::thread local_runner([&] { local->run(); });

    bool running = wait_until([&] { return local->state() == SupervisorState::RUNNING; });
    size_t failed = recorder.count(MoonrakerEventType::REFRESH_FAILED);
    local->request_shutdown();
    local_runner.join();

    REQUIRE(running);
    REQUIRE(failed == 1);
    REQUIRE(server.connections() == 1);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: shutdown interrupts every wait",
                 "[supervisor]") {
    SECTION("retry delay") {
        settings.retry_delay = 1h;
        server.set_refuse_connections(true);
        start();
        REQUIRE(wait_until([&] { return recorder.has(MoonrakerEventType::RECONNECT_SCHEDULED); }));
    }

    SECTION("settle delay") {
        settings.settle_delay = 1h;
        start();
        REQUIRE(wait_for_state(SupervisorState::RUNNING));
        REQUIRE(server.notify("notify_gcode_response",
            json::array({"// Mesh Bed Leveling Complete"})));
        REQUIRE(wait_until([&] { return recorder.has(MoonrakerEventType::TRIGGER_DETECTED); }));
    }

    SECTION("in-flight request") {
        settings.request_timeout_ms = 60 * 60 * 1000;
        server.set_silent("server.gcode_store");
        start();
        REQUIRE(wait_until([&] { return server.request_count("server.gcode_store") == 1; }));
    }

    SECTION("periodic sleep") {
        start();
        REQUIRE(wait_for_state(SupervisorState::RUNNING));
    }

    REQUIRE(timed_stop() < 2s);
    REQUIRE(supervisor->state() == SupervisorState::STOPPED);
    REQUIRE(supervisor->is_shutdown_requested());
    REQUIRE(recorder.count(MoonrakerEventType::SHUTDOWN) == 1);
}

TEST_CASE_METHOD(SupervisorFixture, "TriggerSupervisor: shutdown before run returns at once",
                 "[supervisor]") {
    TriggerSupervisor idle(settings, server.factory(), stores, events);
    idle.request_shutdown();
    idle.request_shutdown();
    idle.run();

    REQUIRE(idle.state() == SupervisorState::STOPPED);
    REQUIRE(server.connections() == 0);
}

// ============================================================================
// NotificationQueue
// ============================================================================

TEST_CASE("NotificationQueue: delivers in order until closed", "[supervisor]") {
    NotificationQueue queue;
    RpcFrame a;
    a.method = "first";
    RpcFrame b;
    b.method = "second";
    queue.push(a);
    queue.push(b);
    REQUIRE(queue.size() == 2);

    RpcFrame out;
    REQUIRE(queue.pop(out));
    REQUIRE(out.method == "first");
    REQUIRE(queue.pop(out));
    REQUIRE(out.method == "second");

    queue.close();
    REQUIRE(queue.is_closed());
    REQUIRE_FALSE(queue.pop(out));

    queue.push(a);
    REQUIRE(queue.size() == 0);
}

TEST_CASE("NotificationQueue: close wakes a blocked consumer", "[supervisor]") {
    NotificationQueue queue;
    std::atomic_bool returned{false};
    bool result = true;

    std::thread consumer([&] {
        RpcFrame out;
        result = queue.pop(out);
        returned = true;
    });

    std::this_thread::sleep_for(20ms);
    REQUIRE_FALSE(returned);
    queue.close();
    consumer.join();
    REQUIRE_FALSE(result);
}

TEST_CASE("supervisor_state_name: names every state", "[supervisor]") {
    REQUIRE(std::string(supervisor_state_name(SupervisorState::DISCONNECTED)) == "DISCONNECTED");
    REQUIRE(std::string(supervisor_state_name(SupervisorState::CONNECTING)) == "CONNECTING");
    REQUIRE(std::string(supervisor_state_name(SupervisorState::SYNCING)) == "SYNCING");
    REQUIRE(std::string(supervisor_state_name(SupervisorState::RUNNING)) == "RUNNING");
    REQUIRE(std::string(supervisor_state_name(SupervisorState::STOPPED)) == "STOPPED");
}
