#include "sync_fixture.hpp"

#include "remote/memory_record_store.hpp"
#include "sync/background_scheduler.hpp"
#include "sync/device_monitor.hpp"

#include <QDate>
#include <QDateTime>
#include <QTime>

using namespace tidesync;
using namespace tidesync::sync;
using namespace tidesync::testing;
using remote::MemoryRecordStore;

namespace {

QDateTime at(int hour, int minute = 0) {
    return QDateTime(QDate(2024, 7, 4), QTime(hour, minute));
}

void queue_reports(TestDevice& device, int count, SyncPriority priority) {
    for (int i = 0; i < count; ++i) {
        device.create_report(FieldMap{{"notes", std::string("report ") + std::to_string(i)}}, priority);
    }
}

void queue_placeholders(SyncPriorityQueue& queue, int count) {
    for (int i = 0; i < count; ++i) {
        queue.enqueue(Uuid::generate(), SyncPriority::Normal);
    }
}

} // namespace

TEST_CASE("Background gate", "[integration][scheduler]") {
    const DeviceConditions low_battery{.battery_level = 0.15, .charging = false, .network = NetworkKind::Wifi};
    REQUIRE(evaluate_gate(low_battery, false) == GateDecision::LowBattery);
    REQUIRE(to_string(GateDecision::LowBattery) == "Low battery");

    auto charging = low_battery;
    charging.charging = true;
    REQUIRE(evaluate_gate(charging, false) == GateDecision::Allowed);

    const DeviceConditions offline{.battery_level = 0.9, .charging = false, .network = NetworkKind::None};
    REQUIRE(evaluate_gate(offline, true) == GateDecision::NoNetwork);

    const DeviceConditions cellular{.battery_level = 0.9, .charging = false, .network = NetworkKind::Cellular};
    REQUIRE(evaluate_gate(cellular, false) == GateDecision::CellularDisabled);
    REQUIRE(evaluate_gate(cellular, true) == GateDecision::Allowed);

    const DeviceConditions hotspot{
        .battery_level = 0.9, .charging = false, .network = NetworkKind::Wifi, .metered = true};
    REQUIRE(evaluate_gate(hotspot, false) == GateDecision::CellularDisabled);

    SECTION("The scheduler reads the monitor and the cellular preference") {
        MemoryRecordStore store;
        auto device = make_device(store);
        FixedDeviceMonitor monitor(low_battery);
        BackgroundScheduler scheduler(*device->orchestrator, device->queue, *device->settings, monitor);
        REQUIRE_FALSE(scheduler.should_sync());

        monitor.set(cellular);
        REQUIRE(scheduler.gate() == GateDecision::CellularDisabled);
        device->settings->set_allow_cellular(true);
        REQUIRE(scheduler.should_sync());
    }
}

TEST_CASE("Processing window planning", "[integration][scheduler]") {
    MemoryRecordStore store;
    auto device = make_device(store);
    FixedDeviceMonitor monitor;
    BackgroundScheduler scheduler(*device->orchestrator, device->queue, *device->settings, monitor);

    auto afternoon = scheduler.plan_processing_window(51, at(14));
    REQUIRE(afternoon.has_value());
    REQUIRE(afternoon->earliest_begin == QDateTime(QDate(2024, 7, 5), QTime(2, 0)));
    REQUIRE(afternoon->requires_network);
    REQUIRE_FALSE(afternoon->requires_external_power);

    auto small_hours = scheduler.plan_processing_window(51, at(1));
    REQUIRE(small_hours->earliest_begin == at(2));

    REQUIRE_FALSE(scheduler.plan_processing_window(50, at(14)).has_value());
    REQUIRE_FALSE(scheduler.plan_processing_window(200, at(14))->requires_external_power);
    REQUIRE(scheduler.plan_processing_window(201, at(14))->requires_external_power);
}

TEST_CASE("Scheduler arming", "[integration][scheduler]") {
    MemoryRecordStore store;
    auto device = make_device(store);
    FixedDeviceMonitor monitor;
    BackgroundScheduler scheduler(*device->orchestrator, device->queue, *device->settings, monitor);
    scheduler.set_now([] { return at(14); });

    SECTION("Nothing is armed while background sync is off") {
        scheduler.start();
        REQUIRE_FALSE(scheduler.is_started());
        REQUIRE_FALSE(scheduler.refresh_armed());
        REQUIRE_FALSE(scheduler.processing_armed());
    }

    SECTION("The refresh window follows the configured interval") {
        device->settings->set_background_enabled(true);
        device->settings->set_sync_interval(std::chrono::hours(1));
        scheduler.start();
        REQUIRE(scheduler.refresh_armed());
        REQUIRE(scheduler.refresh_delay() == std::chrono::milliseconds(3600000));
        REQUIRE_FALSE(scheduler.processing_armed());

        scheduler.stop();
        REQUIRE_FALSE(scheduler.refresh_armed());
    }

    SECTION("A large backlog plans a processing window") {
        device->settings->set_background_enabled(true);
        queue_placeholders(device->queue, 60);
        scheduler.start();
        REQUIRE(scheduler.processing_armed());
        REQUIRE(scheduler.planned_processing()->pending == 60);
        REQUIRE(scheduler.planned_processing()->earliest_begin == QDateTime(QDate(2024, 7, 5), QTime(2, 0)));
    }

    SECTION("An expired window retries after a minute") {
        device->settings->set_background_enabled(true);
        scheduler.start();
        scheduler.on_expired();
        REQUIRE(scheduler.refresh_armed());
        REQUIRE(scheduler.refresh_delay() == std::chrono::milliseconds(60000));
    }
}

TEST_CASE("Refresh window uploads a bounded slice of the high tier", "[integration][scheduler]") {
    MemoryRecordStore store;
    auto device = make_device(store);
    queue_reports(*device, 25, SyncPriority::High);
    queue_reports(*device, 5, SyncPriority::Normal);

    FixedDeviceMonitor monitor;
    BackgroundScheduler scheduler(*device->orchestrator, device->queue, *device->settings, monitor);
    int completed_items = -1;
    QObject::connect(&scheduler, &BackgroundScheduler::windowCompleted, [&](int items) { completed_items = items; });

    auto outcome = scheduler.handle_refresh_window();
    REQUIRE(outcome.ran());
    REQUIRE(outcome.items == 20);
    REQUIRE(outcome.cycle->is_ok());
    REQUIRE(outcome.cycle->unwrap().uploaded == 20);
    REQUIRE(completed_items == 20);

    REQUIRE(device->queue.size(SyncPriority::High) == 5);
    REQUIRE(device->queue.size(SyncPriority::Normal) == 5);
    REQUIRE(store.record_count() == 20);
    REQUIRE(device->settings->last_background_sync_date().has_value());
}

TEST_CASE("Refresh windows drain a small normal backlog after a restart", "[integration][scheduler]") {
    MemoryRecordStore store;
    auto device = make_device(store);
    queue_reports(*device, 5, SyncPriority::Normal);
    device->queue.clear();
    REQUIRE(device->orchestrator->rebuild_queue().unwrap() == 5);

    FixedDeviceMonitor monitor;
    BackgroundScheduler scheduler(*device->orchestrator, device->queue, *device->settings, monitor);

    auto first = scheduler.handle_refresh_window();
    REQUIRE(first.ran());
    REQUIRE(first.items == 5);
    REQUIRE(first.cycle->unwrap().uploaded == 5);
    REQUIRE(device->queue.empty());
    REQUIRE(store.record_count() == 5);
    REQUIRE(device->entities().fetch_pending_sync().unwrap().empty());

    auto second = scheduler.handle_refresh_window();
    REQUIRE(second.ran());
    REQUIRE(second.items == 0);
    REQUIRE(store.record_count() == 5);
}

TEST_CASE("Processing window drains the backlog", "[integration][scheduler]") {
    MemoryRecordStore store;
    auto device = make_device(store);
    queue_reports(*device, 8, SyncPriority::Low);
    queue_reports(*device, 4, SyncPriority::High);

    FixedDeviceMonitor monitor;
    BackgroundScheduler scheduler(*device->orchestrator, device->queue, *device->settings, monitor);

    auto outcome = scheduler.handle_processing_window();
    REQUIRE(outcome.ran());
    REQUIRE(outcome.items == 12);
    REQUIRE(outcome.cycle->unwrap().uploaded == 12);
    REQUIRE(device->queue.empty());
}

TEST_CASE("Skipped windows", "[integration][scheduler]") {
    MemoryRecordStore store;
    auto device = make_device(store);
    FixedDeviceMonitor monitor;
    BackgroundScheduler scheduler(*device->orchestrator, device->queue, *device->settings, monitor);

    QStringList skipped;
    QObject::connect(&scheduler, &BackgroundScheduler::windowSkipped,
                     [&](const QString& reason) { skipped << reason; });

    SECTION("Low battery") {
        queue_reports(*device, 3, SyncPriority::High);
        monitor.set(DeviceConditions{.battery_level = 0.1, .charging = false, .network = NetworkKind::Wifi});
        auto outcome = scheduler.handle_refresh_window();
        REQUIRE_FALSE(outcome.ran());
        REQUIRE(outcome.gate == GateDecision::LowBattery);
        REQUIRE(skipped == QStringList{QStringLiteral("Low battery")});
        REQUIRE(device->queue.size() == 3);
        REQUIRE(store.save_calls() == 0);
    }

    SECTION("A heavy backlog needs external power") {
        queue_placeholders(device->queue, 201);
        monitor.set(DeviceConditions{.battery_level = 0.9, .charging = false, .network = NetworkKind::Wifi});
        auto outcome = scheduler.handle_processing_window();
        REQUIRE_FALSE(outcome.ran());
        REQUIRE(outcome.gate == GateDecision::ExternalPowerRequired);
        REQUIRE(skipped == QStringList{QStringLiteral("External power required")});
        REQUIRE(device->queue.size() == 201);
    }

    SECTION("An exhausted budget cancels the cycle and retries soon") {
        device->settings->set_background_enabled(true);
        queue_reports(*device, 2, SyncPriority::High);
        SchedulerConfig config;
        config.refresh_budget = std::chrono::milliseconds(0);
        BackgroundScheduler hurried(*device->orchestrator, device->queue, *device->settings, monitor, config);

        auto outcome = hurried.handle_refresh_window();
        REQUIRE(outcome.ran());
        REQUIRE(outcome.cycle->unwrap_err().code == ErrorCode::Cancelled);
        REQUIRE(hurried.refresh_delay() == std::chrono::milliseconds(60000));
        REQUIRE(device->queue.size(SyncPriority::High) == 2);
        REQUIRE_FALSE(device->settings->last_background_sync_date().has_value());
    }
}
