#include "sync_fixture.hpp"

#include "remote/memory_record_store.hpp"

#include <string>
#include <vector>

using namespace tidesync;
using namespace tidesync::sync;
using namespace tidesync::testing;
using remote::MemoryRecordStore;

namespace {

FieldMap sighting(const std::string& intensity) {
    return FieldMap{
        {"species", TagSet{"shrimp", "blue crab"}},
        {"intensity", intensity},
        {"location", GeoPoint{30.6954, -88.0399}}};
}

} // namespace

TEST_CASE("Sync cycle: a report reaches a second device", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    auto b = make_device(store);

    const auto report = a->create_report(sighting("Minor"));
    REQUIRE(a->queue.contains(report.uuid));

    auto first = a->sync_ok();
    REQUIRE(first.uploaded == 1);
    REQUIRE(first.downloaded == 0);
    REQUIRE(first.conflicts == 0);
    REQUIRE(a->queue.empty());

    const auto uploaded = a->load(report.uuid);
    REQUIRE(uploaded.sync_status == SyncStatus::Synced);
    REQUIRE(uploaded.record_id == std::optional<std::string>(report.uuid.to_string()));
    REQUIRE(uploaded.change_tag.has_value());
    REQUIRE(store.record_count() == 1);
    REQUIRE(a->settings->last_sync_date() == a->now);
    REQUIRE(a->settings->watermark(store.store_id()).millis() > 0);

    auto second = b->sync_ok();
    REQUIRE(second.uploaded == 0);
    REQUIRE(second.downloaded == 1);

    const auto copy = b->load(report.uuid);
    REQUIRE(same_content(copy, uploaded));
    REQUIRE(copy.sync_status == SyncStatus::Synced);
    REQUIRE(copy.change_tag == uploaded.change_tag);
}

TEST_CASE("Sync cycle: a second cycle with no changes does nothing", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    a->create_report(sighting("Minor"));
    a->create_report(sighting("Major"));
    REQUIRE(a->sync_ok().uploaded == 2);

    const auto saves = store.save_calls();
    const auto watermark = a->settings->watermark(store.store_id());

    auto again = a->sync_ok();
    REQUIRE(again == SyncResult{});
    REQUIRE(store.save_calls() == saves);
    REQUIRE(a->settings->watermark(store.store_id()) == watermark);
}

TEST_CASE("Sync cycle: pending entities upload in priority order", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store, ResolutionStrategy::MostRecent, 1);

    std::vector<std::string> order;
    store.set_save_hook([&order](const std::vector<remote::SaveOutcome>& outcomes) {
        for (const auto& outcome : outcomes) order.push_back(outcome.record_id);
    });

    const auto low = a->create_report(sighting("Minor"), SyncPriority::Low);
    const auto normal = a->create_report(sighting("Moderate"), SyncPriority::Normal);
    const auto user = a->create_report(sighting("Major"), SyncPriority::UserInitiated);

    REQUIRE(a->sync_ok().uploaded == 3);
    REQUIRE(order == std::vector<std::string>{user.uuid.to_string(), normal.uuid.to_string(), low.uuid.to_string()});
}

TEST_CASE("Sync cycle: a failed record stays pending while the rest commit", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    const auto one = a->create_report(sighting("Minor"));
    const auto two = a->create_report(sighting("Moderate"));
    const auto three = a->create_report(sighting("Major"));

    store.fail_record_once(record_id_for(two), Error{"zone busy", ErrorCode::ZoneBusy});

    auto partial = a->sync_ok();
    REQUIRE(partial.uploaded == 2);
    REQUIRE(partial.errors == 1);
    REQUIRE(a->load(one.uuid).sync_status == SyncStatus::Synced);
    REQUIRE(a->load(two.uuid).sync_status == SyncStatus::PendingUpload);
    REQUIRE(a->load(three.uuid).sync_status == SyncStatus::Synced);
    REQUIRE(a->queue.contains(two.uuid));

    auto retry = a->sync_ok();
    REQUIRE(retry.uploaded == 1);
    REQUIRE(retry.errors == 0);
    REQUIRE(a->load(two.uuid).sync_status == SyncStatus::Synced);
    REQUIRE(store.record_count() == 3);
}

TEST_CASE("Sync cycle: a rejected record is marked as an error", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    const auto report = a->create_report(sighting("Minor"));

    store.fail_record_once(record_id_for(report), Error{"quota", ErrorCode::QuotaExceeded});
    auto result = a->sync_ok();
    REQUIRE(result.errors == 1);
    REQUIRE(a->load(report.uuid).sync_status == SyncStatus::Error);
    REQUIRE_FALSE(a->queue.contains(report.uuid));

    // A new edit makes it eligible again.
    a->edit(report.uuid, "notes", std::string("retry"));
    REQUIRE(a->sync_ok().uploaded == 1);
}

TEST_CASE("Sync cycle: a network failure keeps everything queued", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    const auto report = a->create_report(sighting("Minor"));

    // Outlasts the three attempts of the retry policy.
    store.fail_next_saves(Error{"offline", ErrorCode::NetworkUnavailable}, 3);
    auto failed = a->orchestrator->sync_pending_changes();
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().code == ErrorCode::NetworkUnavailable);
    REQUIRE(store.save_calls() == 3);
    REQUIRE(a->load(report.uuid).sync_status == SyncStatus::PendingUpload);
    REQUIRE(a->queue.contains(report.uuid));
    REQUIRE_FALSE(a->settings->last_sync_date().has_value());

    REQUIRE(a->sync_ok().uploaded == 1);
}

TEST_CASE("Sync cycle: transient failures are retried within the cycle", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    a->create_report(sighting("Minor"));

    store.fail_next_saves(Error{"busy", ErrorCode::ServiceUnavailable}, 2);
    REQUIRE(a->sync_ok().uploaded == 1);
    REQUIRE(store.save_calls() == 3);
}

TEST_CASE("Sync cycle: cancellation keeps committed batches", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store, ResolutionStrategy::MostRecent, 2);
    std::vector<Uuid> reports;
    for (int i = 0; i < 5; ++i) {
        reports.push_back(a->create_report(sighting("Minor")).uuid);
    }

    store.set_save_hook([&a](const std::vector<remote::SaveOutcome>&) { a->orchestrator->cancel_pending_sync(); });
    auto cancelled = a->orchestrator->sync_pending_changes();
    REQUIRE(cancelled.is_err());
    REQUIRE(cancelled.unwrap_err().code == ErrorCode::Cancelled);
    REQUIRE(a->orchestrator->last_result().uploaded == 2);
    REQUIRE(store.record_count() == 2);
    REQUIRE(a->queue.size() == 3);
    REQUIRE_FALSE(a->orchestrator->is_syncing());

    store.set_save_hook({});
    REQUIRE(a->sync_ok().uploaded == 3);
    for (const auto& uuid : reports) {
        REQUIRE(a->load(uuid).sync_status == SyncStatus::Synced);
    }
    REQUIRE(store.record_count() == 5);
}

TEST_CASE("Sync cycle: a cancelled token stops before upload", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    const auto report = a->create_report(sighting("Minor"));

    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    auto result = a->orchestrator->sync_pending_changes(token);
    REQUIRE(result.unwrap_err().code == ErrorCode::Cancelled);
    REQUIRE(store.save_calls() == 0);
    REQUIRE(a->queue.contains(report.uuid));
}

TEST_CASE("Sync cycle: only one cycle runs at a time", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    a->create_report(sighting("Minor"));

    std::optional<ErrorCode> nested_sync;
    std::optional<ErrorCode> nested_recreate;
    store.set_save_hook([&](const std::vector<remote::SaveOutcome>&) {
        REQUIRE(a->orchestrator->is_syncing());
        auto nested = a->orchestrator->sync_pending_changes();
        if (nested.is_err()) nested_sync = nested.unwrap_err().code;
        auto recreated = a->orchestrator->recreate_remote_zone();
        if (recreated.is_err()) nested_recreate = recreated.unwrap_err().code;
    });

    REQUIRE(a->sync_ok().uploaded == 1);
    REQUIRE(nested_sync == ErrorCode::AlreadySyncing);
    REQUIRE(nested_recreate == ErrorCode::AlreadySyncing);
    REQUIRE_FALSE(a->orchestrator->is_syncing());
    REQUIRE(a->orchestrator->phase() == SyncPhase::Idle);
}

TEST_CASE("Sync cycle: an account that is not signed in needs authentication", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    const auto report = a->create_report(sighting("Minor"));

    store.set_account_status(remote::AccountStatus::NoAccount);
    auto result = a->orchestrator->sync_pending_changes();
    REQUIRE(result.unwrap_err().code == ErrorCode::AuthenticationRequired);
    REQUIRE(store.save_calls() == 0);
    REQUIRE(a->load(report.uuid).sync_status == SyncStatus::PendingUpload);

    store.set_account_status(remote::AccountStatus::Restricted);
    REQUIRE(a->orchestrator->sync_pending_changes().unwrap_err().code == ErrorCode::AuthenticationRequired);

    store.set_account_status(remote::AccountStatus::Unknown);
    REQUIRE(a->orchestrator->sync_pending_changes().unwrap_err().code == ErrorCode::NetworkUnavailable);
    REQUIRE(store.save_calls() == 0);

    store.set_account_status(remote::AccountStatus::Available);
    REQUIRE(a->sync_ok().uploaded == 1);
}

TEST_CASE("Sync cycle: an expired change token restarts the download", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    auto b = make_device(store);
    a->create_report(sighting("Minor"));
    a->sync_ok();
    b->sync_ok();

    const auto late = b->create_report(sighting("Major"));
    b->sync_ok();

    store.expire_change_token_once();
    auto result = a->sync_ok();
    REQUIRE(result.downloaded == 1);
    REQUIRE(same_content(a->load(late.uuid), b->load(late.uuid)));
    REQUIRE(a->settings->watermark(store.store_id()) == store.record(record_id_for(late))->modified_at);
}

TEST_CASE("Sync cycle: a deleted zone is recreated and refilled", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    const auto one = a->create_report(sighting("Minor"));
    const auto two = a->create_report(sighting("Major"));
    a->sync_ok();

    store.delete_zone();
    auto failed = a->orchestrator->sync_pending_changes();
    REQUIRE(failed.unwrap_err().code == ErrorCode::ZoneNotFound);

    REQUIRE(a->orchestrator->recreate_remote_zone().is_ok());
    REQUIRE(a->settings->watermark(store.store_id()) == Timestamp{});
    REQUIRE(a->load(one.uuid).sync_status == SyncStatus::PendingUpload);
    REQUIRE_FALSE(a->load(one.uuid).change_tag.has_value());
    REQUIRE(a->queue.size() == 2);

    auto refill = a->sync_ok();
    REQUIRE(refill.uploaded == 2);
    REQUIRE(store.record_count() == 2);
    REQUIRE(a->load(two.uuid).sync_status == SyncStatus::Synced);
}

TEST_CASE("Sync cycle: progress and lifecycle signals", "[integration][sync]") {
    MemoryRecordStore store("shared");
    auto a = make_device(store);
    a->create_report(sighting("Minor"));

    int started = 0;
    std::vector<QString> phases;
    int finished_uploaded = -1;
    QObject::connect(a->orchestrator.get(), &SyncOrchestrator::syncStarted, [&started] { ++started; });
    QObject::connect(a->orchestrator.get(), &SyncOrchestrator::phaseChanged,
                     [&phases](const QString& phase) { phases.push_back(phase); });
    QObject::connect(a->orchestrator.get(), &SyncOrchestrator::syncFinished,
                     [&finished_uploaded](int uploaded, int, int, int) { finished_uploaded = uploaded; });

    a->sync_ok();
    REQUIRE(started == 1);
    REQUIRE(finished_uploaded == 1);
    REQUIRE(phases == std::vector<QString>{QStringLiteral("verifying_remote_availability"),
                                           QStringLiteral("uploading"), QStringLiteral("downloading"),
                                           QStringLiteral("resolving_conflicts"), QStringLiteral("idle")});
}
