#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/entity_repository.hpp"
#include "storage/conflict_history_repository.hpp"

using namespace tidesync;
using namespace tidesync::storage;

namespace {

Database open_store() {
    auto db = Database::open_memory().unwrap();
    REQUIRE(initialize_database(db).is_ok());
    return db;
}

Entity report_at(int64_t millis) {
    auto entity = make_entity("report", Timestamp(millis));
    entity.set_field("intensity", std::string("Minor"), Timestamp(millis));
    return entity;
}

} // namespace

TEST_CASE("Database basic operations", "[unit][storage]") {
    auto db_result = Database::open_memory();
    REQUIRE(db_result.is_ok());
    auto db = std::move(db_result).unwrap();

    SECTION("Execute creates table") {
        auto result = db.execute("CREATE TABLE test (id INTEGER PRIMARY KEY);");
        REQUIRE(result.is_ok());
    }

    SECTION("Prepare and step") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER, name TEXT);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1, 'Alice');").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (2, 'Bob');").is_ok());

        auto stmt = db.prepare("SELECT * FROM test ORDER BY id;").unwrap();

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 1);
        REQUIRE(stmt.column_text(1) == "Alice");

        REQUIRE(stmt.step().unwrap() == true);
        REQUIRE(stmt.column_int(0) == 2);
        REQUIRE(stmt.column_text(1) == "Bob");

        REQUIRE(stmt.step().unwrap() == false);
    }

    SECTION("Transaction commit") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto first = db.execute("INSERT INTO test VALUES (1);");
            if (first.is_err()) return first;
            return db.execute("INSERT INTO test VALUES (2);");
        });

        REQUIRE(result.is_ok());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 2);
    }

    SECTION("Transaction rollback on error") {
        REQUIRE(db.execute("CREATE TABLE test (id INTEGER);").is_ok());
        REQUIRE(db.execute("INSERT INTO test VALUES (1);").is_ok());

        auto result = db.transaction([&]() -> Result<void, Error> {
            auto inserted = db.execute("INSERT INTO test VALUES (2);");
            if (inserted.is_err()) return inserted;
            return Result<void, Error>::err(Error{"Intentional error"});
        });

        REQUIRE(result.is_err());

        auto stmt = db.prepare("SELECT COUNT(*) FROM test;").unwrap();
        REQUIRE(stmt.step().unwrap());
        REQUIRE(stmt.column_int(0) == 1);
    }

    SECTION("Statement errors carry the SQLite code") {
        auto stmt = db.prepare("SELECT * FROM missing_table;");
        REQUIRE(stmt.is_err());
        REQUIRE(stmt.unwrap_err().code == ErrorCode::StorageError);
        REQUIRE(stmt.unwrap_err().detail != 0);
    }
}

TEST_CASE("Migrations run successfully", "[unit][storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    auto result = runner.migrate();
    REQUIRE(result.is_ok());

    auto version = runner.current_version();
    REQUIRE(version.is_ok());
    REQUIRE(version.unwrap() == runner.latest_version());

    SECTION("Migrating twice is a no-op") {
        REQUIRE(runner.migrate().is_ok());
        REQUIRE(runner.current_version().unwrap() == runner.latest_version());
    }

    SECTION("Rollback drops the newest schema step") {
        REQUIRE(runner.rollback().is_ok());
        REQUIRE(runner.current_version().unwrap() == runner.latest_version() - 1);
        REQUIRE(db.prepare("SELECT id FROM conflict_history;").is_err());
        REQUIRE(db.prepare("SELECT uuid FROM entities;").is_ok());

        REQUIRE(runner.migrate().is_ok());
        REQUIRE(db.prepare("SELECT id FROM conflict_history;").is_ok());
    }
}

TEST_CASE("Remote emulation schema is independent of the local one", "[unit][storage]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db, REMOTE_EMULATION_MIGRATIONS);

    REQUIRE(runner.migrate().is_ok());
    REQUIRE(db.prepare("SELECT record_id FROM remote_records;").is_ok());
    REQUIRE(db.prepare("SELECT uuid FROM entities;").is_err());
}

TEST_CASE("EntityRepository CRUD", "[unit][storage]") {
    auto db = open_store();
    EntityRepository repo(db);

    auto entity = report_at(1000);
    entity.set_field("species", TagSet{"blue crab", "shrimp"}, Timestamp(1000));
    entity.set_field("location", GeoPoint{30.6954, -88.0399}, Timestamp(1000));
    entity.set_field("environment", MeasurementMap{{"water_temp", 28.5}}, Timestamp(1000));
    entity.set_field("timestamp", Timestamp(900), Timestamp(1000));

    SECTION("Upsert and get round-trip every field kind") {
        REQUIRE(repo.upsert(entity).is_ok());

        auto loaded = repo.get(entity.uuid);
        REQUIRE(loaded.is_ok());
        REQUIRE(loaded.unwrap().has_value());
        REQUIRE(*loaded.unwrap() == entity);
    }

    SECTION("Get of an unknown uuid is empty") {
        auto loaded = repo.get(Uuid::generate());
        REQUIRE(loaded.is_ok());
        REQUIRE_FALSE(loaded.unwrap().has_value());
    }

    SECTION("Upsert replaces the row") {
        REQUIRE(repo.upsert(entity).is_ok());
        entity.change_tag = "tag-3";
        entity.record_id = entity.uuid.to_string();
        entity.sync_status = SyncStatus::Synced;
        REQUIRE(repo.upsert(entity).is_ok());

        auto loaded = repo.get(entity.uuid).unwrap();
        REQUIRE(loaded->change_tag == std::optional<std::string>("tag-3"));
        REQUIRE(loaded->sync_status == SyncStatus::Synced);
    }

    SECTION("Mark for sync") {
        entity.sync_status = SyncStatus::Synced;
        entity.change_tag = "tag-1";
        REQUIRE(repo.upsert(entity).is_ok());

        REQUIRE(repo.mark_for_sync(entity.uuid, Timestamp(5000)).is_ok());

        auto loaded = repo.get(entity.uuid).unwrap();
        REQUIRE(loaded->sync_status == SyncStatus::PendingUpload);
        REQUIRE(loaded->last_modified == Timestamp(5000));
        REQUIRE(loaded->change_tag == std::optional<std::string>("tag-1"));
    }

    SECTION("Mark for sync of a missing entity fails") {
        auto result = repo.mark_for_sync(Uuid::generate(), Timestamp(5000));
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::UnknownItem);
    }

    SECTION("Remove deletes the entity and its base") {
        REQUIRE(repo.upsert(entity).is_ok());
        REQUIRE(repo.save_base(entity, Timestamp(1000)).is_ok());

        REQUIRE(repo.remove(entity.uuid).is_ok());

        REQUIRE_FALSE(repo.get(entity.uuid).unwrap().has_value());
        REQUIRE_FALSE(repo.get_base(entity.uuid).unwrap().has_value());
    }

    SECTION("Remove is refused while a conflict is unresolved") {
        entity.conflict_resolution_needed = true;
        entity.sync_status = SyncStatus::Conflict;
        REQUIRE(repo.upsert(entity).is_ok());

        auto result = repo.remove(entity.uuid);
        REQUIRE(result.is_err());
        REQUIRE(result.unwrap_err().code == ErrorCode::InvalidArguments);
        REQUIRE(repo.get(entity.uuid).unwrap().has_value());
    }
}

TEST_CASE("EntityRepository queries", "[unit][storage]") {
    auto db = open_store();
    EntityRepository repo(db);

    auto old_pending = report_at(1000);
    auto new_pending = report_at(3000);
    auto synced = report_at(2000);
    synced.sync_status = SyncStatus::Synced;
    auto flagged = report_at(2500);
    flagged.sync_status = SyncStatus::Conflict;
    flagged.conflict_resolution_needed = true;
    auto failed = report_at(4000);
    failed.sync_status = SyncStatus::Error;

    for (const auto& e : {new_pending, old_pending, synced, flagged, failed}) {
        REQUIRE(repo.upsert(e).is_ok());
    }

    SECTION("Pending sync is everything not synced, oldest first") {
        auto pending = repo.fetch_pending_sync().unwrap();
        REQUIRE(pending.size() == 4);
        REQUIRE(pending[0].uuid == old_pending.uuid);
        REQUIRE(pending[1].uuid == flagged.uuid);
        REQUIRE(pending[2].uuid == new_pending.uuid);
        REQUIRE(pending[3].uuid == failed.uuid);
        REQUIRE(repo.count_pending_sync().unwrap() == 4);
    }

    SECTION("Pending upload skips flagged and failed entities") {
        auto pending = repo.fetch_pending_upload().unwrap();
        REQUIRE(pending.size() == 2);
        REQUIRE(pending[0].uuid == old_pending.uuid);
        REQUIRE(pending[1].uuid == new_pending.uuid);

        auto limited = repo.fetch_pending_upload(1).unwrap();
        REQUIRE(limited.size() == 1);
        REQUIRE(limited[0].uuid == old_pending.uuid);
    }

    SECTION("Conflicts") {
        auto conflicts = repo.fetch_conflicts().unwrap();
        REQUIRE(conflicts.size() == 1);
        REQUIRE(conflicts[0].uuid == flagged.uuid);
        REQUIRE(repo.count_conflicts().unwrap() == 1);
    }

    SECTION("Date range bounds are inclusive") {
        auto in_range = repo.fetch_in_range(Timestamp(2000), Timestamp(3000)).unwrap();
        REQUIRE(in_range.size() == 3);
        REQUIRE(in_range[0].uuid == synced.uuid);
        REQUIRE(in_range[1].uuid == flagged.uuid);
        REQUIRE(in_range[2].uuid == new_pending.uuid);

        REQUIRE(repo.fetch_in_range(Timestamp(5000), Timestamp(6000)).unwrap().empty());
    }

    SECTION("Resetting remote state marks everything for upload") {
        synced.change_tag = "tag-9";
        REQUIRE(repo.upsert(synced).is_ok());
        REQUIRE(repo.save_base(synced, Timestamp(2000)).is_ok());

        auto affected = repo.reset_remote_state(Timestamp(3500));
        REQUIRE(affected.is_ok());
        REQUIRE(affected.unwrap() == 5);

        auto reloaded = repo.get(synced.uuid).unwrap();
        REQUIRE(reloaded->sync_status == SyncStatus::PendingUpload);
        REQUIRE_FALSE(reloaded->change_tag.has_value());
        REQUIRE(reloaded->last_modified == Timestamp(3500));
        REQUIRE_FALSE(repo.get_base(synced.uuid).unwrap().has_value());

        // Newer local edits keep their timestamp.
        REQUIRE(repo.get(failed.uuid).unwrap()->last_modified == Timestamp(4000));
        REQUIRE(repo.count_conflicts().unwrap() == 0);
    }
}

TEST_CASE("EntityRepository base snapshots", "[unit][storage]") {
    auto db = open_store();
    EntityRepository repo(db);

    auto entity = report_at(1000);
    REQUIRE(repo.upsert(entity).is_ok());

    REQUIRE_FALSE(repo.get_base(entity.uuid).unwrap().has_value());

    REQUIRE(repo.save_base(entity, Timestamp(1000)).is_ok());
    entity.set_field("notes", std::string("later"), Timestamp(2000));
    REQUIRE(repo.save_base(entity, Timestamp(2000)).is_ok());

    auto base = repo.get_base(entity.uuid).unwrap();
    REQUIRE(base.has_value());
    REQUIRE(base->fields == entity.fields);
}

TEST_CASE("ConflictHistoryRepository keeps one open entry per entity", "[unit][storage][history]") {
    auto db = open_store();
    ConflictHistoryRepository history(db);
    const auto uuid = Uuid::generate();

    auto first = history.record_detected(uuid, Timestamp(1000), ResolutionRecord{
        .strategy = "most_recent", .resolution_type = "download", .local_snapshot = "{\"v\":1}"});
    REQUIRE(first.is_ok());

    SECTION("Re-detection refreshes the open entry") {
        auto second = history.record_detected(uuid, Timestamp(2000), ResolutionRecord{
            .strategy = "manual", .resolution_type = "manual", .local_snapshot = "{\"v\":2}"});
        REQUIRE(second.is_ok());
        REQUIRE(second.unwrap() == first.unwrap());

        auto entries = history.history_for(uuid).unwrap();
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].occurred_at == Timestamp(1000));
        REQUIRE(entries[0].resolution_strategy == "manual");
        REQUIRE(entries[0].local_snapshot == "{\"v\":2}");
        REQUIRE_FALSE(entries[0].is_resolved());
    }

    SECTION("Resolution closes the open entry") {
        auto closed = history.record_resolution(uuid, Timestamp(3000), ResolutionRecord{
            .strategy = "most_recent", .resolution_type = "use_remote", .merged_snapshot = "{}"});
        REQUIRE(closed.is_ok());
        REQUIRE(closed.unwrap() == first.unwrap());

        auto entry = history.history_for(uuid).unwrap().at(0);
        REQUIRE(entry.is_resolved());
        REQUIRE(*entry.resolved_at == Timestamp(3000));
        REQUIRE(entry.resolution_type == "use_remote");
        // Detection snapshot survives an empty one at resolution time.
        REQUIRE(entry.local_snapshot == "{\"v\":1}");

        REQUIRE_FALSE(history.open_entry(uuid).unwrap().has_value());
        REQUIRE(history.unresolved().unwrap().empty());
    }

    SECTION("A new conflict after resolution opens a second entry") {
        REQUIRE(history.record_resolution(uuid, Timestamp(3000), ResolutionRecord{
            .strategy = "most_recent", .resolution_type = "use_local"}).is_ok());
        auto reopened = history.record_detected(uuid, Timestamp(4000), ResolutionRecord{
            .strategy = "most_recent", .resolution_type = "download"});
        REQUIRE(reopened.is_ok());
        REQUIRE(reopened.unwrap() != first.unwrap());

        auto entries = history.history_for(uuid).unwrap();
        REQUIRE(entries.size() == 2);
        REQUIRE(entries[0].occurred_at == Timestamp(4000));  // newest first
        REQUIRE(history.unresolved().unwrap().size() == 1);
    }
}

TEST_CASE("ConflictHistoryRepository resolution without detection", "[unit][storage][history]") {
    auto db = open_store();
    ConflictHistoryRepository history(db);
    const auto uuid = Uuid::generate();

    auto id = history.record_resolution(uuid, Timestamp(5000), ResolutionRecord{
        .strategy = "server_wins", .resolution_type = "use_remote", .notes = "direct"});
    REQUIRE(id.is_ok());

    auto entries = history.history_for(uuid).unwrap();
    REQUIRE(entries.size() == 1);
    REQUIRE(entries[0].occurred_at == Timestamp(5000));
    REQUIRE(*entries[0].resolved_at == Timestamp(5000));
    REQUIRE(entries[0].notes == "direct");

    auto by_strategy = history.by_strategy("server_wins").unwrap();
    REQUIRE(by_strategy.size() == 1);
    REQUIRE(history.by_strategy("manual").unwrap().empty());
}
