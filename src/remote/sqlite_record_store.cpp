#include "remote/sqlite_record_store.hpp"
#include "core/entity_codec.hpp"
#include "core/logging.hpp"
#include "storage/migrations.hpp"

#include <algorithm>

namespace tidesync::remote {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT record_id, uuid, record_type, change_tag, fields_json, field_stamps_json,
           last_modified, modified_at
    FROM remote_records
)SQL";

} // namespace

Result<std::unique_ptr<SqliteRecordStore>, Error> SqliteRecordStore::open(const std::string& path,
                                                                        Clock clock) {
    using R = Result<std::unique_ptr<SqliteRecordStore>, Error>;

    auto db_result = storage::Database::open(path);
    if (db_result.is_err()) {
        return R::err(db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    storage::MigrationRunner runner(db, storage::REMOTE_EMULATION_MIGRATIONS);
    auto migrated = runner.migrate();
    if (migrated.is_err()) {
        return R::err(migrated.unwrap_err());
    }

    return R::ok(std::unique_ptr<SqliteRecordStore>(
        new SqliteRecordStore(std::move(db), "sqlite:" + path, std::move(clock))));
}

Result<void, Error> SqliteRecordStore::check_zone() {
    auto stmt_result = db_.prepare("SELECT exists_flag FROM remote_zone WHERE id = 1;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap() || stmt.column_int(0) == 0) {
        return Result<void, Error>::err(Error{"Record zone does not exist", ErrorCode::ZoneNotFound});
    }
    return Result<void, Error>::ok();
}

Result<RemoteRecord, Error> SqliteRecordStore::row_to_record(storage::Statement& stmt) {
    using R = Result<RemoteRecord, Error>;

    auto uuid = Uuid::parse(stmt.column_text(1));
    if (!uuid) {
        return R::err(Error{"Bad uuid in remote_records row", ErrorCode::DataCorruption});
    }
    auto fields = codec::decode_fields(stmt.column_text(4));
    if (fields.is_err()) return R::err(fields.unwrap_err());
    auto stamps = codec::decode_stamps(stmt.column_text(5));
    if (stamps.is_err()) return R::err(stamps.unwrap_err());

    return R::ok(RemoteRecord{
        .record_id = stmt.column_text(0),
        .uuid = *uuid,
        .record_type = stmt.column_text(2),
        .change_tag = stmt.column_text(3),
        .fields = std::move(fields).unwrap(),
        .field_stamps = std::move(stamps).unwrap(),
        .last_modified = Timestamp(stmt.column_int64(6)),
        .modified_at = Timestamp(stmt.column_int64(7))
    });
}

Result<std::optional<RemoteRecord>, Error> SqliteRecordStore::load(const std::string& record_id) {
    using R = Result<std::optional<RemoteRecord>, Error>;

    auto stmt_result = db_.prepare(std::string(kSelectColumns) + " WHERE record_id = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_all(record_id);
    if (bound.is_err()) {
        return R::err(bound.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return R::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return R::ok(std::nullopt);
    }
    return row_to_record(stmt).map([](RemoteRecord r) { return std::optional<RemoteRecord>(std::move(r)); });
}

Result<AccountStatus, Error> SqliteRecordStore::account_status() {
    return Result<AccountStatus, Error>::ok(AccountStatus::Available);
}

Result<RemoteRecord, Error> SqliteRecordStore::save_one(const RecordSave& save, SavePolicy policy) {
    using R = Result<RemoteRecord, Error>;

    auto existing = load(save.record.record_id);
    if (existing.is_err()) {
        return R::err(existing.unwrap_err());
    }

    int64_t counter = 0;
    int64_t newest = 0;
    auto query_result = db_.query(
        "SELECT z.tag_counter, COALESCE((SELECT MAX(modified_at) FROM remote_records), 0) "
        "FROM remote_zone z WHERE z.id = 1;",
        [&](storage::Statement& stmt) {
            counter = stmt.column_int64(0);
            newest = stmt.column_int64(1);
        });
    if (query_result.is_err()) {
        return R::err(query_result.unwrap_err());
    }

    const auto now = clock_();
    const Timestamp modified_at = now.millis() > newest ? now : Timestamp(newest + 1);
    auto saved = apply_save(existing.unwrap(), save, policy, "t" + std::to_string(counter + 1), modified_at);
    if (saved.is_err()) {
        return saved;
    }
    const auto& record = saved.unwrap();

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO remote_records (record_id, uuid, record_type, change_tag, fields_json,
                                    field_stamps_json, last_modified, modified_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(record_id) DO UPDATE SET
            uuid = excluded.uuid,
            record_type = excluded.record_type,
            change_tag = excluded.change_tag,
            fields_json = excluded.fields_json,
            field_stamps_json = excluded.field_stamps_json,
            last_modified = excluded.last_modified,
            modified_at = excluded.modified_at;
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto run_result = stmt.run(record.record_id, record.uuid.to_string(), record.record_type,
                               record.change_tag, codec::encode_fields(record.fields),
                               codec::encode_stamps(record.field_stamps),
                               record.last_modified.millis(), record.modified_at.millis());
    if (run_result.is_err()) {
        return R::err(run_result.unwrap_err());
    }

    auto counter_result = db_.execute("UPDATE remote_zone SET tag_counter = tag_counter + 1 WHERE id = 1;");
    if (counter_result.is_err()) {
        return R::err(counter_result.unwrap_err());
    }
    return saved;
}

Result<std::vector<SaveOutcome>, Error> SqliteRecordStore::save_records(
    const std::vector<RecordSave>& batch, SavePolicy policy) {
    using R = Result<std::vector<SaveOutcome>, Error>;

    std::lock_guard lock(mutex_);
    auto zone = check_zone();
    if (zone.is_err()) {
        return R::err(zone.unwrap_err());
    }

    std::vector<SaveOutcome> outcomes;
    outcomes.reserve(batch.size());
    for (const auto& save : batch) {
        // Each record commits on its own; a rejected record leaves no trace.
        auto saved = db_.transaction([&]() { return save_one(save, policy); });
        if (saved.is_err() && saved.unwrap_err().code == ErrorCode::StorageError) {
            return R::err(saved.unwrap_err());
        }
        outcomes.push_back(SaveOutcome{
            .record_id = save.record.record_id,
            .uuid = save.record.uuid,
            .result = std::move(saved)});
    }
    return R::ok(std::move(outcomes));
}

Result<QueryPage, Error> SqliteRecordStore::query_records(const RecordQuery& query) {
    using R = Result<QueryPage, Error>;

    std::lock_guard lock(mutex_);
    auto zone = check_zone();
    if (zone.is_err()) {
        return R::err(zone.unwrap_err());
    }

    int64_t after_millis = query.modified_after.millis();
    std::string after_id;
    if (query.cursor) {
        auto decoded = decode_cursor(*query.cursor);
        if (decoded.is_err()) {
            return R::err(decoded.unwrap_err());
        }
        const auto& position = decoded.unwrap();
        after_millis = std::max(after_millis, position.first.millis());
        if (position.first.millis() > query.modified_after.millis()) {
            after_id = position.second;
        }
    }

    const auto limit = static_cast<int64_t>(std::max<size_t>(query.limit, 1));
    std::vector<RemoteRecord> records;
    std::optional<Error> row_error;
    auto query_result = db_.query(
        std::string(kSelectColumns) +
            " WHERE (? = '' OR record_type = ?)"
            " AND (modified_at > ? OR (modified_at = ? AND ? <> '' AND record_id > ?))"
            " ORDER BY modified_at ASC, record_id ASC LIMIT ?;",
        [&](storage::Statement& stmt) {
            if (row_error) return;
            auto record = row_to_record(stmt);
            if (record.is_err()) {
                row_error = record.unwrap_err();
                return;
            }
            records.push_back(std::move(record).unwrap());
        },
        query.record_type, query.record_type, after_millis, after_millis, after_id, after_id, limit + 1);
    if (query_result.is_err()) {
        return R::err(query_result.unwrap_err());
    }
    if (row_error) {
        return R::err(*row_error);
    }

    QueryPage page;
    if (records.size() > static_cast<size_t>(limit)) {
        records.resize(static_cast<size_t>(limit));
        page.next_cursor = encode_cursor(records.back());
    }
    page.records = std::move(records);
    return R::ok(std::move(page));
}

Result<RemoteRecord, Error> SqliteRecordStore::fetch_record(const std::string& record_id) {
    using R = Result<RemoteRecord, Error>;

    std::lock_guard lock(mutex_);
    auto zone = check_zone();
    if (zone.is_err()) {
        return R::err(zone.unwrap_err());
    }
    auto loaded = load(record_id);
    if (loaded.is_err()) {
        return R::err(loaded.unwrap_err());
    }
    if (!loaded.unwrap()) {
        return R::err(Error{"No record " + record_id, ErrorCode::UnknownItem});
    }
    return R::ok(std::move(*loaded.unwrap()));
}

Result<void, Error> SqliteRecordStore::delete_record(const std::string& record_id) {
    std::lock_guard lock(mutex_);
    auto zone = check_zone();
    if (zone.is_err()) {
        return zone;
    }
    auto stmt_result = db_.prepare("DELETE FROM remote_records WHERE record_id = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto run_result = stmt.run(record_id);
    if (run_result.is_err()) {
        return run_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error{"No record " + record_id, ErrorCode::UnknownItem});
    }
    return Result<void, Error>::ok();
}

Result<SubscriptionHandle, Error> SqliteRecordStore::subscribe(const std::string& record_type,
                                                               Timestamp modified_after) {
    using R = Result<SubscriptionHandle, Error>;

    std::lock_guard lock(mutex_);
    auto handle = Uuid::generate().to_string();
    auto stmt_result = db_.prepare(
        "INSERT INTO remote_subscriptions (handle, record_type, modified_after) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto run_result = stmt.run(handle, record_type, modified_after.millis());
    if (run_result.is_err()) {
        return R::err(run_result.unwrap_err());
    }
    return R::ok(std::move(handle));
}

Result<void, Error> SqliteRecordStore::unsubscribe(const SubscriptionHandle& handle) {
    std::lock_guard lock(mutex_);
    auto stmt_result = db_.prepare("DELETE FROM remote_subscriptions WHERE handle = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto run_result = stmt.run(handle);
    if (run_result.is_err()) {
        return run_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(Error{"No subscription " + handle, ErrorCode::UnknownItem});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SqliteRecordStore::create_zone() {
    std::lock_guard lock(mutex_);
    auto result = db_.execute("UPDATE remote_zone SET exists_flag = 1 WHERE id = 1;");
    if (result.is_ok()) {
        qCInfo(tidesyncRemoteLog) << "Record zone ready in" << id_.c_str();
    }
    return result;
}

Result<void, Error> SqliteRecordStore::delete_zone() {
    std::lock_guard lock(mutex_);
    return db_.transaction([&]() -> Result<void, Error> {
        auto cleared = db_.execute("DELETE FROM remote_records;");
        if (cleared.is_err()) {
            return cleared;
        }
        return db_.execute("UPDATE remote_zone SET exists_flag = 0 WHERE id = 1;");
    });
}

} // namespace tidesync::remote
