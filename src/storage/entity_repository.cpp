#include "storage/entity_repository.hpp"
#include "core/entity_codec.hpp"

namespace tidesync::storage {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT uuid, entity_type, record_id, change_tag, fields_json, field_stamps_json,
           sync_status, conflict_resolution_needed, last_modified, created_at
    FROM entities
)SQL";

std::optional<std::string> optional_text(Statement& stmt, int index) {
    if (stmt.column_is_null(index)) return std::nullopt;
    return stmt.column_text(index);
}

} // namespace

Result<Entity, Error> EntityRepository::row_to_entity(Statement& stmt) {
    using R = Result<Entity, Error>;

    auto uuid = Uuid::parse(stmt.column_text(0));
    if (!uuid) {
        return R::err(Error{"Bad uuid in entities row: " + stmt.column_text(0), ErrorCode::DataCorruption});
    }
    auto status = parse_sync_status(stmt.column_text(6));
    if (!status) {
        return R::err(Error{"Bad sync_status in entities row: " + stmt.column_text(6), ErrorCode::DataCorruption});
    }
    auto fields = codec::decode_fields(stmt.column_text(4));
    if (fields.is_err()) return R::err(fields.unwrap_err());
    auto stamps = codec::decode_stamps(stmt.column_text(5));
    if (stamps.is_err()) return R::err(stamps.unwrap_err());

    return R::ok(Entity{
        .uuid = *uuid,
        .entity_type = stmt.column_text(1),
        .record_id = optional_text(stmt, 2),
        .change_tag = optional_text(stmt, 3),
        .fields = std::move(fields).unwrap(),
        .field_stamps = std::move(stamps).unwrap(),
        .sync_status = *status,
        .last_modified = Timestamp(stmt.column_int64(8)),
        .created_at = Timestamp(stmt.column_int64(9)),
        .conflict_resolution_needed = stmt.column_int(7) != 0
    });
}

Result<void, Error> EntityRepository::upsert(const Entity& entity) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO entities (uuid, entity_type, record_id, change_tag, fields_json,
                              field_stamps_json, sync_status, conflict_resolution_needed,
                              last_modified, created_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        ON CONFLICT(uuid) DO UPDATE SET
            entity_type = excluded.entity_type,
            record_id = excluded.record_id,
            change_tag = excluded.change_tag,
            fields_json = excluded.fields_json,
            field_stamps_json = excluded.field_stamps_json,
            sync_status = excluded.sync_status,
            conflict_resolution_needed = excluded.conflict_resolution_needed,
            last_modified = excluded.last_modified,
            created_at = excluded.created_at;
    )SQL");

    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    return stmt.run(entity.uuid.to_string(),
                    entity.entity_type,
                    entity.record_id,
                    entity.change_tag,
                    codec::encode_fields(entity.fields),
                    codec::encode_stamps(entity.field_stamps),
                    std::string(to_string(entity.sync_status)),
                    entity.conflict_resolution_needed ? 1 : 0,
                    entity.last_modified.millis(),
                    entity.created_at.millis());
}

Result<std::optional<Entity>, Error> EntityRepository::get(const Uuid& uuid) {
    using R = Result<std::optional<Entity>, Error>;

    auto stmt_result = db_.prepare(std::string(kSelectColumns) + " WHERE uuid = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_all(uuid.to_string());
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

    return row_to_entity(stmt).map([](Entity e) { return std::optional<Entity>(std::move(e)); });
}

Result<std::vector<Entity>, Error> EntityRepository::select_many(const std::string& where_and_order) {
    using R = Result<std::vector<Entity>, Error>;

    std::vector<Entity> entities;
    std::optional<Error> row_error;

    auto query_result = db_.query(std::string(kSelectColumns) + where_and_order,
        [&](Statement& stmt) {
            if (row_error) return;
            auto entity = row_to_entity(stmt);
            if (entity.is_err()) {
                row_error = entity.unwrap_err();
                return;
            }
            entities.push_back(std::move(entity).unwrap());
        });

    if (query_result.is_err()) {
        return R::err(query_result.unwrap_err());
    }
    if (row_error) {
        return R::err(*row_error);
    }
    return R::ok(std::move(entities));
}

Result<std::vector<Entity>, Error> EntityRepository::fetch_pending_sync() {
    return select_many(" WHERE sync_status <> 'synced' ORDER BY last_modified ASC, uuid ASC;");
}

Result<std::vector<Entity>, Error> EntityRepository::fetch_pending_upload(int limit) {
    std::string sql = " WHERE sync_status = 'pending_upload' AND conflict_resolution_needed = 0"
                      " ORDER BY last_modified ASC, uuid ASC";
    if (limit > 0) {
        sql += " LIMIT " + std::to_string(limit);
    }
    return select_many(sql + ";");
}

Result<std::vector<Entity>, Error> EntityRepository::fetch_conflicts() {
    return select_many(" WHERE conflict_resolution_needed = 1 ORDER BY last_modified ASC, uuid ASC;");
}

Result<std::vector<Entity>, Error> EntityRepository::fetch_in_range(Timestamp from, Timestamp to) {
    using R = Result<std::vector<Entity>, Error>;

    std::vector<Entity> entities;
    std::optional<Error> row_error;

    auto query_result = db_.query(
        std::string(kSelectColumns) +
            " WHERE last_modified >= ? AND last_modified <= ? ORDER BY last_modified ASC, uuid ASC;",
        [&](Statement& stmt) {
            if (row_error) return;
            auto entity = row_to_entity(stmt);
            if (entity.is_err()) {
                row_error = entity.unwrap_err();
                return;
            }
            entities.push_back(std::move(entity).unwrap());
        },
        from.millis(), to.millis());

    if (query_result.is_err()) {
        return R::err(query_result.unwrap_err());
    }
    if (row_error) {
        return R::err(*row_error);
    }
    return R::ok(std::move(entities));
}

Result<void, Error> EntityRepository::mark_for_sync(const Uuid& uuid, Timestamp now) {
    auto stmt_result = db_.prepare(R"SQL(
        UPDATE entities SET sync_status = 'pending_upload', last_modified = ?
        WHERE uuid = ?;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto run_result = stmt.run(now.millis(), uuid.to_string());
    if (run_result.is_err()) {
        return run_result;
    }
    if (db_.changes() == 0) {
        return Result<void, Error>::err(
            Error{"No entity " + uuid.to_string(), ErrorCode::UnknownItem});
    }
    return Result<void, Error>::ok();
}

Result<void, Error> EntityRepository::remove(const Uuid& uuid) {
    auto existing = get(uuid);
    if (existing.is_err()) {
        return Result<void, Error>::err(existing.unwrap_err());
    }
    if (!existing.unwrap()) {
        return Result<void, Error>::err(
            Error{"No entity " + uuid.to_string(), ErrorCode::UnknownItem});
    }
    if (existing.unwrap()->conflict_resolution_needed) {
        return Result<void, Error>::err(Error{
            "Entity " + uuid.to_string() + " has an unresolved conflict and cannot be deleted",
            ErrorCode::InvalidArguments});
    }

    auto stmt_result = db_.prepare("DELETE FROM entities WHERE uuid = ?;");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return stmt.run(uuid.to_string());
}

Result<int, Error> EntityRepository::reset_remote_state(Timestamp now) {
    return db_.transaction([&]() -> Result<int, Error> {
        auto stmt_result = db_.prepare(R"SQL(
            UPDATE entities
            SET change_tag = NULL, sync_status = 'pending_upload', conflict_resolution_needed = 0,
                last_modified = MAX(last_modified, ?);
        )SQL");
        if (stmt_result.is_err()) {
            return Result<int, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto run_result = stmt.run(now.millis());
        if (run_result.is_err()) {
            return Result<int, Error>::err(run_result.unwrap_err());
        }
        const int affected = db_.changes();

        auto cleared = db_.execute("DELETE FROM entity_bases;");
        if (cleared.is_err()) {
            return Result<int, Error>::err(cleared.unwrap_err());
        }
        return Result<int, Error>::ok(affected);
    });
}

Result<int, Error> EntityRepository::count_where(const std::string& where) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM entities WHERE " + where + ";");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<int, Error> EntityRepository::count_pending_sync() {
    return count_where("sync_status <> 'synced'");
}

Result<int, Error> EntityRepository::count_conflicts() {
    return count_where("conflict_resolution_needed = 1");
}

Result<void, Error> EntityRepository::save_base(const Entity& base, Timestamp captured_at) {
    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO entity_bases (uuid, snapshot_json, captured_at)
        VALUES (?, ?, ?)
        ON CONFLICT(uuid) DO UPDATE SET
            snapshot_json = excluded.snapshot_json,
            captured_at = excluded.captured_at;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    return stmt.run(base.uuid.to_string(), codec::encode_entity(base), captured_at.millis());
}

Result<std::optional<Entity>, Error> EntityRepository::get_base(const Uuid& uuid) {
    using R = Result<std::optional<Entity>, Error>;

    auto stmt_result = db_.prepare("SELECT snapshot_json FROM entity_bases WHERE uuid = ?;");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_all(uuid.to_string());
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
    return codec::decode_entity(stmt.column_text(0))
        .map([](Entity e) { return std::optional<Entity>(std::move(e)); });
}

} // namespace tidesync::storage
