#include "storage/conflict_history_repository.hpp"

namespace tidesync::storage {

namespace {

constexpr const char* kSelectColumns = R"SQL(
    SELECT id, entity_uuid, occurred_at, resolved_at, resolution_strategy, resolution_type,
           local_snapshot, remote_snapshot, merged_snapshot, notes
    FROM conflict_history
)SQL";

} // namespace

Result<ConflictHistoryEntry, Error> ConflictHistoryRepository::row_to_entry(Statement& stmt) {
    auto uuid = Uuid::parse(stmt.column_text(1));
    if (!uuid) {
        return Result<ConflictHistoryEntry, Error>::err(
            Error{"Bad entity_uuid in conflict_history row", ErrorCode::DataCorruption});
    }

    return Result<ConflictHistoryEntry, Error>::ok(ConflictHistoryEntry{
        .id = stmt.column_int64(0),
        .entity_uuid = *uuid,
        .occurred_at = Timestamp(stmt.column_int64(2)),
        .resolved_at = stmt.column_is_null(3)
            ? std::nullopt
            : std::optional<Timestamp>(Timestamp(stmt.column_int64(3))),
        .resolution_strategy = stmt.column_text(4),
        .resolution_type = stmt.column_text(5),
        .local_snapshot = stmt.column_text(6),
        .remote_snapshot = stmt.column_text(7),
        .merged_snapshot = stmt.column_text(8),
        .notes = stmt.column_text(9)
    });
}

Result<std::vector<ConflictHistoryEntry>, Error> ConflictHistoryRepository::select_many(
    const std::string& where_and_order,
    const std::optional<std::string>& param
) {
    using R = Result<std::vector<ConflictHistoryEntry>, Error>;

    auto stmt_result = db_.prepare(std::string(kSelectColumns) + where_and_order);
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    if (param) {
        auto bound = stmt.bind_all(*param);
        if (bound.is_err()) {
            return R::err(bound.unwrap_err());
        }
    }

    std::vector<ConflictHistoryEntry> entries;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return R::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;

        auto entry = row_to_entry(stmt);
        if (entry.is_err()) {
            return R::err(entry.unwrap_err());
        }
        entries.push_back(std::move(entry).unwrap());
    }
    return R::ok(std::move(entries));
}

Result<std::optional<ConflictHistoryEntry>, Error> ConflictHistoryRepository::open_entry(
    const Uuid& entity_uuid
) {
    auto entries = select_many(" WHERE entity_uuid = ? AND resolved_at IS NULL;", entity_uuid.to_string());
    if (entries.is_err()) {
        return Result<std::optional<ConflictHistoryEntry>, Error>::err(entries.unwrap_err());
    }
    auto& rows = entries.unwrap();
    if (rows.empty()) {
        return Result<std::optional<ConflictHistoryEntry>, Error>::ok(std::nullopt);
    }
    return Result<std::optional<ConflictHistoryEntry>, Error>::ok(std::move(rows.front()));
}

Result<int64_t, Error> ConflictHistoryRepository::record_detected(
    const Uuid& entity_uuid,
    Timestamp occurred_at,
    const ResolutionRecord& detail
) {
    using R = Result<int64_t, Error>;

    auto open = open_entry(entity_uuid);
    if (open.is_err()) {
        return R::err(open.unwrap_err());
    }

    if (const auto& existing = open.unwrap()) {
        auto stmt_result = db_.prepare(R"SQL(
            UPDATE conflict_history
            SET resolution_strategy = ?, resolution_type = ?, local_snapshot = ?,
                remote_snapshot = ?, merged_snapshot = ?, notes = ?
            WHERE id = ?;
        )SQL");
        if (stmt_result.is_err()) {
            return R::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto run_result = stmt.run(detail.strategy, detail.resolution_type, detail.local_snapshot,
                                   detail.remote_snapshot, detail.merged_snapshot, detail.notes,
                                   existing->id);
        if (run_result.is_err()) {
            return R::err(run_result.unwrap_err());
        }
        return R::ok(existing->id);
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO conflict_history (entity_uuid, occurred_at, resolved_at, resolution_strategy,
                                      resolution_type, local_snapshot, remote_snapshot,
                                      merged_snapshot, notes)
        VALUES (?, ?, NULL, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto run_result = stmt.run(entity_uuid.to_string(), occurred_at.millis(), detail.strategy,
                               detail.resolution_type, detail.local_snapshot, detail.remote_snapshot,
                               detail.merged_snapshot, detail.notes);
    if (run_result.is_err()) {
        return R::err(run_result.unwrap_err());
    }
    return R::ok(db_.last_insert_rowid());
}

Result<int64_t, Error> ConflictHistoryRepository::record_resolution(
    const Uuid& entity_uuid,
    Timestamp resolved_at,
    const ResolutionRecord& detail
) {
    using R = Result<int64_t, Error>;

    auto open = open_entry(entity_uuid);
    if (open.is_err()) {
        return R::err(open.unwrap_err());
    }

    if (const auto& existing = open.unwrap()) {
        // Keep detection-time snapshots when the resolution did not supply its own.
        auto stmt_result = db_.prepare(R"SQL(
            UPDATE conflict_history
            SET resolved_at = ?, resolution_strategy = ?, resolution_type = ?,
                local_snapshot = CASE WHEN ? = '' THEN local_snapshot ELSE ? END,
                remote_snapshot = CASE WHEN ? = '' THEN remote_snapshot ELSE ? END,
                merged_snapshot = ?, notes = ?
            WHERE id = ? AND resolved_at IS NULL;
        )SQL");
        if (stmt_result.is_err()) {
            return R::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto run_result = stmt.run(resolved_at.millis(), detail.strategy, detail.resolution_type,
                                   detail.local_snapshot, detail.local_snapshot,
                                   detail.remote_snapshot, detail.remote_snapshot,
                                   detail.merged_snapshot, detail.notes, existing->id);
        if (run_result.is_err()) {
            return R::err(run_result.unwrap_err());
        }
        return R::ok(existing->id);
    }

    auto stmt_result = db_.prepare(R"SQL(
        INSERT INTO conflict_history (entity_uuid, occurred_at, resolved_at, resolution_strategy,
                                      resolution_type, local_snapshot, remote_snapshot,
                                      merged_snapshot, notes)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);
    )SQL");
    if (stmt_result.is_err()) {
        return R::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto run_result = stmt.run(entity_uuid.to_string(), resolved_at.millis(), resolved_at.millis(),
                               detail.strategy, detail.resolution_type, detail.local_snapshot,
                               detail.remote_snapshot, detail.merged_snapshot, detail.notes);
    if (run_result.is_err()) {
        return R::err(run_result.unwrap_err());
    }
    return R::ok(db_.last_insert_rowid());
}

Result<std::vector<ConflictHistoryEntry>, Error> ConflictHistoryRepository::history_for(
    const Uuid& entity_uuid
) {
    return select_many(" WHERE entity_uuid = ? ORDER BY occurred_at DESC, id DESC;",
                       entity_uuid.to_string());
}

Result<std::vector<ConflictHistoryEntry>, Error> ConflictHistoryRepository::unresolved() {
    return select_many(" WHERE resolved_at IS NULL ORDER BY occurred_at ASC, id ASC;", std::nullopt);
}

Result<std::vector<ConflictHistoryEntry>, Error> ConflictHistoryRepository::by_strategy(
    const std::string& strategy
) {
    return select_many(" WHERE resolution_strategy = ? ORDER BY occurred_at DESC, id DESC;", strategy);
}

} // namespace tidesync::storage
