#include "storage/migrations.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"

namespace tidesync::storage {

namespace {

Error step_failed(const char* action, const Migration& m, const Error& cause) {
    return Error{std::string(action) + " schema step " + std::to_string(m.version) + " (" + m.name +
                     "): " + cause.message,
                 ErrorCode::StorageError, cause.detail};
}

} // namespace

Result<int> MigrationRunner::current_version() {
    auto ledger = db_.execute(
        "CREATE TABLE IF NOT EXISTS schema_migrations ("
        " version INTEGER PRIMARY KEY,"
        " name TEXT NOT NULL,"
        " applied_at INTEGER NOT NULL);");
    if (ledger.is_err()) return Result<int>::err(ledger.unwrap_err());

    int version = 0;
    auto read = db_.query("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;",
                          [&](Statement& row) { version = row.column_int(0); });
    if (read.is_err()) return Result<int>::err(read.unwrap_err());
    return Result<int>::ok(version);
}

Result<void> MigrationRunner::apply(const Migration& m) {
    if (auto created = db_.execute(m.up_sql); created.is_err()) {
        return Result<void>::err(step_failed("apply", m, created.unwrap_err()));
    }
    auto stmt_result = db_.prepare("INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) return Result<void>::err(stmt_result.unwrap_err());
    auto stmt = std::move(stmt_result).unwrap();
    return stmt.run(m.version, m.name, Timestamp::now().millis());
}

Result<void> MigrationRunner::revert(const Migration& m) {
    if (m.down_sql.empty()) {
        return Result<void>::err(Error{"schema step " + std::to_string(m.version) + " cannot be undone",
                                       ErrorCode::InvalidArguments});
    }
    if (auto dropped = db_.execute(m.down_sql); dropped.is_err()) {
        return Result<void>::err(step_failed("revert", m, dropped.unwrap_err()));
    }
    auto stmt_result = db_.prepare("DELETE FROM schema_migrations WHERE version = ?;");
    if (stmt_result.is_err()) return Result<void>::err(stmt_result.unwrap_err());
    auto stmt = std::move(stmt_result).unwrap();
    return stmt.run(m.version);
}

Result<void> MigrationRunner::migrate() {
    auto recorded = current_version();
    if (recorded.is_err()) return Result<void>::err(recorded.unwrap_err());
    const int from = recorded.unwrap();
    if (from >= latest_version()) return Result<void>::ok();

    auto migrated = db_.transaction([&]() -> Result<void> {
        for (const auto& m : migrations_) {
            if (m.version <= from) continue;
            if (auto applied = apply(m); applied.is_err()) return applied;
        }
        return Result<void>::ok();
    });
    if (migrated.is_ok()) {
        qCInfo(tidesyncStorageLog) << "schema migrated from" << from << "to" << latest_version();
    }
    return migrated;
}

Result<void> MigrationRunner::rollback() {
    auto recorded = current_version();
    if (recorded.is_err()) return Result<void>::err(recorded.unwrap_err());
    const int newest = recorded.unwrap();
    if (newest == 0) return Result<void>::ok();

    for (const auto& m : migrations_) {
        if (m.version == newest) {
            return db_.transaction([&] { return revert(m); });
        }
    }
    return Result<void>::err(Error{"schema version " + std::to_string(newest) + " is not known to this build",
                                   ErrorCode::DataCorruption});
}

} // namespace tidesync::storage
