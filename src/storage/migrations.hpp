#pragma once

#include "storage/database.hpp"
#include "core/result.hpp"
#include <string>
#include <vector>

namespace tidesync::storage {

// One schema step. down_sql undoes up_sql; empty means irreversible.
struct Migration {
    int version;
    std::string name;
    std::string up_sql;
    std::string down_sql;
};

/**
 * Schema of the local entity store, in order.
 */
inline const std::vector<Migration> LOCAL_STORE_MIGRATIONS = {
    {
        .version = 1,
        .name = "entities",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS entities (
                uuid TEXT PRIMARY KEY,
                entity_type TEXT NOT NULL,
                record_id TEXT,
                change_tag TEXT,
                fields_json TEXT NOT NULL DEFAULT '{}',
                field_stamps_json TEXT NOT NULL DEFAULT '{}',
                sync_status TEXT NOT NULL,
                conflict_resolution_needed INTEGER NOT NULL DEFAULT 0,
                last_modified INTEGER NOT NULL,
                created_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_entities_status
                ON entities(sync_status, last_modified);
            CREATE INDEX IF NOT EXISTS idx_entities_conflict
                ON entities(conflict_resolution_needed) WHERE conflict_resolution_needed = 1;
            CREATE INDEX IF NOT EXISTS idx_entities_modified ON entities(last_modified);

            -- Last state known to be identical locally and remotely.
            CREATE TABLE IF NOT EXISTS entity_bases (
                uuid TEXT PRIMARY KEY REFERENCES entities(uuid) ON DELETE CASCADE,
                snapshot_json TEXT NOT NULL,
                captured_at INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS entity_bases;
            DROP TABLE IF EXISTS entities;
        )SQL"
    },
    {
        .version = 2,
        .name = "conflict_history",
        .up_sql = R"SQL(
            -- Audit trail; rows outlive the entity they describe.
            CREATE TABLE IF NOT EXISTS conflict_history (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                entity_uuid TEXT NOT NULL,
                occurred_at INTEGER NOT NULL,
                resolved_at INTEGER,
                resolution_strategy TEXT NOT NULL,
                resolution_type TEXT NOT NULL DEFAULT '',
                local_snapshot TEXT NOT NULL DEFAULT '',
                remote_snapshot TEXT NOT NULL DEFAULT '',
                merged_snapshot TEXT NOT NULL DEFAULT '',
                notes TEXT NOT NULL DEFAULT ''
            );
            CREATE UNIQUE INDEX IF NOT EXISTS idx_conflict_history_open
                ON conflict_history(entity_uuid) WHERE resolved_at IS NULL;
            CREATE INDEX IF NOT EXISTS idx_conflict_history_entity
                ON conflict_history(entity_uuid, occurred_at);
            CREATE INDEX IF NOT EXISTS idx_conflict_history_strategy
                ON conflict_history(resolution_strategy);
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS conflict_history;
        )SQL"
    }
};

/**
 * Schema of the SQLite-backed remote store emulation.
 */
inline const std::vector<Migration> REMOTE_EMULATION_MIGRATIONS = {
    {
        .version = 1,
        .name = "remote_records",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS remote_records (
                record_id TEXT PRIMARY KEY,
                uuid TEXT NOT NULL,
                record_type TEXT NOT NULL,
                change_tag TEXT NOT NULL,
                fields_json TEXT NOT NULL,
                field_stamps_json TEXT NOT NULL,
                last_modified INTEGER NOT NULL,
                modified_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_remote_records_modified
                ON remote_records(record_type, modified_at);

            CREATE TABLE IF NOT EXISTS remote_zone (
                id INTEGER PRIMARY KEY CHECK (id = 1),
                exists_flag INTEGER NOT NULL,
                tag_counter INTEGER NOT NULL DEFAULT 0
            );
            INSERT OR IGNORE INTO remote_zone (id, exists_flag, tag_counter) VALUES (1, 1, 0);

            CREATE TABLE IF NOT EXISTS remote_subscriptions (
                handle TEXT PRIMARY KEY,
                record_type TEXT NOT NULL,
                modified_after INTEGER NOT NULL
            );
        )SQL",
        .down_sql = R"SQL(
            DROP TABLE IF EXISTS remote_subscriptions;
            DROP TABLE IF EXISTS remote_zone;
            DROP TABLE IF EXISTS remote_records;
        )SQL"
    }
};

/**
 * MigrationRunner - applies a schema's steps to a database and records
 * each applied version in schema_migrations.
 *
 * The local store and the remote emulation keep separate step lists; a
 * runner only ever looks at the list it was given.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db,
                             const std::vector<Migration>& migrations = LOCAL_STORE_MIGRATIONS)
        : db_(db), migrations_(migrations) {}

    // Applies every step newer than the recorded version, in one transaction.
    [[nodiscard]] Result<void> migrate();

    // Undoes the newest applied step. A fresh database is left alone.
    [[nodiscard]] Result<void> rollback();

    [[nodiscard]] Result<int> current_version();

    [[nodiscard]] int latest_version() const {
        return migrations_.empty() ? 0 : migrations_.back().version;
    }

private:
    [[nodiscard]] Result<void> apply(const Migration& m);
    [[nodiscard]] Result<void> revert(const Migration& m);

    Database& db_;
    const std::vector<Migration>& migrations_;
};

// Brings a local entity store up to the latest schema.
[[nodiscard]] inline Result<void> initialize_database(Database& db) {
    MigrationRunner runner(db);
    return runner.migrate();
}

} // namespace tidesync::storage
