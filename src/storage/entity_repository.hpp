#pragma once

#include "storage/database.hpp"
#include "core/entity.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace tidesync::storage {

/**
 * EntityRepository - durable store of synced entities and their base
 * snapshots.
 *
 * Not thread-safe: one repository (and one Database) per serialized
 * execution context.
 */
class EntityRepository {
public:
    explicit EntityRepository(Database& db) : db_(db) {}

    /**
     * Insert or replace the full entity row.
     */
    [[nodiscard]] Result<void, Error> upsert(const Entity& entity);

    [[nodiscard]] Result<std::optional<Entity>, Error> get(const Uuid& uuid);

    /**
     * Entities whose status is not synced, oldest last_modified first.
     */
    [[nodiscard]] Result<std::vector<Entity>, Error> fetch_pending_sync();

    /**
     * Entities eligible for upload: pending upload and not flagged,
     * oldest first. A limit of 0 means no limit.
     */
    [[nodiscard]] Result<std::vector<Entity>, Error> fetch_pending_upload(int limit = 0);

    /**
     * Entities flagged conflict_resolution_needed, oldest first.
     */
    [[nodiscard]] Result<std::vector<Entity>, Error> fetch_conflicts();

    /**
     * Entities with from <= last_modified <= to, oldest first.
     */
    [[nodiscard]] Result<std::vector<Entity>, Error> fetch_in_range(Timestamp from, Timestamp to);

    /**
     * Set status to pending upload and stamp last_modified. Leaves the
     * change tag alone. Fails with UnknownItem when the entity is missing.
     */
    [[nodiscard]] Result<void, Error> mark_for_sync(const Uuid& uuid, Timestamp now);

    /**
     * Hard delete. Refused while the entity has an unresolved conflict.
     */
    [[nodiscard]] Result<void, Error> remove(const Uuid& uuid);

    /**
     * Forget everything the remote store knew: clears change tags, conflict
     * flags and base snapshots, and marks every entity pending upload.
     * Returns the number of entities affected.
     */
    [[nodiscard]] Result<int, Error> reset_remote_state(Timestamp now);

    [[nodiscard]] Result<int, Error> count_pending_sync();
    [[nodiscard]] Result<int, Error> count_conflicts();

    // Base snapshots

    [[nodiscard]] Result<void, Error> save_base(const Entity& base, Timestamp captured_at);
    [[nodiscard]] Result<std::optional<Entity>, Error> get_base(const Uuid& uuid);

private:
    Database& db_;

    [[nodiscard]] Result<Entity, Error> row_to_entity(Statement& stmt);
    [[nodiscard]] Result<std::vector<Entity>, Error> select_many(const std::string& where_and_order);
    [[nodiscard]] Result<int, Error> count_where(const std::string& where);
};

} // namespace tidesync::storage
