#pragma once

#include "storage/database.hpp"
#include "core/types.hpp"
#include "core/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tidesync::storage {

/**
 * ConflictHistoryEntry - audit record of one detected conflict.
 *
 * Snapshots are JSON entity documents (see core/entity_codec.hpp); empty
 * when the side was not available.
 */
struct ConflictHistoryEntry {
    int64_t id{0};
    Uuid entity_uuid;
    Timestamp occurred_at;
    std::optional<Timestamp> resolved_at;
    std::string resolution_strategy;
    std::string resolution_type;
    std::string local_snapshot;
    std::string remote_snapshot;
    std::string merged_snapshot;
    std::string notes;

    [[nodiscard]] bool is_resolved() const { return resolved_at.has_value(); }
};

/**
 * What a resolution wrote, for the audit trail.
 */
struct ResolutionRecord {
    std::string strategy;
    std::string resolution_type;
    std::string local_snapshot;
    std::string remote_snapshot;
    std::string merged_snapshot;
    std::string notes;
};

/**
 * ConflictHistoryRepository - conflict audit trail.
 *
 * At most one unresolved entry exists per entity (enforced by a partial
 * unique index). Entries are never deleted.
 */
class ConflictHistoryRepository {
public:
    explicit ConflictHistoryRepository(Database& db) : db_(db) {}

    /**
     * Open (or refresh) the unresolved entry for an entity. An existing open
     * entry keeps its id and occurred_at; its snapshots and strategy are
     * replaced. Returns the entry id.
     */
    [[nodiscard]] Result<int64_t, Error> record_detected(const Uuid& entity_uuid,
                                                         Timestamp occurred_at,
                                                         const ResolutionRecord& detail);

    /**
     * Close the open entry for an entity. Without an open entry a row that
     * is opened and resolved at `resolved_at` is inserted. Returns the id.
     */
    [[nodiscard]] Result<int64_t, Error> record_resolution(const Uuid& entity_uuid,
                                                           Timestamp resolved_at,
                                                           const ResolutionRecord& detail);

    [[nodiscard]] Result<std::optional<ConflictHistoryEntry>, Error> open_entry(const Uuid& entity_uuid);

    /**
     * All entries for an entity, newest first.
     */
    [[nodiscard]] Result<std::vector<ConflictHistoryEntry>, Error> history_for(const Uuid& entity_uuid);

    [[nodiscard]] Result<std::vector<ConflictHistoryEntry>, Error> unresolved();

    [[nodiscard]] Result<std::vector<ConflictHistoryEntry>, Error> by_strategy(const std::string& strategy);

private:
    Database& db_;

    [[nodiscard]] Result<ConflictHistoryEntry, Error> row_to_entry(Statement& stmt);
    [[nodiscard]] Result<std::vector<ConflictHistoryEntry>, Error> select_many(
        const std::string& where_and_order, const std::optional<std::string>& param);
};

} // namespace tidesync::storage
