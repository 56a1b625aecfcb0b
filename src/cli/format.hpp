#pragma once

#include "core/entity.hpp"
#include "storage/conflict_history_repository.hpp"
#include "sync/sync_orchestrator.hpp"

#include <QString>

#include <optional>
#include <string>
#include <vector>

namespace tidesync::cli {

struct StatusSnapshot {
    std::string store_id;
    std::string strategy;
    int pending{0};
    int conflicts{0};
    Timestamp watermark;
    std::optional<Timestamp> last_sync;
    std::optional<Timestamp> last_background_sync;
};

// Text output is line oriented and stable so scripts can grep it.

// uuid, type, status and one "  name: value" line per field.
[[nodiscard]] QString format_entity(const Entity& entity);
[[nodiscard]] QString format_entity_json(const Entity& entity);

// One "<uuid>  <type>  <last modified>" line per entity, or "No conflicts".
[[nodiscard]] QString format_conflicts(const std::vector<Entity>& entities);
[[nodiscard]] QString format_conflicts_json(const std::vector<Entity>& entities);

[[nodiscard]] QString format_history(const std::vector<storage::ConflictHistoryEntry>& entries);
[[nodiscard]] QString format_history_json(const std::vector<storage::ConflictHistoryEntry>& entries);

[[nodiscard]] QString format_status(const StatusSnapshot& status);
[[nodiscard]] QString format_status_json(const StatusSnapshot& status);

[[nodiscard]] QString format_sync_result(const sync::SyncResult& result);
[[nodiscard]] QString format_sync_result_json(const sync::SyncResult& result);

} // namespace tidesync::cli
