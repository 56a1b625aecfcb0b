#include "sync/record_mapping.hpp"

#include <set>

namespace tidesync::sync {

std::string record_id_for(const Entity& entity) {
    return entity.record_id ? *entity.record_id : entity.uuid.to_string();
}

remote::RemoteRecord to_remote_record(const Entity& entity) {
    return remote::RemoteRecord{
        .record_id = record_id_for(entity),
        .uuid = entity.uuid,
        .record_type = entity.entity_type,
        .change_tag = entity.change_tag,
        .fields = entity.fields,
        .field_stamps = entity.field_stamps,
        .last_modified = entity.last_modified,
        .modified_at = Timestamp{}
    };
}

Entity entity_from_remote(const remote::RemoteRecord& record, const Entity* existing) {
    Entity entity{
        .uuid = record.uuid,
        .entity_type = record.record_type,
        .record_id = record.record_id,
        .change_tag = record.change_tag,
        .fields = record.fields,
        .field_stamps = record.field_stamps,
        .sync_status = SyncStatus::Synced,
        .last_modified = record.last_modified,
        .created_at = existing ? existing->created_at : record.last_modified,
        .conflict_resolution_needed = false
    };
    if (existing) {
        entity.uuid = existing->uuid;
    }
    return entity;
}

std::vector<std::string> changed_keys(const Entity& current, const Entity* base) {
    std::set<std::string> keys;
    if (!base) {
        for (const auto& [name, _] : current.fields) keys.insert(name);
        return {keys.begin(), keys.end()};
    }

    for (const auto& [name, value] : current.fields) {
        const auto* before = base->field(name);
        if (!before || *before != value) keys.insert(name);
    }
    // Removed fields must reach the server as removals.
    for (const auto& [name, _] : base->fields) {
        if (!current.field(name)) keys.insert(name);
    }
    return {keys.begin(), keys.end()};
}

} // namespace tidesync::sync
