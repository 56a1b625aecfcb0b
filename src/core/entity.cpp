#include "core/entity.hpp"

namespace tidesync {

std::optional<FieldKind> parse_kind(std::string_view name) {
    for (auto kind : {FieldKind::Empty, FieldKind::Text, FieldKind::Number, FieldKind::Tags,
                      FieldKind::Geo, FieldKind::Measurements, FieldKind::Instant}) {
        if (kind_name(kind) == name) return kind;
    }
    return std::nullopt;
}

std::string_view to_string(SyncStatus status) {
    switch (status) {
        case SyncStatus::Synced: return "synced";
        case SyncStatus::PendingUpload: return "pending_upload";
        case SyncStatus::PendingDownload: return "pending_download";
        case SyncStatus::Conflict: return "conflict";
        case SyncStatus::Error: return "error";
    }
    return "error";
}

std::optional<SyncStatus> parse_sync_status(std::string_view name) {
    for (auto status : {SyncStatus::Synced, SyncStatus::PendingUpload, SyncStatus::PendingDownload,
                        SyncStatus::Conflict, SyncStatus::Error}) {
        if (to_string(status) == name) return status;
    }
    return std::nullopt;
}

const FieldValue* Entity::field(const std::string& name) const {
    auto it = fields.find(name);
    return it == fields.end() ? nullptr : &it->second;
}

void Entity::set_field(const std::string& name, FieldValue value, Timestamp at) {
    if (std::holds_alternative<std::monostate>(value)) {
        fields.erase(name);
    } else {
        fields[name] = std::move(value);
    }
    field_stamps[name] = at;
    if (at > last_modified) {
        last_modified = at;
    }
}

Timestamp Entity::field_stamp(const std::string& name) const {
    auto it = field_stamps.find(name);
    return it == field_stamps.end() ? last_modified : it->second;
}

Entity make_entity(std::string entity_type, Timestamp now) {
    return Entity{
        .uuid = Uuid::generate(),
        .entity_type = std::move(entity_type),
        .record_id = std::nullopt,
        .change_tag = std::nullopt,
        .fields = {},
        .field_stamps = {},
        .sync_status = SyncStatus::PendingUpload,
        .last_modified = now,
        .created_at = now,
        .conflict_resolution_needed = false
    };
}

bool same_content(const Entity& a, const Entity& b) {
    return a.fields == b.fields;
}

} // namespace tidesync
