#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tidesync {

/**
 * Field value types - the content of an entity is a flat map of these.
 * The alternative held decides how conflict detection and merging treat
 * the field.
 */

struct GeoPoint {
    double latitude{0.0};
    double longitude{0.0};

    bool operator==(const GeoPoint&) const = default;
};

using TagSet = std::set<std::string>;
using MeasurementMap = std::map<std::string, double>;

/**
 * FieldValue - monostate means "no value" and is never stored.
 */
using FieldValue = std::variant<
    std::monostate,
    std::string,
    double,
    TagSet,
    GeoPoint,
    MeasurementMap,
    Timestamp
>;

enum class FieldKind {
    Empty,
    Text,
    Number,
    Tags,
    Geo,
    Measurements,
    Instant
};

[[nodiscard]] inline FieldKind kind_of(const FieldValue& value) {
    return std::visit([](const auto& v) -> FieldKind {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) return FieldKind::Empty;
        else if constexpr (std::is_same_v<T, std::string>) return FieldKind::Text;
        else if constexpr (std::is_same_v<T, double>) return FieldKind::Number;
        else if constexpr (std::is_same_v<T, TagSet>) return FieldKind::Tags;
        else if constexpr (std::is_same_v<T, GeoPoint>) return FieldKind::Geo;
        else if constexpr (std::is_same_v<T, MeasurementMap>) return FieldKind::Measurements;
        else if constexpr (std::is_same_v<T, Timestamp>) return FieldKind::Instant;
    }, value);
}

[[nodiscard]] constexpr std::string_view kind_name(FieldKind kind) {
    switch (kind) {
        case FieldKind::Empty: return "empty";
        case FieldKind::Text: return "text";
        case FieldKind::Number: return "number";
        case FieldKind::Tags: return "tags";
        case FieldKind::Geo: return "geo";
        case FieldKind::Measurements: return "measurements";
        case FieldKind::Instant: return "instant";
    }
    return "unknown";
}

[[nodiscard]] std::optional<FieldKind> parse_kind(std::string_view name);

using FieldMap = std::map<std::string, FieldValue>;

/**
 * Per-field modification stamps. A field without a stamp is treated as
 * modified at the entity's last_modified.
 */
using FieldStamps = std::map<std::string, Timestamp>;

enum class SyncStatus {
    Synced,
    PendingUpload,
    PendingDownload,
    Conflict,
    Error
};

[[nodiscard]] std::string_view to_string(SyncStatus status);
[[nodiscard]] std::optional<SyncStatus> parse_sync_status(std::string_view name);

/**
 * Entity - a domain record subject to offline-first sync.
 *
 * `uuid` is the client identity; `record_id` is the remote store's record
 * name and is empty until the first successful upload. An entity with
 * `conflict_resolution_needed` set is never uploaded and never hard-deleted.
 */
struct Entity {
    Uuid uuid;
    std::string entity_type;
    std::optional<std::string> record_id;
    std::optional<std::string> change_tag;
    FieldMap fields;
    FieldStamps field_stamps;
    SyncStatus sync_status{SyncStatus::PendingUpload};
    Timestamp last_modified;
    Timestamp created_at;
    bool conflict_resolution_needed{false};

    [[nodiscard]] const FieldValue* field(const std::string& name) const;

    /**
     * Local edit of one field: stamps the field and bumps last_modified.
     * Assigning std::monostate removes the field.
     */
    void set_field(const std::string& name, FieldValue value, Timestamp at);

    [[nodiscard]] Timestamp field_stamp(const std::string& name) const;

    bool operator==(const Entity&) const = default;
};

/**
 * Create a new, never-synced entity.
 */
[[nodiscard]] Entity make_entity(std::string entity_type, Timestamp now = Timestamp::now());

/**
 * Content equality: fields only, no sync metadata.
 */
[[nodiscard]] bool same_content(const Entity& a, const Entity& b);

} // namespace tidesync
