#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <string>
#include <string_view>

namespace tidesync::codec {

/**
 * Compact JSON snapshots of field maps and entities.
 *
 * Every value is written as {"kind": "<kind>", "value": ...} so that the
 * variant alternative survives a round trip (a text "1.5" stays text).
 * Used for the entity table columns, base snapshots, conflict history
 * audit snapshots and the SQLite remote emulation.
 */

[[nodiscard]] QJsonValue field_value_to_json(const FieldValue& value);
[[nodiscard]] Result<FieldValue, Error> field_value_from_json(const QJsonValue& json);

[[nodiscard]] std::string encode_fields(const FieldMap& fields);
[[nodiscard]] Result<FieldMap, Error> decode_fields(std::string_view json);

[[nodiscard]] std::string encode_stamps(const FieldStamps& stamps);
[[nodiscard]] Result<FieldStamps, Error> decode_stamps(std::string_view json);

[[nodiscard]] QJsonObject entity_to_json(const Entity& entity);
[[nodiscard]] Result<Entity, Error> entity_from_json(const QJsonObject& json);

[[nodiscard]] std::string encode_entity(const Entity& entity);
[[nodiscard]] Result<Entity, Error> decode_entity(std::string_view json);

} // namespace tidesync::codec
