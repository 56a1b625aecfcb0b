#include "core/entity_codec.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QString>

namespace tidesync::codec {

namespace {

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

Error corrupt(const std::string& what) {
    return Error{"Malformed snapshot: " + what, ErrorCode::DataCorruption};
}

std::string to_compact(const QJsonObject& obj) {
    return QJsonDocument(obj).toJson(QJsonDocument::Compact).toStdString();
}

Result<QJsonObject, Error> parse_object(std::string_view json) {
    const QByteArray bytes(json.data(), static_cast<qsizetype>(json.size()));
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(bytes, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<QJsonObject, Error>::err(corrupt(err.errorString().toStdString()));
    }
    return Result<QJsonObject, Error>::ok(doc.object());
}

std::optional<std::string> optional_text(const QJsonObject& obj, const char* key) {
    const auto v = obj.value(QLatin1String(key));
    if (!v.isString()) return std::nullopt;
    return v.toString().toStdString();
}

void put_optional(QJsonObject& obj, const char* key, const std::optional<std::string>& value) {
    if (value) {
        obj.insert(QLatin1String(key), qstr(*value));
    } else {
        obj.insert(QLatin1String(key), QJsonValue::Null);
    }
}

} // namespace

QJsonValue field_value_to_json(const FieldValue& value) {
    QJsonObject obj;
    obj.insert(QStringLiteral("kind"), QString::fromLatin1(kind_name(kind_of(value)).data()));

    std::visit([&obj](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            obj.insert(QStringLiteral("value"), QJsonValue::Null);
        } else if constexpr (std::is_same_v<T, std::string>) {
            obj.insert(QStringLiteral("value"), qstr(v));
        } else if constexpr (std::is_same_v<T, double>) {
            obj.insert(QStringLiteral("value"), v);
        } else if constexpr (std::is_same_v<T, TagSet>) {
            QJsonArray tags;
            for (const auto& tag : v) tags.append(qstr(tag));
            obj.insert(QStringLiteral("value"), tags);
        } else if constexpr (std::is_same_v<T, GeoPoint>) {
            obj.insert(QStringLiteral("value"), QJsonObject{
                {QStringLiteral("lat"), v.latitude},
                {QStringLiteral("lon"), v.longitude}
            });
        } else if constexpr (std::is_same_v<T, MeasurementMap>) {
            QJsonObject readings;
            for (const auto& [key, reading] : v) readings.insert(qstr(key), reading);
            obj.insert(QStringLiteral("value"), readings);
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            obj.insert(QStringLiteral("value"), static_cast<qint64>(v.millis()));
        }
    }, value);

    return obj;
}

Result<FieldValue, Error> field_value_from_json(const QJsonValue& json) {
    using R = Result<FieldValue, Error>;
    if (!json.isObject()) {
        return R::err(corrupt("field value is not an object"));
    }
    const auto obj = json.toObject();
    const auto kind = parse_kind(obj.value(QStringLiteral("kind")).toString().toStdString());
    if (!kind) {
        return R::err(corrupt("unknown field kind"));
    }
    const auto v = obj.value(QStringLiteral("value"));

    switch (*kind) {
        case FieldKind::Empty:
            return R::ok(std::monostate{});
        case FieldKind::Text:
            if (!v.isString()) return R::err(corrupt("text value"));
            return R::ok(v.toString().toStdString());
        case FieldKind::Number:
            if (!v.isDouble()) return R::err(corrupt("number value"));
            return R::ok(v.toDouble());
        case FieldKind::Tags: {
            if (!v.isArray()) return R::err(corrupt("tag set value"));
            TagSet tags;
            for (const auto& tag : v.toArray()) {
                if (!tag.isString()) return R::err(corrupt("tag entry"));
                tags.insert(tag.toString().toStdString());
            }
            return R::ok(std::move(tags));
        }
        case FieldKind::Geo: {
            const auto point = v.toObject();
            if (!point.value(QStringLiteral("lat")).isDouble() ||
                !point.value(QStringLiteral("lon")).isDouble()) {
                return R::err(corrupt("geo value"));
            }
            return R::ok(GeoPoint{
                .latitude = point.value(QStringLiteral("lat")).toDouble(),
                .longitude = point.value(QStringLiteral("lon")).toDouble()
            });
        }
        case FieldKind::Measurements: {
            if (!v.isObject()) return R::err(corrupt("measurement value"));
            MeasurementMap readings;
            const auto readings_obj = v.toObject();
            for (auto it = readings_obj.begin(); it != readings_obj.end(); ++it) {
                if (!it.value().isDouble()) return R::err(corrupt("measurement entry"));
                readings[it.key().toStdString()] = it.value().toDouble();
            }
            return R::ok(std::move(readings));
        }
        case FieldKind::Instant:
            if (!v.isDouble()) return R::err(corrupt("instant value"));
            return R::ok(Timestamp(v.toInteger()));
    }
    return R::err(corrupt("unhandled field kind"));
}

namespace {

Result<FieldMap, Error> fields_from_object(const QJsonObject& obj) {
    FieldMap fields;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        auto value = field_value_from_json(it.value());
        if (value.is_err()) {
            return Result<FieldMap, Error>::err(value.unwrap_err());
        }
        auto v = std::move(value).unwrap();
        if (!std::holds_alternative<std::monostate>(v)) {
            fields[it.key().toStdString()] = std::move(v);
        }
    }
    return Result<FieldMap, Error>::ok(std::move(fields));
}

Result<FieldStamps, Error> stamps_from_object(const QJsonObject& obj) {
    FieldStamps stamps;
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (!it.value().isDouble()) {
            return Result<FieldStamps, Error>::err(corrupt("field stamp"));
        }
        stamps[it.key().toStdString()] = Timestamp(it.value().toInteger());
    }
    return Result<FieldStamps, Error>::ok(std::move(stamps));
}

} // namespace

std::string encode_fields(const FieldMap& fields) {
    QJsonObject obj;
    for (const auto& [name, value] : fields) {
        obj.insert(qstr(name), field_value_to_json(value));
    }
    return to_compact(obj);
}

Result<FieldMap, Error> decode_fields(std::string_view json) {
    return parse_object(json).and_then([](const QJsonObject& obj) { return fields_from_object(obj); });
}

std::string encode_stamps(const FieldStamps& stamps) {
    QJsonObject obj;
    for (const auto& [name, stamp] : stamps) {
        obj.insert(qstr(name), static_cast<qint64>(stamp.millis()));
    }
    return to_compact(obj);
}

Result<FieldStamps, Error> decode_stamps(std::string_view json) {
    return parse_object(json).and_then([](const QJsonObject& obj) { return stamps_from_object(obj); });
}

QJsonObject entity_to_json(const Entity& entity) {
    QJsonObject fields;
    for (const auto& [name, value] : entity.fields) {
        fields.insert(qstr(name), field_value_to_json(value));
    }
    QJsonObject stamps;
    for (const auto& [name, stamp] : entity.field_stamps) {
        stamps.insert(qstr(name), static_cast<qint64>(stamp.millis()));
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("uuid"), qstr(entity.uuid.to_string()));
    obj.insert(QStringLiteral("entity_type"), qstr(entity.entity_type));
    put_optional(obj, "record_id", entity.record_id);
    put_optional(obj, "change_tag", entity.change_tag);
    obj.insert(QStringLiteral("fields"), fields);
    obj.insert(QStringLiteral("field_stamps"), stamps);
    obj.insert(QStringLiteral("sync_status"), QString::fromLatin1(to_string(entity.sync_status).data()));
    obj.insert(QStringLiteral("last_modified"), static_cast<qint64>(entity.last_modified.millis()));
    obj.insert(QStringLiteral("created_at"), static_cast<qint64>(entity.created_at.millis()));
    obj.insert(QStringLiteral("conflict_resolution_needed"), entity.conflict_resolution_needed);
    return obj;
}

Result<Entity, Error> entity_from_json(const QJsonObject& obj) {
    using R = Result<Entity, Error>;

    auto uuid = Uuid::parse(obj.value(QStringLiteral("uuid")).toString().toStdString());
    if (!uuid) return R::err(corrupt("uuid"));

    auto status = parse_sync_status(obj.value(QStringLiteral("sync_status")).toString().toStdString());
    if (!status) return R::err(corrupt("sync_status"));

    auto fields = fields_from_object(obj.value(QStringLiteral("fields")).toObject());
    if (fields.is_err()) return R::err(fields.unwrap_err());

    auto stamps = stamps_from_object(obj.value(QStringLiteral("field_stamps")).toObject());
    if (stamps.is_err()) return R::err(stamps.unwrap_err());

    return R::ok(Entity{
        .uuid = *uuid,
        .entity_type = obj.value(QStringLiteral("entity_type")).toString().toStdString(),
        .record_id = optional_text(obj, "record_id"),
        .change_tag = optional_text(obj, "change_tag"),
        .fields = std::move(fields).unwrap(),
        .field_stamps = std::move(stamps).unwrap(),
        .sync_status = *status,
        .last_modified = Timestamp(obj.value(QStringLiteral("last_modified")).toInteger()),
        .created_at = Timestamp(obj.value(QStringLiteral("created_at")).toInteger()),
        .conflict_resolution_needed = obj.value(QStringLiteral("conflict_resolution_needed")).toBool()
    });
}

std::string encode_entity(const Entity& entity) {
    return to_compact(entity_to_json(entity));
}

Result<Entity, Error> decode_entity(std::string_view json) {
    auto parsed = parse_object(json);
    if (parsed.is_err()) {
        return Result<Entity, Error>::err(parsed.unwrap_err());
    }
    return entity_from_json(parsed.unwrap());
}

} // namespace tidesync::codec
