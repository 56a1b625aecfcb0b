#include "core/report_fields.hpp"

#include <QDateTime>
#include <QString>
#include <QStringList>

#include <sstream>

namespace tidesync::report {

namespace {

Error bad_value(std::string_view name, std::string_view why) {
    return Error{"Invalid value for '" + std::string(name) + "': " + std::string(why),
                 ErrorCode::InvalidArguments};
}

std::optional<double> to_number(const QString& text) {
    bool ok = false;
    const double v = text.trimmed().toDouble(&ok);
    if (!ok) return std::nullopt;
    return v;
}

std::string format_number(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}

} // namespace

FieldKind field_kind(std::string_view name) {
    if (name == kSpecies) return FieldKind::Tags;
    if (name == kLocation) return FieldKind::Geo;
    if (name == kEnvironment) return FieldKind::Measurements;
    if (name == kTimestamp) return FieldKind::Instant;
    return FieldKind::Text;
}

Result<std::pair<std::string, FieldValue>, Error> parse_assignment(std::string_view text) {
    using R = Result<std::pair<std::string, FieldValue>, Error>;

    const auto eq = text.find('=');
    if (eq == std::string_view::npos || eq == 0) {
        return R::err(Error{"Expected name=value, got '" + std::string(text) + "'",
                            ErrorCode::InvalidArguments});
    }
    const std::string name(text.substr(0, eq));
    const auto raw = QString::fromUtf8(text.data() + eq + 1, static_cast<qsizetype>(text.size() - eq - 1));

    if (raw.trimmed().isEmpty()) {
        return R::ok({name, std::monostate{}});
    }

    switch (field_kind(name)) {
        case FieldKind::Tags: {
            TagSet tags;
            for (const auto& part : raw.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
                const auto tag = part.trimmed();
                if (!tag.isEmpty()) tags.insert(tag.toStdString());
            }
            return R::ok({name, std::move(tags)});
        }
        case FieldKind::Geo: {
            const auto parts = raw.split(QLatin1Char(','));
            if (parts.size() != 2) return R::err(bad_value(name, "expected lat,lon"));
            const auto lat = to_number(parts[0]);
            const auto lon = to_number(parts[1]);
            if (!lat || !lon) return R::err(bad_value(name, "coordinates must be numbers"));
            if (*lat < -90.0 || *lat > 90.0 || *lon < -180.0 || *lon > 180.0) {
                return R::err(bad_value(name, "coordinates out of range"));
            }
            return R::ok({name, GeoPoint{.latitude = *lat, .longitude = *lon}});
        }
        case FieldKind::Measurements: {
            MeasurementMap readings;
            for (const auto& part : raw.split(QLatin1Char(','), Qt::SkipEmptyParts)) {
                const auto kv = part.split(QLatin1Char(':'));
                if (kv.size() != 2 || kv[0].trimmed().isEmpty()) {
                    return R::err(bad_value(name, "expected key:value pairs"));
                }
                const auto reading = to_number(kv[1]);
                if (!reading) return R::err(bad_value(name, "reading must be a number"));
                readings[kv[0].trimmed().toStdString()] = *reading;
            }
            return R::ok({name, std::move(readings)});
        }
        case FieldKind::Instant: {
            bool ok = false;
            const qint64 millis = raw.trimmed().toLongLong(&ok);
            if (ok) return R::ok({name, Timestamp(millis)});
            const auto dt = QDateTime::fromString(raw.trimmed(), Qt::ISODateWithMs);
            if (!dt.isValid()) return R::err(bad_value(name, "expected ISO 8601 or epoch milliseconds"));
            return R::ok({name, Timestamp(dt.toMSecsSinceEpoch())});
        }
        default:
            return R::ok({name, raw.toStdString()});
    }
}

std::string format_value(const FieldValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return {};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            return format_number(v);
        } else if constexpr (std::is_same_v<T, TagSet>) {
            std::string out;
            for (const auto& tag : v) {
                if (!out.empty()) out += ',';
                out += tag;
            }
            return out;
        } else if constexpr (std::is_same_v<T, GeoPoint>) {
            return format_number(v.latitude) + "," + format_number(v.longitude);
        } else if constexpr (std::is_same_v<T, MeasurementMap>) {
            std::string out;
            for (const auto& [key, reading] : v) {
                if (!out.empty()) out += ',';
                out += key + ":" + format_number(reading);
            }
            return out;
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return v.to_iso_string();
        }
    }, value);
}

} // namespace tidesync::report
