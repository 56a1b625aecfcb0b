#include "cli/format.hpp"

#include "core/entity_codec.hpp"
#include "core/report_fields.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace tidesync::cli {

namespace {

QString qstr(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

QString iso(Timestamp at) {
    return QString::fromStdString(at.to_iso_string());
}

QString iso_or_never(const std::optional<Timestamp>& at) {
    return at ? iso(*at) : QStringLiteral("never");
}

QString to_json_line(const QJsonObject& root) {
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact)) + QLatin1Char('\n');
}

QJsonObject entry_to_json(const storage::ConflictHistoryEntry& entry) {
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), static_cast<qint64>(entry.id));
    obj.insert(QStringLiteral("entityUuid"), QString::fromStdString(entry.entity_uuid.to_string()));
    obj.insert(QStringLiteral("occurredAt"), iso(entry.occurred_at));
    obj.insert(QStringLiteral("resolvedAt"), entry.resolved_at ? QJsonValue(iso(*entry.resolved_at)) : QJsonValue());
    obj.insert(QStringLiteral("strategy"), QString::fromStdString(entry.resolution_strategy));
    obj.insert(QStringLiteral("resolutionType"), QString::fromStdString(entry.resolution_type));
    if (!entry.notes.empty()) {
        obj.insert(QStringLiteral("notes"), QString::fromStdString(entry.notes));
    }
    return obj;
}

} // namespace

QString format_entity(const Entity& entity) {
    QString out;
    out += QStringLiteral("uuid: ") + QString::fromStdString(entity.uuid.to_string()) + QLatin1Char('\n');
    out += QStringLiteral("type: ") + QString::fromStdString(entity.entity_type) + QLatin1Char('\n');
    out += QStringLiteral("status: ") + qstr(to_string(entity.sync_status));
    if (entity.conflict_resolution_needed) {
        out += QStringLiteral(" (conflict)");
    }
    out += QLatin1Char('\n');
    out += QStringLiteral("modified: ") + iso(entity.last_modified) + QLatin1Char('\n');
    for (const auto& [name, value] : entity.fields) {
        out += QStringLiteral("  ") + QString::fromStdString(name) + QStringLiteral(": ") +
               QString::fromStdString(report::format_value(value)) + QLatin1Char('\n');
    }
    return out;
}

QString format_entity_json(const Entity& entity) {
    return to_json_line(codec::entity_to_json(entity));
}

QString format_conflicts(const std::vector<Entity>& entities) {
    if (entities.empty()) {
        return QStringLiteral("No conflicts\n");
    }
    QString out;
    for (const auto& entity : entities) {
        out += QString::fromStdString(entity.uuid.to_string()) + QStringLiteral("  ") +
               QString::fromStdString(entity.entity_type) + QStringLiteral("  ") + iso(entity.last_modified) +
               QLatin1Char('\n');
    }
    return out;
}

QString format_conflicts_json(const std::vector<Entity>& entities) {
    QJsonArray list;
    for (const auto& entity : entities) {
        list.append(codec::entity_to_json(entity));
    }
    QJsonObject root;
    root.insert(QStringLiteral("conflicts"), list);
    return to_json_line(root);
}

QString format_history(const std::vector<storage::ConflictHistoryEntry>& entries) {
    if (entries.empty()) {
        return QStringLiteral("No conflict history\n");
    }
    QString out;
    for (const auto& entry : entries) {
        out += QStringLiteral("#") + QString::number(entry.id) + QStringLiteral("  ") + iso(entry.occurred_at) +
               QStringLiteral("  ") + QString::fromStdString(entry.resolution_strategy);
        if (entry.is_resolved()) {
            out += QStringLiteral("  ") + QString::fromStdString(entry.resolution_type) + QStringLiteral(" at ") +
                   iso(*entry.resolved_at);
        } else {
            out += QStringLiteral("  unresolved");
        }
        if (!entry.notes.empty()) {
            out += QStringLiteral("  (") + QString::fromStdString(entry.notes) + QLatin1Char(')');
        }
        out += QLatin1Char('\n');
    }
    return out;
}

QString format_history_json(const std::vector<storage::ConflictHistoryEntry>& entries) {
    QJsonArray list;
    for (const auto& entry : entries) {
        list.append(entry_to_json(entry));
    }
    QJsonObject root;
    root.insert(QStringLiteral("history"), list);
    return to_json_line(root);
}

QString format_status(const StatusSnapshot& status) {
    QString out;
    out += QStringLiteral("remote: ") + QString::fromStdString(status.store_id) + QLatin1Char('\n');
    out += QStringLiteral("strategy: ") + QString::fromStdString(status.strategy) + QLatin1Char('\n');
    out += QStringLiteral("pending: ") + QString::number(status.pending) + QLatin1Char('\n');
    out += QStringLiteral("conflicts: ") + QString::number(status.conflicts) + QLatin1Char('\n');
    out += QStringLiteral("watermark: ") + iso(status.watermark) + QLatin1Char('\n');
    out += QStringLiteral("last sync: ") + iso_or_never(status.last_sync) + QLatin1Char('\n');
    out += QStringLiteral("last background sync: ") + iso_or_never(status.last_background_sync) + QLatin1Char('\n');
    return out;
}

QString format_status_json(const StatusSnapshot& status) {
    QJsonObject root;
    root.insert(QStringLiteral("remote"), QString::fromStdString(status.store_id));
    root.insert(QStringLiteral("strategy"), QString::fromStdString(status.strategy));
    root.insert(QStringLiteral("pending"), status.pending);
    root.insert(QStringLiteral("conflicts"), status.conflicts);
    root.insert(QStringLiteral("watermark"), static_cast<qint64>(status.watermark.millis()));
    root.insert(QStringLiteral("lastSync"),
                status.last_sync ? QJsonValue(static_cast<qint64>(status.last_sync->millis())) : QJsonValue());
    root.insert(QStringLiteral("lastBackgroundSync"),
                status.last_background_sync ? QJsonValue(static_cast<qint64>(status.last_background_sync->millis()))
                                            : QJsonValue());
    return to_json_line(root);
}

QString format_sync_result(const sync::SyncResult& result) {
    return QStringLiteral("uploaded %1, downloaded %2, conflicts %3, errors %4\n")
        .arg(result.uploaded)
        .arg(result.downloaded)
        .arg(result.conflicts)
        .arg(result.errors);
}

QString format_sync_result_json(const sync::SyncResult& result) {
    QJsonObject root;
    root.insert(QStringLiteral("uploaded"), result.uploaded);
    root.insert(QStringLiteral("downloaded"), result.downloaded);
    root.insert(QStringLiteral("conflicts"), result.conflicts);
    root.insert(QStringLiteral("errors"), result.errors);
    return to_json_line(root);
}

} // namespace tidesync::cli
