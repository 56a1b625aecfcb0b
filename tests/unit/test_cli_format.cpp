#include <catch2/catch_test_macros.hpp>
#include "cli/format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

using namespace tidesync;
using namespace tidesync::cli;

namespace {

QJsonObject parse(const QString& line) {
    REQUIRE(line.endsWith(QLatin1Char('\n')));
    auto doc = QJsonDocument::fromJson(line.toUtf8());
    REQUIRE(doc.isObject());
    return doc.object();
}

Entity sample_report() {
    auto entity = make_entity("report", Timestamp(1720071000000));
    entity.set_field("intensity", std::string("Major"), Timestamp(1720071000000));
    entity.set_field("species", TagSet{"shrimp", "blue crab"}, Timestamp(1720071000000));
    return entity;
}

} // namespace

TEST_CASE("Entity text output", "[unit][cli]") {
    auto entity = sample_report();
    const auto uuid = QString::fromStdString(entity.uuid.to_string());

    auto text = format_entity(entity);
    REQUIRE(text == QStringLiteral("uuid: ") + uuid + QStringLiteral("\n"
                                                                     "type: report\n"
                                                                     "status: pending_upload\n"
                                                                     "modified: 2024-07-04T05:30:00.000Z\n"
                                                                     "  intensity: Major\n"
                                                                     "  species: blue crab,shrimp\n"));

    entity.conflict_resolution_needed = true;
    entity.sync_status = SyncStatus::Conflict;
    REQUIRE(format_entity(entity).contains(QStringLiteral("status: conflict (conflict)\n")));
}

TEST_CASE("Entity JSON output is one compact line", "[unit][cli]") {
    auto entity = sample_report();
    auto line = format_entity_json(entity);
    REQUIRE(line.count(QLatin1Char('\n')) == 1);

    auto obj = parse(line);
    REQUIRE(obj.value(QStringLiteral("uuid")).toString().toStdString() == entity.uuid.to_string());
    REQUIRE(obj.value(QStringLiteral("sync_status")).toString() == QStringLiteral("pending_upload"));
}

TEST_CASE("Conflict listing", "[unit][cli]") {
    REQUIRE(format_conflicts({}) == QStringLiteral("No conflicts\n"));

    auto entity = sample_report();
    auto text = format_conflicts({entity});
    REQUIRE(text == QString::fromStdString(entity.uuid.to_string()) +
                        QStringLiteral("  report  2024-07-04T05:30:00.000Z\n"));

    auto obj = parse(format_conflicts_json({entity, entity}));
    REQUIRE(obj.value(QStringLiteral("conflicts")).toArray().size() == 2);
    REQUIRE(parse(format_conflicts_json({})).value(QStringLiteral("conflicts")).toArray().isEmpty());
}

TEST_CASE("Conflict history output", "[unit][cli]") {
    REQUIRE(format_history({}) == QStringLiteral("No conflict history\n"));

    storage::ConflictHistoryEntry open{
        .id = 2,
        .entity_uuid = Uuid::generate(),
        .occurred_at = Timestamp(1720071000000),
        .resolution_strategy = "manual",
        .resolution_type = "server_record_changed"};
    storage::ConflictHistoryEntry closed{
        .id = 1,
        .entity_uuid = open.entity_uuid,
        .occurred_at = Timestamp(1720070000000),
        .resolved_at = Timestamp(1720071000000),
        .resolution_strategy = "most_recent",
        .resolution_type = "use_remote",
        .notes = "auto"};

    auto text = format_history({open, closed});
    REQUIRE(text == QStringLiteral("#2  2024-07-04T05:30:00.000Z  manual  unresolved\n"
                                   "#1  2024-07-04T05:13:20.000Z  most_recent  use_remote at "
                                   "2024-07-04T05:30:00.000Z  (auto)\n"));

    auto history = parse(format_history_json({open, closed})).value(QStringLiteral("history")).toArray();
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].toObject().value(QStringLiteral("resolvedAt")).isNull());
    REQUIRE_FALSE(history[0].toObject().contains(QStringLiteral("notes")));
    REQUIRE(history[1].toObject().value(QStringLiteral("resolutionType")).toString() == QStringLiteral("use_remote"));
    REQUIRE(history[1].toObject().value(QStringLiteral("id")).toInteger() == 1);
}

TEST_CASE("Status output", "[unit][cli]") {
    StatusSnapshot status{
        .store_id = "sqlite:/tmp/remote.db",
        .strategy = "most_recent",
        .pending = 3,
        .conflicts = 1,
        .watermark = Timestamp(1720071000000),
        .last_sync = Timestamp(1720071000000)};

    REQUIRE(format_status(status) == QStringLiteral("remote: sqlite:/tmp/remote.db\n"
                                                    "strategy: most_recent\n"
                                                    "pending: 3\n"
                                                    "conflicts: 1\n"
                                                    "watermark: 2024-07-04T05:30:00.000Z\n"
                                                    "last sync: 2024-07-04T05:30:00.000Z\n"
                                                    "last background sync: never\n"));

    auto obj = parse(format_status_json(status));
    REQUIRE(obj.value(QStringLiteral("pending")).toInt() == 3);
    REQUIRE(obj.value(QStringLiteral("watermark")).toInteger() == 1720071000000);
    REQUIRE(obj.value(QStringLiteral("lastSync")).toInteger() == 1720071000000);
    REQUIRE(obj.value(QStringLiteral("lastBackgroundSync")).isNull());
}

TEST_CASE("Sync result output", "[unit][cli]") {
    const sync::SyncResult result{.uploaded = 4, .downloaded = 2, .conflicts = 1, .errors = 0};
    REQUIRE(format_sync_result(result) == QStringLiteral("uploaded 4, downloaded 2, conflicts 1, errors 0\n"));

    auto obj = parse(format_sync_result_json(result));
    REQUIRE(obj.value(QStringLiteral("uploaded")).toInt() == 4);
    REQUIRE(obj.value(QStringLiteral("downloaded")).toInt() == 2);
    REQUIRE(obj.value(QStringLiteral("conflicts")).toInt() == 1);
    REQUIRE(obj.value(QStringLiteral("errors")).toInt() == 0);
}
