#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <QTextStream>

#include "cli/format.hpp"
#include "core/logging.hpp"
#include "core/report_fields.hpp"
#include "remote/sqlite_record_store.hpp"
#include "storage/conflict_history_repository.hpp"
#include "storage/database.hpp"
#include "storage/entity_repository.hpp"
#include "storage/migrations.hpp"
#include "sync/background_scheduler.hpp"
#include "sync/device_monitor.hpp"
#include "sync/priority_queue.hpp"
#include "sync/record_mapping.hpp"
#include "sync/sync_orchestrator.hpp"
#include "sync/sync_settings.hpp"

#include <memory>

using namespace tidesync;

namespace {

// Everything one command needs, wired once. Not movable: the orchestrator
// holds references to the members.
struct Session {
    storage::Database db;
    std::unique_ptr<remote::SqliteRecordStore> remote;
    std::unique_ptr<sync::SyncSettings> settings;
    sync::SyncPriorityQueue queue;
    std::unique_ptr<sync::SyncOrchestrator> orchestrator;
};

QString data_dir() {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    QDir().mkpath(base);
    return base;
}

QString local_db_path() {
    const auto env = qEnvironmentVariable("TIDESYNC_DB_PATH");
    return env.isEmpty() ? QDir(data_dir()).filePath(QStringLiteral("tidesync.db")) : env;
}

int fail(const Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

Result<std::unique_ptr<Session>> open_session(const QString& remote_path, const QString& settings_path) {
    using R = Result<std::unique_ptr<Session>>;

    auto session = std::make_unique<Session>();

    auto db = storage::Database::open(local_db_path().toStdString());
    if (db.is_err()) return R::err(db.unwrap_err());
    session->db = std::move(db).unwrap();

    auto migrated = storage::initialize_database(session->db);
    if (migrated.is_err()) return R::err(migrated.unwrap_err());

    auto remote = remote::SqliteRecordStore::open(remote_path.toStdString());
    if (remote.is_err()) return R::err(remote.unwrap_err());
    session->remote = std::move(remote).unwrap();

    session->settings = settings_path.isEmpty() ? std::make_unique<sync::SyncSettings>()
                                                : std::make_unique<sync::SyncSettings>(settings_path);

    session->orchestrator = std::make_unique<sync::SyncOrchestrator>(
        session->db, *session->remote, session->queue, *session->settings);
    return R::ok(std::move(session));
}

Result<Uuid> parse_uuid(const QString& text) {
    auto uuid = Uuid::parse(text.toStdString());
    if (!uuid) {
        return Result<Uuid>::err(Error{"Not a uuid: " + text.toStdString(), ErrorCode::InvalidArguments});
    }
    return Result<Uuid>::ok(*uuid);
}

Result<Entity> load_entity(Session& session, const QString& text) {
    auto uuid = parse_uuid(text);
    if (uuid.is_err()) return Result<Entity>::err(uuid.unwrap_err());

    storage::EntityRepository entities(session.db);
    auto found = entities.get(uuid.unwrap());
    if (found.is_err()) return Result<Entity>::err(found.unwrap_err());
    if (!found.unwrap()) {
        return Result<Entity>::err(Error{"No such entity: " + text.toStdString(), ErrorCode::UnknownItem});
    }
    return Result<Entity>::ok(*std::move(found).unwrap());
}

Result<void> apply_assignments(Entity& entity, const QStringList& assignments) {
    const auto now = Timestamp::now();
    for (const auto& assignment : assignments) {
        auto parsed = report::parse_assignment(assignment.toStdString());
        if (parsed.is_err()) return Result<void>::err(parsed.unwrap_err());
        auto [name, value] = std::move(parsed).unwrap();
        entity.set_field(name, std::move(value), now);
    }
    return Result<void>::ok();
}

// One cycle; a deleted zone is recreated and the cycle retried once.
Result<sync::SyncResult> run_sync(Session& session) {
    auto queued = session.orchestrator->rebuild_queue();
    if (queued.is_err()) return Result<sync::SyncResult>::err(queued.unwrap_err());

    auto result = session.orchestrator->sync_pending_changes();
    if (result.is_err() && result.unwrap_err().code == ErrorCode::ZoneNotFound) {
        qCWarning(tidesyncSyncLog) << "Remote zone missing; recreating it";
        auto recreated = session.orchestrator->recreate_remote_zone();
        if (recreated.is_err()) return Result<sync::SyncResult>::err(recreated.unwrap_err());
        return session.orchestrator->sync_pending_changes();
    }
    return result;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("tidesync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("tidesync");
    app.setOrganizationDomain("tidesync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Offline-first sync engine for field reports"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets TIDESYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption remoteOption(
        QStringList{QStringLiteral("remote")},
        QStringLiteral("SQLite file emulating the remote store."),
        QStringLiteral("path"));
    parser.addOption(remoteOption);

    const QCommandLineOption settingsOption(
        QStringList{QStringLiteral("settings")},
        QStringLiteral("Read and write settings from this INI file."),
        QStringLiteral("ini"));
    parser.addOption(settingsOption);

    const QCommandLineOption strategyOption(
        QStringList{QStringLiteral("strategy")},
        QStringLiteral("Conflict resolution strategy to store and use (server_wins, client_wins, most_recent, "
                       "field_level_merge, three_way_merge, manual)."),
        QStringLiteral("id"));
    parser.addOption(strategyOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets TIDESYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("report, edit, show, sync, status, conflicts, history, resolve "
                                                "or daemon."));
    parser.addPositionalArgument(QStringLiteral("args"),
                                 QStringLiteral("Command arguments: field assignments (name=value) or a uuid."),
                                 QStringLiteral("[args...]"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("TIDESYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("TIDESYNC_DEBUG_SYNC", "1");
    }
    if (tidesync::sync_debug_requested()) {
        tidesync::enable_sync_debug_logging();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const auto command = positional.first();
    const auto args = positional.mid(1);
    const bool json = parser.isSet(jsonOption);

    const auto remotePath = parser.isSet(remoteOption)
        ? parser.value(remoteOption)
        : QDir(data_dir()).filePath(QStringLiteral("remote.db"));
    auto opened = open_session(remotePath, parser.value(settingsOption));
    if (opened.is_err()) {
        return fail(opened.unwrap_err());
    }
    auto session = std::move(opened).unwrap();

    if (parser.isSet(strategyOption)) {
        const auto strategy = sync::parse_strategy(parser.value(strategyOption).toStdString());
        if (!strategy) {
            return fail(QStringLiteral("Unknown strategy: ") + parser.value(strategyOption));
        }
        session->settings->set_strategy(*strategy);
        session->orchestrator->resolver().set_strategy(*strategy);
    }

    QTextStream out(stdout);

    if (command == QStringLiteral("report")) {
        auto entity = make_entity(report::kEntityType);
        auto assigned = apply_assignments(entity, args);
        if (assigned.is_err()) return fail(assigned.unwrap_err());
        auto saved = session->orchestrator->record_local_change(entity, sync::SyncPriority::UserInitiated);
        if (saved.is_err()) return fail(saved.unwrap_err());
        out << (json ? cli::format_entity_json(entity) : cli::format_entity(entity));
        return 0;
    }

    if (command == QStringLiteral("edit")) {
        if (args.isEmpty()) return fail(QStringLiteral("Usage: edit <uuid> name=value..."));
        auto loaded = load_entity(*session, args.first());
        if (loaded.is_err()) return fail(loaded.unwrap_err());
        auto entity = std::move(loaded).unwrap();
        auto assigned = apply_assignments(entity, args.mid(1));
        if (assigned.is_err()) return fail(assigned.unwrap_err());
        auto saved = session->orchestrator->record_local_change(entity, sync::SyncPriority::UserInitiated);
        if (saved.is_err()) return fail(saved.unwrap_err());
        out << (json ? cli::format_entity_json(entity) : cli::format_entity(entity));
        return 0;
    }

    if (command == QStringLiteral("show")) {
        if (args.isEmpty()) return fail(QStringLiteral("Usage: show <uuid>"));
        auto loaded = load_entity(*session, args.first());
        if (loaded.is_err()) return fail(loaded.unwrap_err());
        out << (json ? cli::format_entity_json(loaded.unwrap()) : cli::format_entity(loaded.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("sync")) {
        tidesync::install_file_logging();
        auto result = run_sync(*session);
        if (result.is_err()) return fail(result.unwrap_err());
        out << (json ? cli::format_sync_result_json(result.unwrap()) : cli::format_sync_result(result.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("status")) {
        storage::EntityRepository entities(session->db);
        auto pending = entities.count_pending_sync();
        if (pending.is_err()) return fail(pending.unwrap_err());
        auto conflicts = entities.count_conflicts();
        if (conflicts.is_err()) return fail(conflicts.unwrap_err());

        const auto& settings = *session->settings;
        const cli::StatusSnapshot status{
            .store_id = session->remote->store_id(),
            .strategy = std::string(sync::to_string(settings.strategy())),
            .pending = pending.unwrap(),
            .conflicts = conflicts.unwrap(),
            .watermark = settings.watermark(session->remote->store_id()),
            .last_sync = settings.last_sync_date(),
            .last_background_sync = settings.last_background_sync_date()};
        out << (json ? cli::format_status_json(status) : cli::format_status(status));
        return 0;
    }

    if (command == QStringLiteral("conflicts")) {
        auto conflicts = session->orchestrator->get_pending_conflicts();
        if (conflicts.is_err()) return fail(conflicts.unwrap_err());
        out << (json ? cli::format_conflicts_json(conflicts.unwrap()) : cli::format_conflicts(conflicts.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("history")) {
        if (args.isEmpty()) return fail(QStringLiteral("Usage: history <uuid>"));
        auto uuid = parse_uuid(args.first());
        if (uuid.is_err()) return fail(uuid.unwrap_err());
        storage::ConflictHistoryRepository history(session->db);
        auto entries = history.history_for(uuid.unwrap());
        if (entries.is_err()) return fail(entries.unwrap_err());
        out << (json ? cli::format_history_json(entries.unwrap()) : cli::format_history(entries.unwrap()));
        return 0;
    }

    if (command == QStringLiteral("resolve")) {
        if (args.isEmpty()) return fail(QStringLiteral("Usage: resolve <uuid>"));
        tidesync::install_file_logging();
        auto loaded = load_entity(*session, args.first());
        if (loaded.is_err()) return fail(loaded.unwrap_err());
        const auto& local = loaded.unwrap();

        auto fetched = session->remote->fetch_record(sync::record_id_for(local));
        if (fetched.is_err()) return fail(fetched.unwrap_err());
        const auto remote = sync::entity_from_remote(fetched.unwrap(), &local);

        auto resolution = session->orchestrator->resolve_conflict(local, remote);
        if (resolution.is_err()) return fail(resolution.unwrap_err());
        out << QString::fromUtf8(resolution.unwrap().description().data(),
                                 static_cast<qsizetype>(resolution.unwrap().description().size()))
            << QLatin1Char('\n');
        return 0;
    }

    if (command == QStringLiteral("daemon")) {
        tidesync::install_file_logging();
        qInfo() << "tidesync: logging to" << tidesync::default_log_file_path();

        auto queued = session->orchestrator->rebuild_queue();
        if (queued.is_err()) return fail(queued.unwrap_err());

        if (!session->settings->background_enabled()) {
            return fail(QStringLiteral("Background sync is disabled (set sync/background_enabled=true)"));
        }

        sync::SystemDeviceMonitor monitor;
        sync::BackgroundScheduler scheduler(*session->orchestrator, session->queue, *session->settings, monitor);
        scheduler.start();
        return app.exec();
    }

    return fail(QStringLiteral("Unknown command: ") + command);
}
