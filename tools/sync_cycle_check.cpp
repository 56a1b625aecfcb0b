#include <QCoreApplication>
#include <QTemporaryDir>

#include "core/report_fields.hpp"
#include "remote/memory_record_store.hpp"
#include "storage/database.hpp"
#include "storage/entity_repository.hpp"
#include "storage/migrations.hpp"
#include "sync/sync_orchestrator.hpp"
#include "sync/sync_settings.hpp"

#include <memory>
#include <optional>

using namespace tidesync;

namespace {

// One simulated device: its own database, settings, queue and orchestrator.
struct Device {
    QString name;
    storage::Database db;
    std::unique_ptr<sync::SyncSettings> settings;
    sync::SyncPriorityQueue queue;
    std::unique_ptr<sync::SyncOrchestrator> orchestrator;
};

std::unique_ptr<Device> make_device(const QString& name, const QTemporaryDir& dir, remote::RemoteRecordStore& store) {
    auto device = std::make_unique<Device>();
    device->name = name;

    auto db = storage::Database::open_memory();
    if (db.is_err()) {
        qCritical().noquote() << name << "cannot open database:" << QString::fromStdString(db.unwrap_err().message);
        return nullptr;
    }
    device->db = std::move(db).unwrap();
    auto migrated = storage::initialize_database(device->db);
    if (migrated.is_err()) {
        qCritical().noquote() << name << "migration failed:" << QString::fromStdString(migrated.unwrap_err().message);
        return nullptr;
    }

    device->settings = std::make_unique<sync::SyncSettings>(dir.filePath(name + QStringLiteral(".ini")));
    device->settings->set_strategy(sync::ResolutionStrategy::FieldLevelMerge);
    device->orchestrator = std::make_unique<sync::SyncOrchestrator>(device->db, store, device->queue, *device->settings);
    return device;
}

bool run(Device& device) {
    auto result = device.orchestrator->sync_pending_changes();
    if (result.is_err()) {
        qCritical().noquote() << device.name << "sync failed:" << QString::fromStdString(result.unwrap_err().message);
        return false;
    }
    const auto& counts = result.unwrap();
    qInfo().noquote() << device.name << "uploaded" << counts.uploaded << "downloaded" << counts.downloaded
                      << "conflicts" << counts.conflicts << "errors" << counts.errors;
    return counts.errors == 0;
}

std::optional<Entity> load(Device& device, const Uuid& uuid) {
    storage::EntityRepository entities(device.db);
    auto found = entities.get(uuid);
    if (found.is_err()) {
        qCritical().noquote() << device.name << "read failed:" << QString::fromStdString(found.unwrap_err().message);
        return std::nullopt;
    }
    return std::move(found).unwrap();
}

bool edit(Device& device, const Uuid& uuid, const std::string& field, FieldValue value) {
    auto entity = load(device, uuid);
    if (!entity) {
        return false;
    }
    entity->set_field(field, std::move(value), Timestamp::now());
    auto saved = device.orchestrator->record_local_change(*entity);
    if (saved.is_err()) {
        qCritical().noquote() << device.name << "edit failed:" << QString::fromStdString(saved.unwrap_err().message);
        return false;
    }
    return true;
}

} // namespace

// Two devices share one remote store, edit different fields of the same
// report concurrently, and must end up with identical content.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    QTemporaryDir dir;
    if (!dir.isValid()) {
        return 1;
    }

    remote::MemoryRecordStore store("cycle-check");
    auto a = make_device(QStringLiteral("A"), dir, store);
    auto b = make_device(QStringLiteral("B"), dir, store);
    if (!a || !b) {
        return 1;
    }

    auto report = make_entity(report::kEntityType);
    const auto now = Timestamp::now();
    report.set_field(report::kSpecies, TagSet{"blue crab"}, now);
    report.set_field(report::kIntensity, std::string("Minor"), now);
    report.set_field(report::kLocation, GeoPoint{30.6954, -88.0399}, now);
    if (a->orchestrator->record_local_change(report).is_err()) {
        return 1;
    }

    if (!run(*a) || !run(*b)) {
        return 1;
    }
    if (!load(*b, report.uuid)) {
        qCritical() << "B never received the report";
        return 2;
    }

    // Concurrent edits of different fields.
    if (!edit(*a, report.uuid, report::kNotes, std::string("Crabs at the waterline")) ||
        !edit(*b, report.uuid, report::kIntensity, std::string("Major"))) {
        return 1;
    }

    // A wins the race; B conflicts, merges, and uploads the merge next cycle.
    for (auto* device : {a.get(), b.get(), b.get(), a.get()}) {
        if (!run(*device)) {
            return 1;
        }
    }

    const auto on_a = load(*a, report.uuid);
    const auto on_b = load(*b, report.uuid);
    if (!on_a || !on_b) {
        return 1;
    }
    if (!same_content(*on_a, *on_b)) {
        qCritical() << "Devices diverged";
        return 2;
    }
    const auto* intensity = on_a->field(report::kIntensity);
    const auto* notes = on_a->field(report::kNotes);
    if (!intensity || !notes || report::format_value(*intensity) != "Major" ||
        report::format_value(*notes) != "Crabs at the waterline") {
        qCritical() << "An edit was lost in the merge";
        return 2;
    }
    if (on_a->sync_status != SyncStatus::Synced || on_b->sync_status != SyncStatus::Synced) {
        qCritical() << "Devices did not settle";
        return 2;
    }

    qInfo() << "Devices converged";
    return 0;
}
