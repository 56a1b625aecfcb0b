#include "sync/sync_orchestrator.hpp"
#include "core/entity_codec.hpp"
#include "core/logging.hpp"
#include "sync/record_mapping.hpp"

#include <algorithm>
#include <map>

namespace tidesync::sync {

namespace {

QString qstr(std::string_view text) {
    return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()));
}

QString qstr(const Uuid& uuid) {
    return QString::fromStdString(uuid.to_string());
}

std::string join(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& name : names) {
        if (!out.empty()) out += ",";
        out += name;
    }
    return out;
}

// Clears the syncing flag and the phase however a cycle ends.
class CycleGuard {
public:
    explicit CycleGuard(std::function<void()> on_exit) : on_exit_(std::move(on_exit)) {}
    ~CycleGuard() { on_exit_(); }

    CycleGuard(const CycleGuard&) = delete;
    CycleGuard& operator=(const CycleGuard&) = delete;

private:
    std::function<void()> on_exit_;
};

} // namespace

std::string_view to_string(SyncPhase phase) {
    switch (phase) {
        case SyncPhase::Idle: return "idle";
        case SyncPhase::VerifyingRemoteAvailability: return "verifying_remote_availability";
        case SyncPhase::Uploading: return "uploading";
        case SyncPhase::Downloading: return "downloading";
        case SyncPhase::ResolvingConflicts: return "resolving_conflicts";
    }
    return "unknown";
}

SyncOrchestrator::SyncOrchestrator(storage::Database& db,
                                   remote::RemoteRecordStore& remote,
                                   SyncPriorityQueue& queue,
                                   SyncSettings& settings,
                                   QObject* parent)
    : QObject(parent)
    , db_(db)
    , entities_(db)
    , history_(db)
    , remote_(remote)
    , queue_(queue)
    , settings_(settings)
    , resolver_(settings.strategy(), [this] { return clock_(); })
    , clock_(&Timestamp::now) {}

SyncOrchestrator::~SyncOrchestrator() = default;

Result<SyncResult, Error> SyncOrchestrator::sync_pending_changes(std::shared_ptr<CancellationToken> token) {
    return run_cycle(std::nullopt, std::move(token));
}

Result<SyncResult, Error> SyncOrchestrator::sync_entities(const std::vector<QueuedEntity>& scope,
                                                          std::shared_ptr<CancellationToken> token) {
    return run_cycle(scope, std::move(token));
}

void SyncOrchestrator::cancel_pending_sync() {
    std::lock_guard lock(token_mutex_);
    if (current_token_) {
        qCInfo(tidesyncSyncLog) << "Sync cycle cancellation requested";
        current_token_->cancel();
    }
}

void SyncOrchestrator::set_phase(SyncPhase phase) {
    phase_.store(phase);
    qCDebug(tidesyncSyncLog) << "phase" << qstr(to_string(phase));
    emit phaseChanged(qstr(to_string(phase)));
}

void SyncOrchestrator::advance_progress(Cycle& cycle, int completed_delta, int total_delta) {
    cycle.total += total_delta;
    cycle.completed = std::min(cycle.completed + completed_delta, cycle.total);
    emit progressChanged(cycle.completed, cycle.total);
}

Result<void, Error> SyncOrchestrator::check_cancelled(const Cycle& cycle, std::string_view where) const {
    if (cycle.token && cycle.token->is_cancelled()) {
        return Result<void, Error>::err(Error{"Sync cancelled " + std::string(where), ErrorCode::Cancelled});
    }
    return Result<void, Error>::ok();
}

Result<SyncResult, Error> SyncOrchestrator::run_cycle(std::optional<std::vector<QueuedEntity>> scope,
                                                      std::shared_ptr<CancellationToken> token) {
    using R = Result<SyncResult, Error>;

    if (syncing_.exchange(true)) {
        return R::err(Error{"A sync cycle is already running", ErrorCode::AlreadySyncing});
    }

    Cycle cycle;
    cycle.token = token ? std::move(token) : std::make_shared<CancellationToken>();
    {
        std::lock_guard lock(token_mutex_);
        current_token_ = cycle.token;
    }
    CycleGuard guard([this] {
        {
            std::lock_guard lock(token_mutex_);
            current_token_.reset();
        }
        phase_.store(SyncPhase::Idle);
        syncing_.store(false);
    });

    cycle.full = !scope.has_value();
    if (scope) {
        cycle.work = std::move(*scope);
    } else {
        cycle.work = queue_.dequeue_batch(queue_.size());
    }

    resolver_.set_strategy(settings_.strategy());
    qCInfo(tidesyncSyncLog) << "Sync cycle started, strategy" << qstr(to_string(resolver_.strategy()))
                            << "queued" << cycle.work.size();
    emit syncStarted();

    auto outcome = run_phases(cycle);
    requeue_leftovers(cycle.work);

    cycle.result.conflicts = static_cast<int>(cycle.conflicted.size());
    last_result_ = cycle.result;
    set_phase(SyncPhase::Idle);

    if (outcome.is_err()) {
        const auto& error = outcome.unwrap_err();
        qCWarning(tidesyncSyncLog) << "Sync cycle failed:" << qstr(to_string(error.code))
                                   << QString::fromStdString(error.message)
                                   << "uploaded" << cycle.result.uploaded
                                   << "downloaded" << cycle.result.downloaded;
        emit syncFailed(QString::fromStdString(error.message));
        return R::err(error);
    }

    settings_.set_last_sync_date(clock_());
    qCInfo(tidesyncSyncLog) << "Sync cycle finished: uploaded" << cycle.result.uploaded
                            << "downloaded" << cycle.result.downloaded
                            << "conflicts" << cycle.result.conflicts
                            << "errors" << cycle.result.errors;
    emit syncFinished(cycle.result.uploaded, cycle.result.downloaded,
                      cycle.result.conflicts, cycle.result.errors);
    return R::ok(cycle.result);
}

Result<void, Error> SyncOrchestrator::run_phases(Cycle& cycle) {
    set_phase(SyncPhase::VerifyingRemoteAvailability);
    auto verified = verify_remote(cycle);
    if (verified.is_err()) return verified;

    auto cancelled = check_cancelled(cycle, "before upload");
    if (cancelled.is_err()) return cancelled;

    set_phase(SyncPhase::Uploading);
    auto uploaded = upload(cycle);
    if (uploaded.is_err()) return uploaded;

    cancelled = check_cancelled(cycle, "before download");
    if (cancelled.is_err()) return cancelled;

    set_phase(SyncPhase::Downloading);
    auto downloaded = download(cycle);
    if (downloaded.is_err()) return downloaded;

    cancelled = check_cancelled(cycle, "before conflict resolution");
    if (cancelled.is_err()) return cancelled;

    set_phase(SyncPhase::ResolvingConflicts);
    return resolve_flagged(cycle);
}

Result<void, Error> SyncOrchestrator::verify_remote(Cycle& cycle) {
    auto status = retry_.run([this] { return remote_.account_status(); }, cycle.token);
    if (status.is_err()) {
        return Result<void, Error>::err(status.unwrap_err());
    }

    switch (status.unwrap()) {
        case remote::AccountStatus::Available:
            return Result<void, Error>::ok();
        case remote::AccountStatus::NoAccount:
            return Result<void, Error>::err(
                Error{"No account is signed in to the remote store", ErrorCode::AuthenticationRequired});
        case remote::AccountStatus::Restricted:
            return Result<void, Error>::err(
                Error{"The remote account is restricted", ErrorCode::AuthenticationRequired});
        case remote::AccountStatus::Unknown:
            break;
    }
    return Result<void, Error>::err(Error{
        "Remote account is " + std::string(remote::to_string(status.unwrap())),
        ErrorCode::NetworkUnavailable});
}

// Upload

Result<void, Error> SyncOrchestrator::upload(Cycle& cycle) {
    // Queue order first, then anything pending that was never queued.
    std::set<Uuid> seen;
    for (const auto& item : cycle.work) {
        seen.insert(item.uuid);
    }
    if (cycle.full) {
        auto pending = entities_.fetch_pending_upload();
        if (pending.is_err()) {
            return Result<void, Error>::err(pending.unwrap_err());
        }
        for (const auto& entity : pending.unwrap()) {
            if (seen.insert(entity.uuid).second) {
                cycle.work.push_back(QueuedEntity{.uuid = entity.uuid, .priority = SyncPriority::Normal});
            }
        }
    }

    const auto batch_size = static_cast<size_t>(settings_.batch_size());
    advance_progress(cycle, 0, static_cast<int>(cycle.work.size()));

    for (size_t offset = 0; offset < cycle.work.size(); offset += batch_size) {
        auto cancelled = check_cancelled(cycle, "between upload batches");
        if (cancelled.is_err()) return cancelled;

        const auto end = std::min(offset + batch_size, cycle.work.size());
        std::vector<QueuedEntity> batch(cycle.work.begin() + static_cast<std::ptrdiff_t>(offset),
                                        cycle.work.begin() + static_cast<std::ptrdiff_t>(end));
        auto sent = upload_batch(cycle, batch);
        if (sent.is_err()) return sent;
        advance_progress(cycle, static_cast<int>(batch.size()));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> SyncOrchestrator::upload_batch(Cycle& cycle, const std::vector<QueuedEntity>& batch) {
    std::map<Uuid, Entity> eligible;
    std::vector<remote::RecordSave> saves;

    for (const auto& item : batch) {
        auto loaded = entities_.get(item.uuid);
        if (loaded.is_err()) {
            return Result<void, Error>::err(loaded.unwrap_err());
        }
        const auto& entity = loaded.unwrap();
        if (!entity || entity->sync_status != SyncStatus::PendingUpload || entity->conflict_resolution_needed) {
            continue;
        }
        auto base = entities_.get_base(entity->uuid);
        if (base.is_err()) {
            return Result<void, Error>::err(base.unwrap_err());
        }
        const Entity* base_ptr = base.unwrap() ? &*base.unwrap() : nullptr;
        saves.push_back(remote::RecordSave{
            .record = to_remote_record(*entity),
            .changed_keys = changed_keys(*entity, base_ptr)});
        eligible.emplace(entity->uuid, *entity);
    }
    if (saves.empty()) {
        return Result<void, Error>::ok();
    }

    auto saved = retry_.run(
        [&] { return remote_.save_records(saves, remote::SavePolicy::ChangedKeysOnly); }, cycle.token);

    if (saved.is_err()) {
        const auto& error = saved.unwrap_err();
        if (error.transient() || error.code == ErrorCode::ZoneNotFound || error.code == ErrorCode::Cancelled ||
            error.code == ErrorCode::AuthenticationRequired) {
            // Entities stay pending; requeue_leftovers puts them back.
            qCWarning(tidesyncSyncLog) << "Upload batch of" << saves.size() << "failed:"
                                       << qstr(to_string(error.code)) << QString::fromStdString(error.message);
            return Result<void, Error>::err(error);
        }

        qCWarning(tidesyncSyncLog) << "Upload batch of" << saves.size() << "rejected:"
                                   << qstr(to_string(error.code)) << QString::fromStdString(error.message);
        return db_.transaction([&]() -> Result<void, Error> {
            for (auto& [uuid, entity] : eligible) {
                entity.sync_status = SyncStatus::Error;
                auto written = entities_.upsert(entity);
                if (written.is_err()) return written;
                ++cycle.result.errors;
            }
            return Result<void, Error>::ok();
        });
    }

    const auto& outcomes = saved.unwrap();
    std::vector<Uuid> flagged;
    auto committed = db_.transaction([&]() -> Result<void, Error> {
        for (const auto& outcome : outcomes) {
            auto it = eligible.find(outcome.uuid);
            if (it == eligible.end()) {
                qCWarning(tidesyncSyncLog) << "Save outcome for unknown record" << QString::fromStdString(outcome.record_id);
                continue;
            }
            auto entity = it->second;

            if (outcome.result.is_ok()) {
                const auto& record = outcome.result.unwrap();
                entity.record_id = record.record_id;
                entity.change_tag = record.change_tag;
                entity.sync_status = SyncStatus::Synced;
                auto written = entities_.upsert(entity);
                if (written.is_err()) return written;
                auto based = entities_.save_base(entity, clock_());
                if (based.is_err()) return based;
                ++cycle.result.uploaded;
                continue;
            }

            const auto& error = outcome.result.unwrap_err();
            if (is_conflict(error.code)) {
                auto marked = flag_conflict(entity, nullptr, "server_record_changed");
                if (marked.is_err()) return marked;
                cycle.conflicted.insert(entity.uuid);
                flagged.push_back(entity.uuid);
            } else if (error.transient()) {
                qCInfo(tidesyncSyncLog) << "Upload of" << qstr(entity.uuid) << "deferred:"
                                        << qstr(to_string(error.code));
                ++cycle.result.errors;
            } else {
                qCWarning(tidesyncSyncLog) << "Upload of" << qstr(entity.uuid) << "failed:"
                                           << qstr(to_string(error.code)) << QString::fromStdString(error.message);
                entity.sync_status = SyncStatus::Error;
                auto written = entities_.upsert(entity);
                if (written.is_err()) return written;
                ++cycle.result.errors;
            }
        }
        return Result<void, Error>::ok();
    });
    if (committed.is_err()) {
        return committed;
    }

    for (const auto& uuid : flagged) {
        emit conflictDetected(qstr(uuid));
    }
    return Result<void, Error>::ok();
}

void SyncOrchestrator::requeue_leftovers(const std::vector<QueuedEntity>& work) {
    int requeued = 0;
    for (const auto& item : work) {
        auto loaded = entities_.get(item.uuid);
        if (loaded.is_err()) {
            qCWarning(tidesyncSyncLog) << "Requeueing" << qstr(item.uuid) << "without checking its state:"
                                       << QString::fromStdString(loaded.unwrap_err().message);
            queue_.enqueue(item.uuid, item.priority);
            ++requeued;
            continue;
        }
        const auto& entity = loaded.unwrap();
        if (entity && entity->sync_status == SyncStatus::PendingUpload && !entity->conflict_resolution_needed) {
            queue_.enqueue(item.uuid, item.priority);
            ++requeued;
        }
    }
    if (requeued > 0) {
        qCDebug(tidesyncSyncLog) << "Requeued" << requeued << "entities for the next cycle";
    }
}

// Download

Result<void, Error> SyncOrchestrator::download(Cycle& cycle) {
    const auto store_id = remote_.store_id();
    const auto page_size = static_cast<size_t>(settings_.batch_size());
    auto watermark = settings_.watermark(store_id);
    std::optional<std::string> cursor;
    bool restarted = false;

    while (true) {
        auto cancelled = check_cancelled(cycle, "between download pages");
        if (cancelled.is_err()) return cancelled;

        const remote::RecordQuery query{
            .modified_after = watermark,
            .record_type = {},
            .limit = page_size,
            .cursor = cursor};
        auto page_result = retry_.run([&] { return remote_.query_records(query); }, cycle.token);
        if (page_result.is_err()) {
            const auto& error = page_result.unwrap_err();
            if (error.code == ErrorCode::ChangeTokenExpired && !restarted) {
                qCWarning(tidesyncSyncLog) << "Change token expired; resetting watermark of"
                                           << QString::fromStdString(store_id) << "for a full download";
                settings_.reset_watermark(store_id);
                watermark = Timestamp{};
                cursor.reset();
                restarted = true;
                continue;
            }
            return Result<void, Error>::err(error);
        }

        const auto& page = page_result.unwrap();
        advance_progress(cycle, 0, static_cast<int>(page.records.size()));

        std::vector<Uuid> flagged;
        int written = 0;
        auto committed = db_.transaction([&]() -> Result<void, Error> {
            for (const auto& record : page.records) {
                auto applied = apply_remote_record(cycle, record);
                if (applied.is_err()) {
                    return Result<void, Error>::err(applied.unwrap_err());
                }
                if (applied.unwrap() == Applied::Written) ++written;
                if (applied.unwrap() == Applied::Flagged) flagged.push_back(record.uuid);
            }
            return Result<void, Error>::ok();
        });
        if (committed.is_err()) {
            return committed;
        }

        cycle.result.downloaded += written;
        for (const auto& uuid : flagged) {
            cycle.conflicted.insert(uuid);
            emit conflictDetected(qstr(uuid));
        }
        advance_progress(cycle, static_cast<int>(page.records.size()));

        if (!page.records.empty()) {
            const auto newest = std::max_element(
                page.records.begin(), page.records.end(),
                [](const auto& a, const auto& b) { return a.modified_at < b.modified_at; })->modified_at;
            if (settings_.advance_watermark(store_id, newest)) {
                qCDebug(tidesyncSyncLog) << "Watermark of" << QString::fromStdString(store_id)
                                         << "advanced to" << QString::fromStdString(newest.to_iso_string());
            }
        }

        if (!page.next_cursor) break;
        cursor = page.next_cursor;
    }
    return Result<void, Error>::ok();
}

Result<SyncOrchestrator::Applied, Error> SyncOrchestrator::apply_remote_record(
    Cycle& cycle, const remote::RemoteRecord& record) {
    using R = Result<Applied, Error>;

    auto loaded = entities_.get(record.uuid);
    if (loaded.is_err()) {
        return R::err(loaded.unwrap_err());
    }

    const auto& existing = loaded.unwrap();
    if (!existing) {
        auto entity = entity_from_remote(record);
        auto written = entities_.upsert(entity);
        if (written.is_err()) return R::err(written.unwrap_err());
        auto based = entities_.save_base(entity, clock_());
        if (based.is_err()) return R::err(based.unwrap_err());
        return R::ok(Applied::Written);
    }

    const auto& local = *existing;
    if (local.entity_type != record.record_type) {
        qCWarning(tidesyncSyncLog) << "Ignoring remote record" << QString::fromStdString(record.record_id)
                                   << "of type" << QString::fromStdString(record.record_type)
                                   << "for a local" << QString::fromStdString(local.entity_type);
        ++cycle.result.errors;
        return R::ok(Applied::NoChange);
    }
    if (local.conflict_resolution_needed) {
        return R::ok(Applied::NoChange);
    }

    auto remote_entity = entity_from_remote(record, &local);

    const bool locally_modified = local.sync_status == SyncStatus::PendingUpload ||
                                  local.sync_status == SyncStatus::Conflict ||
                                  local.sync_status == SyncStatus::Error;
    if (!locally_modified) {
        if (local.change_tag == record.change_tag && same_content(local, remote_entity)) {
            return R::ok(Applied::NoChange);
        }
        auto written = entities_.upsert(remote_entity);
        if (written.is_err()) return R::err(written.unwrap_err());
        auto based = entities_.save_base(remote_entity, clock_());
        if (based.is_err()) return R::err(based.unwrap_err());
        return R::ok(Applied::Written);
    }

    if (local.change_tag == record.change_tag) {
        // Our own pending edit sits on top of this very version.
        return R::ok(Applied::NoChange);
    }

    auto report = detector_.detect(local, remote_entity);
    if (report.is_err()) {
        return R::err(report.unwrap_err());
    }
    if (!report.unwrap().has_conflict) {
        auto adopted = local;
        adopted.record_id = record.record_id;
        adopted.change_tag = record.change_tag;
        adopted.sync_status = SyncStatus::Synced;
        auto written = entities_.upsert(adopted);
        if (written.is_err()) return R::err(written.unwrap_err());
        auto based = entities_.save_base(remote_entity, clock_());
        if (based.is_err()) return R::err(based.unwrap_err());
        return R::ok(Applied::Written);
    }

    qCInfo(tidesyncConflictLog) << "Conflict on" << qstr(local.uuid) << "fields"
                                << QString::fromStdString(join(report.unwrap().conflicting_fields));
    auto marked = flag_conflict(local, &remote_entity, "download");
    if (marked.is_err()) return R::err(marked.unwrap_err());
    return R::ok(Applied::Flagged);
}

// Conflicts

Result<void, Error> SyncOrchestrator::flag_conflict(Entity entity, const Entity* remote, std::string_view reason) {
    entity.conflict_resolution_needed = true;
    entity.sync_status = SyncStatus::Conflict;
    auto written = entities_.upsert(entity);
    if (written.is_err()) return written;

    auto opened = history_.record_detected(entity.uuid, clock_(), storage::ResolutionRecord{
        .strategy = std::string(to_string(resolver_.strategy())),
        .resolution_type = std::string(reason),
        .local_snapshot = codec::encode_entity(entity),
        .remote_snapshot = remote ? codec::encode_entity(*remote) : std::string{},
        .merged_snapshot = {},
        .notes = {}});
    if (opened.is_err()) {
        return Result<void, Error>::err(opened.unwrap_err());
    }
    qCInfo(tidesyncConflictLog) << "Flagged" << qstr(entity.uuid) << "for resolution (" << qstr(reason) << ")";
    return Result<void, Error>::ok();
}

Result<void, Error> SyncOrchestrator::clear_and_requeue(Entity entity, std::string_view reason) {
    entity.conflict_resolution_needed = false;
    entity.sync_status = SyncStatus::PendingUpload;
    entity.change_tag.reset();

    auto committed = db_.transaction([&]() -> Result<void, Error> {
        auto written = entities_.upsert(entity);
        if (written.is_err()) return written;
        auto closed = history_.record_resolution(entity.uuid, clock_(), storage::ResolutionRecord{
            .strategy = std::string(to_string(resolver_.strategy())),
            .resolution_type = "use_local",
            .local_snapshot = codec::encode_entity(entity),
            .remote_snapshot = {},
            .merged_snapshot = {},
            .notes = std::string(reason)});
        if (closed.is_err()) {
            return Result<void, Error>::err(closed.unwrap_err());
        }
        return Result<void, Error>::ok();
    });
    if (committed.is_err()) {
        return committed;
    }

    queue_.enqueue(entity.uuid, SyncPriority::High);
    qCInfo(tidesyncConflictLog) << "Cleared conflict on" << qstr(entity.uuid) << ":" << qstr(reason);
    return Result<void, Error>::ok();
}

Result<void, Error> SyncOrchestrator::resolve_flagged(Cycle& cycle) {
    auto flagged = entities_.fetch_conflicts();
    if (flagged.is_err()) {
        return Result<void, Error>::err(flagged.unwrap_err());
    }
    advance_progress(cycle, 0, static_cast<int>(flagged.unwrap().size()));

    for (const auto& local : flagged.unwrap()) {
        auto cancelled = check_cancelled(cycle, "during conflict resolution");
        if (cancelled.is_err()) return cancelled;

        cycle.conflicted.insert(local.uuid);
        const auto record_id = record_id_for(local);
        auto fetched = retry_.run([&] { return remote_.fetch_record(record_id); }, cycle.token);

        if (fetched.is_err()) {
            const auto& error = fetched.unwrap_err();
            if (error.code == ErrorCode::UnknownItem) {
                auto cleared = clear_and_requeue(local, "remote record missing");
                if (cleared.is_err()) return cleared;
            } else if (error.transient() || error.code == ErrorCode::ZoneNotFound ||
                       error.code == ErrorCode::Cancelled) {
                return Result<void, Error>::err(error);
            } else {
                qCWarning(tidesyncConflictLog) << "Cannot fetch" << QString::fromStdString(record_id) << ":"
                                               << QString::fromStdString(error.message);
                ++cycle.result.errors;
            }
            advance_progress(cycle, 1);
            continue;
        }

        const auto remote_entity = entity_from_remote(fetched.unwrap(), &local);
        auto resolved = apply_resolution(local, remote_entity);
        if (resolved.is_err()) {
            const auto& error = resolved.unwrap_err();
            if (error.code == ErrorCode::StorageError) {
                return Result<void, Error>::err(error);
            }
            qCWarning(tidesyncConflictLog) << "Cannot resolve" << qstr(local.uuid) << ":"
                                           << QString::fromStdString(error.message);
            ++cycle.result.errors;
        }
        advance_progress(cycle, 1);
    }
    return Result<void, Error>::ok();
}

Result<Resolution, Error> SyncOrchestrator::resolve_conflict(const Entity& local, const Entity& remote) {
    return apply_resolution(local, remote);
}

Result<Resolution, Error> SyncOrchestrator::apply_resolution(const Entity& local, const Entity& remote) {
    using R = Result<Resolution, Error>;

    auto report = detector_.detect(local, remote);
    if (report.is_err()) {
        return R::err(report.unwrap_err());
    }

    const auto strategy_id = std::string(to_string(resolver_.strategy()));
    const auto now = clock_();

    if (!report.unwrap().has_conflict) {
        auto settled = local;
        settled.conflict_resolution_needed = false;
        settled.record_id = remote.record_id ? remote.record_id : local.record_id;
        settled.change_tag = remote.change_tag;
        settled.sync_status = SyncStatus::Synced;

        auto committed = db_.transaction([&]() -> Result<void, Error> {
            auto written = entities_.upsert(settled);
            if (written.is_err()) return written;
            auto based = entities_.save_base(remote, now);
            if (based.is_err()) return based;
            auto closed = history_.record_resolution(local.uuid, now, storage::ResolutionRecord{
                .strategy = strategy_id,
                .resolution_type = "no_conflict",
                .local_snapshot = codec::encode_entity(local),
                .remote_snapshot = codec::encode_entity(remote),
                .merged_snapshot = {},
                .notes = "versions agree within tolerance"});
            if (closed.is_err()) {
                return Result<void, Error>::err(closed.unwrap_err());
            }
            return Result<void, Error>::ok();
        });
        if (committed.is_err()) {
            return R::err(committed.unwrap_err());
        }
        qCInfo(tidesyncConflictLog) << "No real conflict on" << qstr(local.uuid) << "; flag cleared";
        return R::ok(Resolution{.kind = Resolution::Kind::UseLocal});
    }

    auto base = entities_.get_base(local.uuid);
    if (base.is_err()) {
        return R::err(base.unwrap_err());
    }
    const Entity* base_ptr = base.unwrap() ? &*base.unwrap() : nullptr;

    auto resolved = resolver_.resolve(local, remote, base_ptr);
    if (resolved.is_err()) {
        return R::err(resolved.unwrap_err());
    }
    const auto& resolution = resolved.unwrap();

    if (resolution.kind == Resolution::Kind::Manual) {
        auto flagged = local;
        flagged.conflict_resolution_needed = true;
        flagged.sync_status = SyncStatus::Conflict;
        auto committed = db_.transaction([&]() -> Result<void, Error> {
            auto written = entities_.upsert(flagged);
            if (written.is_err()) return written;
            auto opened = history_.record_detected(local.uuid, now, storage::ResolutionRecord{
                .strategy = strategy_id,
                .resolution_type = "manual",
                .local_snapshot = codec::encode_entity(local),
                .remote_snapshot = codec::encode_entity(remote),
                .merged_snapshot = {},
                .notes = join(report.unwrap().conflicting_fields)});
            if (opened.is_err()) {
                return Result<void, Error>::err(opened.unwrap_err());
            }
            return Result<void, Error>::ok();
        });
        if (committed.is_err()) {
            return R::err(committed.unwrap_err());
        }
        qCInfo(tidesyncConflictLog) << "Conflict on" << qstr(local.uuid) << "left for manual resolution";
        return R::ok(resolution);
    }

    Entity outcome;
    bool upload_again = false;
    switch (resolution.kind) {
        case Resolution::Kind::UseLocal:
            outcome = local;
            upload_again = true;
            break;
        case Resolution::Kind::UseRemote:
            outcome = remote;
            break;
        case Resolution::Kind::Merge:
            outcome = *resolution.merged;
            upload_again = true;
            break;
        case Resolution::Kind::Manual:
            break;
    }
    outcome.uuid = local.uuid;
    outcome.conflict_resolution_needed = false;
    outcome.record_id = remote.record_id ? remote.record_id : local.record_id;
    outcome.change_tag = remote.change_tag;
    outcome.sync_status = upload_again ? SyncStatus::PendingUpload : SyncStatus::Synced;

    auto committed = db_.transaction([&]() -> Result<void, Error> {
        auto written = entities_.upsert(outcome);
        if (written.is_err()) return written;
        // The server copy is now the common ancestor of whatever gets uploaded next.
        auto based = entities_.save_base(remote, now);
        if (based.is_err()) return based;
        auto closed = history_.record_resolution(local.uuid, now, storage::ResolutionRecord{
            .strategy = strategy_id,
            .resolution_type = std::string(resolution.description()),
            .local_snapshot = codec::encode_entity(local),
            .remote_snapshot = codec::encode_entity(remote),
            .merged_snapshot = codec::encode_entity(outcome),
            .notes = join(resolution.unresolved_fields)});
        if (closed.is_err()) {
            return Result<void, Error>::err(closed.unwrap_err());
        }
        return Result<void, Error>::ok();
    });
    if (committed.is_err()) {
        return R::err(committed.unwrap_err());
    }

    if (upload_again) {
        queue_.enqueue(outcome.uuid, SyncPriority::High);
    }
    qCInfo(tidesyncConflictLog) << "Resolved" << qstr(local.uuid) << "with" << QString::fromStdString(strategy_id)
                                << "->" << qstr(resolution.description());
    if (!resolution.unresolved_fields.empty()) {
        qCInfo(tidesyncConflictLog) << "Fields kept at base value:"
                                    << QString::fromStdString(join(resolution.unresolved_fields));
    }
    return R::ok(resolution);
}

Result<std::vector<Entity>, Error> SyncOrchestrator::get_pending_conflicts() {
    return entities_.fetch_conflicts();
}

// Local changes and recovery

Result<void, Error> SyncOrchestrator::record_local_change(Entity entity, SyncPriority priority) {
    if (entity.entity_type.empty()) {
        return Result<void, Error>::err(Error{"Entity without a type", ErrorCode::InvalidEntityType});
    }
    if (entity.uuid.is_nil()) {
        return Result<void, Error>::err(Error{"Entity without a uuid", ErrorCode::InvalidArguments});
    }

    const auto now = std::max(clock_(), entity.last_modified);
    const bool flagged = entity.conflict_resolution_needed;
    if (!flagged) {
        entity.sync_status = SyncStatus::PendingUpload;
    }

    auto written = entities_.upsert(entity);
    if (written.is_err()) return written;
    if (flagged) {
        return Result<void, Error>::ok();
    }

    auto marked = entities_.mark_for_sync(entity.uuid, now);
    if (marked.is_err()) return marked;

    queue_.enqueue(entity.uuid, priority);
    qCDebug(tidesyncSyncLog) << "Queued local change" << qstr(entity.uuid) << "at" << qstr(to_string(priority));
    return Result<void, Error>::ok();
}

Result<size_t, Error> SyncOrchestrator::rebuild_queue() {
    auto pending = entities_.fetch_pending_upload();
    if (pending.is_err()) {
        return Result<size_t, Error>::err(pending.unwrap_err());
    }
    queue_.clear();
    for (const auto& entity : pending.unwrap()) {
        queue_.enqueue(entity.uuid, SyncPriority::Normal);
    }
    qCInfo(tidesyncSyncLog) << "Rebuilt sync queue with" << pending.unwrap().size() << "entities";
    return Result<size_t, Error>::ok(pending.unwrap().size());
}

Result<void, Error> SyncOrchestrator::recreate_remote_zone() {
    if (syncing_.load()) {
        return Result<void, Error>::err(Error{"Cannot recreate the zone during a sync cycle",
                                              ErrorCode::AlreadySyncing});
    }

    auto created = remote_.create_zone();
    if (created.is_err()) return created;

    const auto now = clock_();
    auto open = history_.unresolved();
    if (open.is_err()) {
        return Result<void, Error>::err(open.unwrap_err());
    }
    for (const auto& entry : open.unwrap()) {
        auto closed = history_.record_resolution(entry.entity_uuid, now, storage::ResolutionRecord{
            .strategy = entry.resolution_strategy,
            .resolution_type = "use_local",
            .local_snapshot = {},
            .remote_snapshot = {},
            .merged_snapshot = {},
            .notes = "remote zone recreated"});
        if (closed.is_err()) {
            return Result<void, Error>::err(closed.unwrap_err());
        }
    }

    auto reset = entities_.reset_remote_state(now);
    if (reset.is_err()) {
        return Result<void, Error>::err(reset.unwrap_err());
    }
    settings_.reset_watermark(remote_.store_id());

    auto queued = rebuild_queue();
    if (queued.is_err()) {
        return Result<void, Error>::err(queued.unwrap_err());
    }
    qCInfo(tidesyncSyncLog) << "Recreated remote zone; re-uploading" << reset.unwrap() << "entities";
    return Result<void, Error>::ok();
}

} // namespace tidesync::sync
