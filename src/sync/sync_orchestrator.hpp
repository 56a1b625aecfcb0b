#pragma once

#include "core/entity.hpp"
#include "core/result.hpp"
#include "remote/remote_store.hpp"
#include "storage/conflict_history_repository.hpp"
#include "storage/database.hpp"
#include "storage/entity_repository.hpp"
#include "sync/cancellation.hpp"
#include "sync/conflict_detector.hpp"
#include "sync/conflict_resolver.hpp"
#include "sync/priority_queue.hpp"
#include "sync/retry_policy.hpp"
#include "sync/sync_settings.hpp"

#include <QObject>
#include <QString>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string_view>
#include <vector>

namespace tidesync::sync {

enum class SyncPhase {
    Idle,
    VerifyingRemoteAvailability,
    Uploading,
    Downloading,
    ResolvingConflicts
};

[[nodiscard]] std::string_view to_string(SyncPhase phase);

/**
 * SyncResult - counts for one cycle.
 *
 * `conflicts` counts distinct entities found in conflict; `errors` counts
 * records that failed without aborting the cycle.
 */
struct SyncResult {
    int uploaded{0};
    int downloaded{0};
    int conflicts{0};
    int errors{0};

    bool operator==(const SyncResult&) const = default;
};

/**
 * SyncOrchestrator - runs sync cycles between the local entity store and a
 * remote record store.
 *
 * One cycle: verify the account, upload pending entities in batches,
 * download everything modified after the watermark, then resolve every
 * flagged entity with the configured strategy. Cycles are synchronous and
 * must run on the thread that owns the database; cancel_pending_sync() may
 * be called from any thread and takes effect between batches and phases.
 *
 * Work already committed stays committed when a cycle is cancelled or
 * fails. The download watermark moves only after a page is persisted.
 */
class SyncOrchestrator : public QObject {
    Q_OBJECT

public:
    using Clock = std::function<Timestamp()>;

    SyncOrchestrator(storage::Database& db,
                     remote::RemoteRecordStore& remote,
                     SyncPriorityQueue& queue,
                     SyncSettings& settings,
                     QObject* parent = nullptr);
    ~SyncOrchestrator() override;

    /**
     * Full cycle: uploads everything pending, queued entries first in
     * priority order. Fails with AlreadySyncing while another cycle runs.
     */
    [[nodiscard]] Result<SyncResult, Error> sync_pending_changes(
        std::shared_ptr<CancellationToken> token = nullptr);

    /**
     * Cycle whose upload phase covers only `scope` (entries already taken
     * off the queue). Entries not uploaded are put back with their priority.
     */
    [[nodiscard]] Result<SyncResult, Error> sync_entities(
        const std::vector<QueuedEntity>& scope,
        std::shared_ptr<CancellationToken> token = nullptr);

    void cancel_pending_sync();

    [[nodiscard]] Result<std::vector<Entity>, Error> get_pending_conflicts();

    /**
     * Resolve one conflict with the active strategy and persist the outcome
     * and its history entry. A pair that does not actually conflict clears
     * the flag and adopts the remote change tag.
     */
    [[nodiscard]] Result<Resolution, Error> resolve_conflict(const Entity& local, const Entity& remote);

    /**
     * Persist a local edit, mark it for sync and queue it. Flagged entities
     * are stored but not queued.
     */
    [[nodiscard]] Result<void, Error> record_local_change(Entity entity,
                                                          SyncPriority priority = SyncPriority::Normal);

    /**
     * Refill the queue from the store (start of a session). Returns the
     * number of entities queued.
     */
    [[nodiscard]] Result<size_t, Error> rebuild_queue();

    /**
     * Recovery after ZoneNotFound: recreate the zone, reset the watermark and
     * mark every entity for a fresh upload.
     */
    [[nodiscard]] Result<void, Error> recreate_remote_zone();

    [[nodiscard]] bool is_syncing() const { return syncing_.load(); }
    [[nodiscard]] SyncPhase phase() const { return phase_.load(); }
    // Counts of the last cycle, including partial counts of a failed one.
    [[nodiscard]] const SyncResult& last_result() const { return last_result_; }

    [[nodiscard]] ConflictResolver& resolver() { return resolver_; }
    [[nodiscard]] const ConflictDetector& detector() const { return detector_; }

    void set_retry_policy(RetryPolicy policy) { retry_ = std::move(policy); }
    void set_clock(Clock clock) { clock_ = std::move(clock); }

signals:
    void phaseChanged(const QString& phase);
    void progressChanged(int completed, int total);
    void syncStarted();
    void syncFinished(int uploaded, int downloaded, int conflicts, int errors);
    void syncFailed(const QString& message);
    void conflictDetected(const QString& uuid);

private:
    struct Cycle {
        std::shared_ptr<CancellationToken> token;
        std::vector<QueuedEntity> work;
        bool full{true};  // upload everything pending, not just `work`
        SyncResult result;
        std::set<Uuid> conflicted;
        int completed{0};
        int total{0};
    };

    enum class Applied {
        NoChange,
        Written,
        Flagged
    };

    [[nodiscard]] Result<SyncResult, Error> run_cycle(std::optional<std::vector<QueuedEntity>> scope,
                                                      std::shared_ptr<CancellationToken> token);
    [[nodiscard]] Result<void, Error> run_phases(Cycle& cycle);

    [[nodiscard]] Result<void, Error> verify_remote(Cycle& cycle);
    [[nodiscard]] Result<void, Error> upload(Cycle& cycle);
    [[nodiscard]] Result<void, Error> upload_batch(Cycle& cycle, const std::vector<QueuedEntity>& batch);
    [[nodiscard]] Result<void, Error> download(Cycle& cycle);
    [[nodiscard]] Result<Applied, Error> apply_remote_record(Cycle& cycle, const remote::RemoteRecord& record);
    [[nodiscard]] Result<void, Error> resolve_flagged(Cycle& cycle);

    [[nodiscard]] Result<Resolution, Error> apply_resolution(const Entity& local, const Entity& remote);
    [[nodiscard]] Result<void, Error> flag_conflict(Entity entity, const Entity* remote, std::string_view reason);
    [[nodiscard]] Result<void, Error> clear_and_requeue(Entity entity, std::string_view reason);

    void requeue_leftovers(const std::vector<QueuedEntity>& work);
    [[nodiscard]] Result<void, Error> check_cancelled(const Cycle& cycle, std::string_view where) const;
    void set_phase(SyncPhase phase);
    void advance_progress(Cycle& cycle, int completed_delta, int total_delta = 0);

    storage::Database& db_;
    storage::EntityRepository entities_;
    storage::ConflictHistoryRepository history_;
    remote::RemoteRecordStore& remote_;
    SyncPriorityQueue& queue_;
    SyncSettings& settings_;

    ConflictDetector detector_;
    ConflictResolver resolver_;
    RetryPolicy retry_;
    Clock clock_;

    std::atomic<bool> syncing_{false};
    std::atomic<SyncPhase> phase_{SyncPhase::Idle};
    SyncResult last_result_;

    std::mutex token_mutex_;
    std::shared_ptr<CancellationToken> current_token_;
};

} // namespace tidesync::sync
