#include "sync/background_scheduler.hpp"
#include "core/logging.hpp"

#include <QMetaObject>
#include <QTime>

#include <algorithm>
#include <limits>

namespace tidesync::sync {

namespace {

int clamp_to_timer(std::chrono::milliseconds delay) {
    const auto ms = std::clamp<std::chrono::milliseconds::rep>(delay.count(), 0, std::numeric_limits<int>::max());
    return static_cast<int>(ms);
}

} // namespace

std::string_view to_string(GateDecision decision) {
    switch (decision) {
        case GateDecision::Allowed: return "Allowed";
        case GateDecision::LowBattery: return "Low battery";
        case GateDecision::NoNetwork: return "No network";
        case GateDecision::CellularDisabled: return "Cellular data disabled";
        case GateDecision::ExternalPowerRequired: return "External power required";
    }
    return "Unknown";
}

GateDecision evaluate_gate(const DeviceConditions& conditions, bool allow_cellular, const SchedulerConfig& config) {
    if (conditions.battery_level < config.low_battery_threshold && !conditions.charging) {
        return GateDecision::LowBattery;
    }
    if (conditions.network == NetworkKind::None) {
        return GateDecision::NoNetwork;
    }
    if ((conditions.network == NetworkKind::Cellular || conditions.metered) && !allow_cellular) {
        return GateDecision::CellularDisabled;
    }
    return GateDecision::Allowed;
}

BackgroundScheduler::BackgroundScheduler(SyncOrchestrator& orchestrator,
                                         SyncPriorityQueue& queue,
                                         SyncSettings& settings,
                                         const DeviceMonitor& monitor,
                                         SchedulerConfig config,
                                         QObject* parent)
    : QObject(parent)
    , orchestrator_(orchestrator)
    , queue_(queue)
    , settings_(settings)
    , monitor_(monitor)
    , config_(config)
    , now_([] { return QDateTime::currentDateTime(); }) {
    refresh_timer_.setSingleShot(true);
    processing_timer_.setSingleShot(true);
    connect(&refresh_timer_, &QTimer::timeout, this, [this]() {
        const auto outcome = handle_refresh_window();
        Q_UNUSED(outcome)
    });
    connect(&processing_timer_, &QTimer::timeout, this, [this]() {
        const auto outcome = handle_processing_window();
        Q_UNUSED(outcome)
    });
}

BackgroundScheduler::~BackgroundScheduler() = default;

GateDecision BackgroundScheduler::gate() const {
    return evaluate_gate(monitor_.current(), settings_.allow_cellular(), config_);
}

bool BackgroundScheduler::should_sync() const {
    return gate() == GateDecision::Allowed;
}

std::optional<ProcessingPlan> BackgroundScheduler::plan_processing_window(size_t pending, const QDateTime& now) const {
    if (pending <= config_.heavy_threshold) {
        return std::nullopt;
    }

    QDateTime begin = now;
    begin.setTime(QTime(config_.processing_hour, 0));
    if (begin <= now) {
        begin = begin.addDays(1);
    }
    return ProcessingPlan{
        .earliest_begin = begin,
        .requires_network = true,
        .requires_external_power = pending > config_.external_power_threshold,
        .pending = pending};
}

void BackgroundScheduler::start() {
    if (!settings_.background_enabled()) {
        qCInfo(tidesyncSchedulerLog) << "Background sync disabled; nothing scheduled";
        stop();
        return;
    }
    started_ = true;
    arm_refresh(settings_.sync_interval());
    arm_processing_if_needed();
}

void BackgroundScheduler::stop() {
    started_ = false;
    refresh_timer_.stop();
    processing_timer_.stop();
    planned_.reset();
}

std::chrono::milliseconds BackgroundScheduler::refresh_delay() const {
    return std::chrono::milliseconds(refresh_timer_.interval());
}

void BackgroundScheduler::arm_refresh(std::chrono::milliseconds delay) {
    if (!settings_.background_enabled()) {
        return;
    }
    refresh_timer_.start(clamp_to_timer(delay));
    qCDebug(tidesyncSchedulerLog) << "Refresh window armed in" << delay.count() / 1000 << "s";
}

void BackgroundScheduler::arm_processing_if_needed() {
    if (!settings_.background_enabled()) {
        return;
    }
    const auto now = now_();
    planned_ = plan_processing_window(queue_.size(), now);
    if (!planned_) {
        processing_timer_.stop();
        return;
    }
    const auto delay = std::chrono::milliseconds(now.msecsTo(planned_->earliest_begin));
    processing_timer_.start(clamp_to_timer(delay));
    qCInfo(tidesyncSchedulerLog) << "Processing window planned for"
                                 << planned_->earliest_begin.toString(Qt::ISODate)
                                 << "pending" << planned_->pending
                                 << (planned_->requires_external_power ? "(external power required)" : "");
}

std::shared_ptr<CancellationToken> BackgroundScheduler::begin_window(std::chrono::milliseconds budget) {
    auto token = CancellationToken::with_budget(budget);
    std::lock_guard lock(token_mutex_);
    active_token_ = token;
    return token;
}

void BackgroundScheduler::end_window() {
    std::lock_guard lock(token_mutex_);
    active_token_.reset();
}

void BackgroundScheduler::finish_window(const WindowOutcome& outcome) {
    if (!outcome.ran()) {
        const auto reason = QString::fromLatin1(to_string(outcome.gate).data(),
                                                static_cast<qsizetype>(to_string(outcome.gate).size()));
        qCInfo(tidesyncSchedulerLog) << "Skipping background sync:" << reason;
        emit windowSkipped(reason);
        return;
    }

    const auto& cycle = *outcome.cycle;
    if (cycle.is_ok()) {
        settings_.set_last_background_sync_date(Timestamp::now());
    } else if (cycle.unwrap_err().code == ErrorCode::Cancelled) {
        // Budget ran out: try again soon instead of waiting a full interval.
        arm_refresh(config_.expiry_retry);
    }
    emit windowCompleted(static_cast<int>(outcome.items));
}

WindowOutcome BackgroundScheduler::handle_refresh_window() {
    // Re-arm before running so that a failed or expired window never stops the cycle.
    arm_refresh(settings_.sync_interval());

    WindowOutcome outcome;
    outcome.gate = gate();
    if (outcome.gate != GateDecision::Allowed) {
        finish_window(outcome);
        return outcome;
    }

    // High tier first; with none waiting, a small backlog below the
    // processing threshold still drains one slice per window.
    auto items = queue_.dequeue_tier(SyncPriority::High, config_.refresh_batch);
    const bool high_only = !items.empty();
    if (!high_only) {
        items = queue_.dequeue_batch(config_.refresh_batch);
    }
    outcome.items = items.size();
    qCInfo(tidesyncSchedulerLog) << "Refresh window with" << outcome.items
                                 << (high_only ? "high priority items" : "queued items");

    auto token = begin_window(config_.refresh_budget);
    outcome.cycle = orchestrator_.sync_entities(items, token);
    end_window();

    finish_window(outcome);
    arm_processing_if_needed();
    return outcome;
}

WindowOutcome BackgroundScheduler::handle_processing_window() {
    WindowOutcome outcome;
    outcome.gate = gate();
    const auto conditions = monitor_.current();
    if (outcome.gate == GateDecision::Allowed && queue_.size() > config_.external_power_threshold &&
        !conditions.charging) {
        outcome.gate = GateDecision::ExternalPowerRequired;
    }
    if (outcome.gate != GateDecision::Allowed) {
        finish_window(outcome);
        arm_processing_if_needed();
        return outcome;
    }

    auto items = queue_.dequeue_batch(config_.processing_cap);
    outcome.items = items.size();
    qCInfo(tidesyncSchedulerLog) << "Processing window with" << outcome.items << "items";

    auto token = begin_window(config_.processing_budget);
    outcome.cycle = orchestrator_.sync_entities(items, token);
    end_window();

    finish_window(outcome);
    arm_processing_if_needed();
    return outcome;
}

void BackgroundScheduler::on_expired() {
    {
        std::lock_guard lock(token_mutex_);
        if (active_token_) {
            active_token_->cancel();
        }
    }
    orchestrator_.cancel_pending_sync();
    qCInfo(tidesyncSchedulerLog) << "Background window expired; retrying in"
                                 << config_.expiry_retry.count() / 1000 << "s";
    QMetaObject::invokeMethod(this, [this]() { arm_refresh(config_.expiry_retry); }, Qt::AutoConnection);
}

void BackgroundScheduler::on_entered_background() {
    if (!settings_.background_enabled()) {
        return;
    }
    if (!refresh_timer_.isActive()) {
        arm_refresh(settings_.sync_interval());
    }
    arm_processing_if_needed();
}

void BackgroundScheduler::on_significant_time_change() {
    const auto last = settings_.last_background_sync_date();
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(settings_.sync_interval());
    if (!last || Timestamp::now() - *last >= interval) {
        qCInfo(tidesyncSchedulerLog) << "Background sync overdue after a time change";
        arm_refresh(config_.expiry_retry);
    }
}

} // namespace tidesync::sync
