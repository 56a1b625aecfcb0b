#pragma once

#include "core/result.hpp"
#include "sync/cancellation.hpp"
#include "sync/device_monitor.hpp"
#include "sync/priority_queue.hpp"
#include "sync/sync_orchestrator.hpp"
#include "sync/sync_settings.hpp"

#include <QDateTime>
#include <QObject>
#include <QTimer>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace tidesync::sync {

struct SchedulerConfig {
    double low_battery_threshold{0.2};
    size_t heavy_threshold{50};             // pending items before a processing window is planned
    size_t external_power_threshold{200};   // pending items before it needs external power
    int processing_hour{2};                 // local time
    size_t refresh_batch{20};               // high-tier items per refresh window
    size_t processing_cap{500};             // items per processing window
    std::chrono::milliseconds refresh_budget{std::chrono::seconds(30)};
    std::chrono::milliseconds processing_budget{std::chrono::minutes(10)};
    std::chrono::milliseconds expiry_retry{std::chrono::seconds(60)};
};

enum class GateDecision {
    Allowed,
    LowBattery,
    NoNetwork,
    CellularDisabled,
    ExternalPowerRequired
};

[[nodiscard]] std::string_view to_string(GateDecision decision);

/**
 * Gate shared by every window: battery below the threshold while not
 * charging, no network, or a cellular/metered network without the user's
 * opt-in all refuse the window.
 */
[[nodiscard]] GateDecision evaluate_gate(const DeviceConditions& conditions,
                                         bool allow_cellular,
                                         const SchedulerConfig& config = {});

struct ProcessingPlan {
    QDateTime earliest_begin;
    bool requires_network{true};
    bool requires_external_power{false};
    size_t pending{0};
};

struct WindowOutcome {
    GateDecision gate{GateDecision::Allowed};
    std::optional<Result<SyncResult, Error>> cycle;
    size_t items{0};

    [[nodiscard]] bool ran() const { return cycle.has_value(); }
};

/**
 * BackgroundScheduler - decides whether and when a sync cycle may run.
 *
 * Two kinds of window, both delegating the cycle to the orchestrator:
 *   refresh     - periodic, self-renewing; uploads up to refresh_batch
 *                 high-tier items plus a full download
 *   processing  - planned for the next low-usage hour when the backlog
 *                 is large; drains up to processing_cap items
 * Internal QTimers trigger both while started; a host scheduler can call
 * the handle_* methods directly instead. All methods run on the thread
 * that owns the scheduler, except on_expired() which may be called from
 * any thread.
 */
class BackgroundScheduler : public QObject {
    Q_OBJECT

public:
    using Now = std::function<QDateTime()>;

    BackgroundScheduler(SyncOrchestrator& orchestrator,
                        SyncPriorityQueue& queue,
                        SyncSettings& settings,
                        const DeviceMonitor& monitor,
                        SchedulerConfig config = {},
                        QObject* parent = nullptr);
    ~BackgroundScheduler() override;

    [[nodiscard]] bool should_sync() const;
    [[nodiscard]] GateDecision gate() const;

    /**
     * Plan for a processing window, or nullopt when `pending` does not
     * exceed the heavy threshold.
     */
    [[nodiscard]] std::optional<ProcessingPlan> plan_processing_window(size_t pending, const QDateTime& now) const;

    // Arms the timers if background sync is enabled.
    void start();
    void stop();
    [[nodiscard]] bool is_started() const { return started_; }

    WindowOutcome handle_refresh_window();
    WindowOutcome handle_processing_window();

    // The host is reclaiming the window: cancel the running cycle and retry soon.
    void on_expired();
    void on_entered_background();
    void on_significant_time_change();

    [[nodiscard]] bool refresh_armed() const { return refresh_timer_.isActive(); }
    [[nodiscard]] std::chrono::milliseconds refresh_delay() const;
    [[nodiscard]] bool processing_armed() const { return processing_timer_.isActive(); }
    [[nodiscard]] std::optional<ProcessingPlan> planned_processing() const { return planned_; }

    [[nodiscard]] const SchedulerConfig& config() const { return config_; }
    void set_now(Now now) { now_ = std::move(now); }

signals:
    void windowSkipped(const QString& reason);
    void windowCompleted(int items);

private:
    void arm_refresh(std::chrono::milliseconds delay);
    void arm_processing_if_needed();
    void finish_window(const WindowOutcome& outcome);
    [[nodiscard]] std::shared_ptr<CancellationToken> begin_window(std::chrono::milliseconds budget);
    void end_window();

    SyncOrchestrator& orchestrator_;
    SyncPriorityQueue& queue_;
    SyncSettings& settings_;
    const DeviceMonitor& monitor_;
    SchedulerConfig config_;
    Now now_;

    QTimer refresh_timer_;
    QTimer processing_timer_;
    std::optional<ProcessingPlan> planned_;
    bool started_{false};

    std::mutex token_mutex_;
    std::shared_ptr<CancellationToken> active_token_;
};

} // namespace tidesync::sync
