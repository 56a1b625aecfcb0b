#pragma once

#include "core/types.hpp"
#include "sync/conflict_resolver.hpp"

#include <QString>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

class QSettings;

namespace tidesync::sync {

/**
 * SyncSettings - persisted sync preferences and progress markers.
 *
 * Backed by QSettings: the application's native location by default, or an
 * INI file (tests, the CLI --settings option). The download watermark is
 * kept per remote store and only moves forward unless explicitly reset.
 */
class SyncSettings {
public:
    SyncSettings();
    explicit SyncSettings(const QString& ini_path);
    ~SyncSettings();

    SyncSettings(const SyncSettings&) = delete;
    SyncSettings& operator=(const SyncSettings&) = delete;

    [[nodiscard]] std::optional<Timestamp> last_sync_date() const;
    void set_last_sync_date(Timestamp at);

    [[nodiscard]] std::optional<Timestamp> last_background_sync_date() const;
    void set_last_background_sync_date(Timestamp at);

    [[nodiscard]] Timestamp watermark(const std::string& store_id) const;
    // Returns false (and keeps the old value) when `to` is not newer.
    bool advance_watermark(const std::string& store_id, Timestamp to);
    void reset_watermark(const std::string& store_id);

    [[nodiscard]] bool background_enabled() const;
    void set_background_enabled(bool enabled);

    [[nodiscard]] std::chrono::seconds sync_interval() const;
    void set_sync_interval(std::chrono::seconds interval);

    [[nodiscard]] bool allow_cellular() const;
    void set_allow_cellular(bool allow);

    // Unknown stored ids read back as the default strategy.
    [[nodiscard]] ResolutionStrategy strategy() const;
    void set_strategy(ResolutionStrategy strategy);

    [[nodiscard]] int batch_size() const;
    void set_batch_size(int size);

    void sync();

private:
    [[nodiscard]] std::optional<Timestamp> read_timestamp(const QString& key) const;

    std::unique_ptr<QSettings> settings_;
};

} // namespace tidesync::sync
