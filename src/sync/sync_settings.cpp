#include "sync/sync_settings.hpp"

#include <QSettings>

#include <algorithm>

namespace tidesync::sync {

namespace {

constexpr const char* kSettingsLastSyncDate = "sync/last_sync_date";
constexpr const char* kSettingsLastBackgroundSyncDate = "sync/last_background_sync_date";
constexpr const char* kSettingsWatermarkPrefix = "sync/watermark/";
constexpr const char* kSettingsBackgroundEnabled = "sync/background_enabled";
constexpr const char* kSettingsIntervalSeconds = "sync/interval_seconds";
constexpr const char* kSettingsAllowCellular = "sync/allow_cellular";
constexpr const char* kSettingsStrategy = "sync/strategy";
constexpr const char* kSettingsBatchSize = "sync/batch_size";

constexpr qint64 kDefaultIntervalSeconds = 6 * 60 * 60;
constexpr int kDefaultBatchSize = 50;
constexpr ResolutionStrategy kDefaultStrategy = ResolutionStrategy::MostRecent;

QString key(const char* name) {
    return QString::fromLatin1(name);
}

// QSettings treats '/' as a group separator; store ids may contain paths.
QString watermark_key(const std::string& store_id) {
    auto id = QString::fromStdString(store_id);
    id.replace(QLatin1Char('/'), QLatin1Char('_'));
    id.replace(QLatin1Char('\\'), QLatin1Char('_'));
    return key(kSettingsWatermarkPrefix) + id;
}

} // namespace

SyncSettings::SyncSettings() : settings_(std::make_unique<QSettings>()) {}

SyncSettings::SyncSettings(const QString& ini_path)
    : settings_(std::make_unique<QSettings>(ini_path, QSettings::IniFormat)) {}

SyncSettings::~SyncSettings() = default;

std::optional<Timestamp> SyncSettings::read_timestamp(const QString& name) const {
    if (!settings_->contains(name)) return std::nullopt;
    bool ok = false;
    const auto millis = settings_->value(name).toLongLong(&ok);
    if (!ok) return std::nullopt;
    return Timestamp(millis);
}

std::optional<Timestamp> SyncSettings::last_sync_date() const {
    return read_timestamp(key(kSettingsLastSyncDate));
}

void SyncSettings::set_last_sync_date(Timestamp at) {
    settings_->setValue(key(kSettingsLastSyncDate), static_cast<qint64>(at.millis()));
}

std::optional<Timestamp> SyncSettings::last_background_sync_date() const {
    return read_timestamp(key(kSettingsLastBackgroundSyncDate));
}

void SyncSettings::set_last_background_sync_date(Timestamp at) {
    settings_->setValue(key(kSettingsLastBackgroundSyncDate), static_cast<qint64>(at.millis()));
}

Timestamp SyncSettings::watermark(const std::string& store_id) const {
    return read_timestamp(watermark_key(store_id)).value_or(Timestamp{});
}

bool SyncSettings::advance_watermark(const std::string& store_id, Timestamp to) {
    if (to <= watermark(store_id)) {
        return false;
    }
    settings_->setValue(watermark_key(store_id), static_cast<qint64>(to.millis()));
    return true;
}

void SyncSettings::reset_watermark(const std::string& store_id) {
    settings_->remove(watermark_key(store_id));
}

bool SyncSettings::background_enabled() const {
    return settings_->value(key(kSettingsBackgroundEnabled), false).toBool();
}

void SyncSettings::set_background_enabled(bool enabled) {
    settings_->setValue(key(kSettingsBackgroundEnabled), enabled);
}

std::chrono::seconds SyncSettings::sync_interval() const {
    const auto seconds = settings_->value(key(kSettingsIntervalSeconds), kDefaultIntervalSeconds).toLongLong();
    return std::chrono::seconds(seconds > 0 ? seconds : kDefaultIntervalSeconds);
}

void SyncSettings::set_sync_interval(std::chrono::seconds interval) {
    settings_->setValue(key(kSettingsIntervalSeconds), static_cast<qint64>(interval.count()));
}

bool SyncSettings::allow_cellular() const {
    return settings_->value(key(kSettingsAllowCellular), false).toBool();
}

void SyncSettings::set_allow_cellular(bool allow) {
    settings_->setValue(key(kSettingsAllowCellular), allow);
}

ResolutionStrategy SyncSettings::strategy() const {
    const auto id = settings_->value(key(kSettingsStrategy)).toString().toStdString();
    return parse_strategy(id).value_or(kDefaultStrategy);
}

void SyncSettings::set_strategy(ResolutionStrategy strategy) {
    settings_->setValue(key(kSettingsStrategy), QString::fromLatin1(to_string(strategy).data(),
                                                                    static_cast<int>(to_string(strategy).size())));
}

int SyncSettings::batch_size() const {
    const auto size = settings_->value(key(kSettingsBatchSize), kDefaultBatchSize).toInt();
    return size > 0 ? size : kDefaultBatchSize;
}

void SyncSettings::set_batch_size(int size) {
    settings_->setValue(key(kSettingsBatchSize), std::max(size, 1));
}

void SyncSettings::sync() {
    settings_->sync();
}

} // namespace tidesync::sync
