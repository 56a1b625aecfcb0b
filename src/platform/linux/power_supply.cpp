#include "platform/linux/power_supply.hpp"

#include <QDir>
#include <QFile>

#include <algorithm>

namespace tidesync::platform {

namespace {

QString read_attribute(const QDir& device, const QString& name) {
    QFile file(device.filePath(name));
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return {};
    }
    return QString::fromUtf8(file.readAll()).trimmed();
}

} // namespace

std::optional<PowerState> read_power_supply(const QString& root) {
    QDir dir(root);
    if (!dir.exists()) {
        return std::nullopt;
    }

    PowerState state;
    double capacity_sum = 0.0;
    int batteries = 0;
    bool battery_charging = false;
    bool mains_online = false;

    const auto entries = dir.entryList(QDir::Dirs | QDir::NoDotAndDotDot | QDir::System);
    for (const auto& name : entries) {
        const QDir device(dir.filePath(name));
        const auto type = read_attribute(device, QStringLiteral("type"));

        if (type == QLatin1String("Battery")) {
            bool ok = false;
            const int capacity = read_attribute(device, QStringLiteral("capacity")).toInt(&ok);
            if (!ok) continue;
            capacity_sum += std::clamp(capacity, 0, 100) / 100.0;
            ++batteries;
            const auto status = read_attribute(device, QStringLiteral("status"));
            if (status == QLatin1String("Charging") || status == QLatin1String("Full")) {
                battery_charging = true;
            }
        } else if (type == QLatin1String("Mains") || type == QLatin1String("USB")) {
            if (read_attribute(device, QStringLiteral("online")) == QLatin1String("1")) {
                mains_online = true;
            }
        }
    }

    if (batteries == 0) {
        return state;
    }
    state.has_battery = true;
    state.battery_level = capacity_sum / batteries;
    state.charging = battery_charging || mains_online;
    return state;
}

} // namespace tidesync::platform
