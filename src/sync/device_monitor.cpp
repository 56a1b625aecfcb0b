#include "sync/device_monitor.hpp"
#include "core/logging.hpp"
#include "platform/linux/power_supply.hpp"

#include <QNetworkInformation>

namespace tidesync::sync {

std::string_view to_string(NetworkKind kind) {
    switch (kind) {
        case NetworkKind::None: return "none";
        case NetworkKind::Wifi: return "wifi";
        case NetworkKind::Ethernet: return "ethernet";
        case NetworkKind::Cellular: return "cellular";
        case NetworkKind::Other: return "other";
    }
    return "unknown";
}

SystemDeviceMonitor::SystemDeviceMonitor() {
    has_backend_ = QNetworkInformation::loadBackendByFeatures(
        QNetworkInformation::Feature::Reachability | QNetworkInformation::Feature::TransportMedium);
    if (!has_backend_) {
        has_backend_ = QNetworkInformation::loadDefaultBackend();
    }
    if (!has_backend_) {
        qCWarning(tidesyncSchedulerLog) << "No network information backend; assuming the network is reachable";
    }
}

DeviceConditions SystemDeviceMonitor::current() const {
    DeviceConditions conditions;

    if (const auto power = platform::read_power_supply()) {
        conditions.battery_level = power->battery_level;
        conditions.charging = power->charging;
    } else {
        conditions.charging = true;
    }

    auto* info = has_backend_ ? QNetworkInformation::instance() : nullptr;
    if (!info) {
        conditions.network = NetworkKind::Other;
        return conditions;
    }

    const auto reachability = info->reachability();
    if (reachability == QNetworkInformation::Reachability::Disconnected) {
        conditions.network = NetworkKind::None;
        return conditions;
    }

    switch (info->transportMedium()) {
        case QNetworkInformation::TransportMedium::WiFi:
            conditions.network = NetworkKind::Wifi;
            break;
        case QNetworkInformation::TransportMedium::Ethernet:
            conditions.network = NetworkKind::Ethernet;
            break;
        case QNetworkInformation::TransportMedium::Cellular:
            conditions.network = NetworkKind::Cellular;
            break;
        default:
            conditions.network = NetworkKind::Other;
            break;
    }
    conditions.metered = info->isMetered();
    return conditions;
}

} // namespace tidesync::sync
