#pragma once

#include <string_view>

namespace tidesync::sync {

enum class NetworkKind {
    None,
    Wifi,
    Ethernet,
    Cellular,
    Other
};

[[nodiscard]] std::string_view to_string(NetworkKind kind);

struct DeviceConditions {
    double battery_level{1.0};  // 0..1
    bool charging{false};
    NetworkKind network{NetworkKind::None};
    bool metered{false};
};

/**
 * DeviceMonitor - source of the conditions the background scheduler gates on.
 */
class DeviceMonitor {
public:
    virtual ~DeviceMonitor() = default;
    [[nodiscard]] virtual DeviceConditions current() const = 0;
};

/**
 * SystemDeviceMonitor - QNetworkInformation for connectivity, the Linux
 * power_supply class for the battery.
 *
 * Without a network information backend the network is assumed reachable
 * and unmetered.
 */
class SystemDeviceMonitor : public DeviceMonitor {
public:
    SystemDeviceMonitor();
    [[nodiscard]] DeviceConditions current() const override;

private:
    bool has_backend_{false};
};

/**
 * FixedDeviceMonitor - reports whatever it was last told.
 */
class FixedDeviceMonitor : public DeviceMonitor {
public:
    explicit FixedDeviceMonitor(DeviceConditions conditions = {.battery_level = 1.0,
                                                               .charging = true,
                                                               .network = NetworkKind::Wifi,
                                                               .metered = false})
        : conditions_(conditions) {}

    [[nodiscard]] DeviceConditions current() const override { return conditions_; }
    void set(DeviceConditions conditions) { conditions_ = conditions; }

private:
    DeviceConditions conditions_;
};

} // namespace tidesync::sync
