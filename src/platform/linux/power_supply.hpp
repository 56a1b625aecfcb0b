#pragma once

#include <QString>

#include <optional>

namespace tidesync::platform {

struct PowerState {
    double battery_level{1.0};  // 0..1
    bool charging{true};        // or running on mains
    bool has_battery{false};
};

/**
 * Read the power state from the Linux power_supply class directory
 * (normally /sys/class/power_supply). Batteries are averaged; a machine
 * without a battery reports full charge on mains power. Returns nullopt
 * when the directory cannot be read.
 */
[[nodiscard]] std::optional<PowerState> read_power_supply(
    const QString& root = QStringLiteral("/sys/class/power_supply"));

} // namespace tidesync::platform
