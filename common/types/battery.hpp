#pragma once

#include "device.hpp"
#include <cstdint>

namespace battwatch::aap {

enum class BatteryStatus : uint8_t {
    Charging = 0x01,
    Discharging = 0x02,
    Disconnected = 0x04,
};

enum class BatteryComponent : uint8_t {
    Headset = 0x01,  // AirPods Max
    Right = 0x02,
    Left = 0x04,
    Case = 0x08,
};

struct ComponentBattery {
    int8_t level = -1;  // 0-100, or -1 if unavailable
    bool charging = false;
    bool available = false;
};

// Battery report of an AirPods-family device
struct Battery {
    ComponentBattery left{};
    ComponentBattery right{};
    ComponentBattery case_{};
    ComponentBattery headset{};  // For AirPods Max

    // Which pod is primary (first in packet order)
    bool left_is_primary = true;
};

// Flatten into readings. A headset yields a single reading; earbuds always
// yield Left, Right, Case in that order so indices stay stable while a pod
// is out of range.
inline TelemetrySnapshot to_snapshot(const Battery& battery) {
    auto reading = [](const ComponentBattery& c, const char* label) {
        Reading r;
        if (c.available && c.level >= 0) r.level = c.level;
        r.label = label;
        return r;
    };

    if (battery.headset.available) {
        return {reading(battery.headset, "Headset")};
    }
    return {
        reading(battery.left, "Left"),
        reading(battery.right, "Right"),
        reading(battery.case_, "Case"),
    };
}

} // namespace battwatch::aap
