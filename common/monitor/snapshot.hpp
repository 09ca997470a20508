#pragma once

#include <types/battery.hpp>
#include <types/device.hpp>
#include <optional>

namespace battwatch {

// Battery readings gathered for one fetch of a device
struct BatterySources {
    bool accessory = false;                      // Reports over AAP (AirPods)
    std::optional<aap::Battery> accessory_report;
    std::optional<Reading> battery_service;      // org.bluez.Battery1
};

// Pick the snapshot for a fetch. An accessory device only ever yields its
// per-component layout; a missed accessory report fails the fetch instead
// of falling back to the single battery service level, so reading indices
// stay the same from one fetch to the next.
std::optional<TelemetrySnapshot> compose_snapshot(const BatterySources& sources);

} // namespace battwatch
