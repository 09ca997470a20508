#pragma once

#include <optional>
#include <string>
#include <vector>

namespace battwatch {

// A discoverable peripheral. Immutable once registered.
struct Device {
    std::string id;     // Stable transport identifier (Bluetooth address)
    std::string name;   // Display name
};

// One battery measurement taken in a single fetch
struct Reading {
    std::optional<int> level;           // 0-100, or nullopt if unknown
    std::optional<std::string> label;   // Sub-component, e.g. "Left", "Case"
};

// Readings from one fetch. Order is transport-defined and stable between
// consecutive fetches of the same device.
using TelemetrySnapshot = std::vector<Reading>;

struct RegisteredDevice {
    Device device;
    TelemetrySnapshot telemetry;
    bool disconnected = false;

    const std::string& id() const { return device.id; }
};

} // namespace battwatch
