#pragma once

#include <types/device.hpp>
#include <types/enums.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace battwatch {

constexpr int LOW_BATTERY_THRESHOLD = 20;

// Label used for a multi-reading device whose reading carries none
constexpr const char* DEFAULT_COMPONENT_LABEL = "Central";

// 0 < level <= 20. Zero and unknown levels are never low.
bool is_low(const std::optional<int>& level);

// A level that can serve as the "was not low" side of an edge.
bool is_baseline(const std::optional<int>& level);

// Indices (ascending) where a reading crosses from not-low to low.
// Only indices present in both snapshots are compared.
std::vector<std::size_t> detect_low_battery_edges(const TelemetrySnapshot& previous,
                                                  const TelemetrySnapshot& current);

// User-facing message for an edge. `telemetry` is the snapshot the edge was
// detected in; it picks the component label for LowBattery.
std::string describe_edge(const Device& device, const TelemetrySnapshot& telemetry,
                          const NotificationEdge& edge);

} // namespace battwatch
