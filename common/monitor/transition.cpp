#include "transition.hpp"

#include <algorithm>

namespace battwatch {

bool is_low(const std::optional<int>& level) {
    return level && *level > 0 && *level <= LOW_BATTERY_THRESHOLD;
}

bool is_baseline(const std::optional<int>& level) {
    return level && *level != 0;
}

std::vector<std::size_t> detect_low_battery_edges(const TelemetrySnapshot& previous,
                                                  const TelemetrySnapshot& current) {
    std::vector<std::size_t> edges;
    std::size_t count = std::min(previous.size(), current.size());

    for (std::size_t i = 0; i < count; ++i) {
        const auto& before = previous[i].level;
        if (is_baseline(before) && !is_low(before) && is_low(current[i].level)) {
            edges.push_back(i);
        }
    }
    return edges;
}

std::string describe_edge(const Device& device, const TelemetrySnapshot& telemetry,
                          const NotificationEdge& edge) {
    switch (edge.type) {
        case NotificationType::Connected:
            return device.name + " has been connected.";
        case NotificationType::Disconnected:
            return device.name + " has been disconnected.";
        case NotificationType::LowBattery:
            break;
    }

    std::string subject = device.name;
    if (telemetry.size() >= 2 && edge.index < telemetry.size()) {
        const auto& label = telemetry[edge.index].label;
        subject += " ";
        subject += label ? *label : DEFAULT_COMPONENT_LABEL;
    }
    return subject + " has low battery.";
}

} // namespace battwatch
