#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace battwatch {

enum class NotificationType : uint8_t {
    Connected = 0,
    Disconnected = 1,
    LowBattery = 2,
};

inline std::string_view to_string(NotificationType type) {
    switch (type) {
        case NotificationType::Connected: return "connected";
        case NotificationType::Disconnected: return "disconnected";
        case NotificationType::LowBattery: return "low_battery";
    }
    return "unknown";
}

inline std::optional<NotificationType> notification_type_from_string(std::string_view s) {
    if (s == "connected") return NotificationType::Connected;
    if (s == "disconnected") return NotificationType::Disconnected;
    if (s == "low_battery" || s == "low-battery") return NotificationType::LowBattery;
    return std::nullopt;
}

// A detected edge between two consecutive telemetry snapshots.
// Never stored; only decides whether a notification is emitted.
struct NotificationEdge {
    NotificationType type = NotificationType::Connected;
    std::size_t index = 0;  // Reading index, LowBattery only
};

} // namespace battwatch
