#pragma once

#include "enums.hpp"
#include <chrono>

namespace battwatch {

struct NotificationSettings {
    bool enabled = true;            // Master switch
    bool on_connected = true;
    bool on_disconnected = true;
    bool on_low_battery = true;

    bool allows(NotificationType type) const {
        if (!enabled) return false;
        switch (type) {
            case NotificationType::Connected: return on_connected;
            case NotificationType::Disconnected: return on_disconnected;
            case NotificationType::LowBattery: return on_low_battery;
        }
        return false;
    }
};

struct Config {
    std::chrono::milliseconds poll_interval{60000};
    NotificationSettings notifications{};
};

} // namespace battwatch
