#include "snapshot.hpp"

namespace battwatch {

std::optional<TelemetrySnapshot> compose_snapshot(const BatterySources& sources) {
    if (sources.accessory) {
        if (!sources.accessory_report) {
            return std::nullopt;
        }
        return aap::to_snapshot(*sources.accessory_report);
    }

    if (sources.battery_service) {
        return TelemetrySnapshot{*sources.battery_service};
    }
    return std::nullopt;
}

} // namespace battwatch
