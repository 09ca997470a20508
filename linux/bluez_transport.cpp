#include "bluez_transport.hpp"
#include "aap.hpp"
#include "bluez.hpp"
#include "l2cap.hpp"

#include <monitor/snapshot.hpp>

#include <iostream>

namespace battwatch {

BluezTransport::BluezTransport() {
    DBusError err;
    dbus_error_init(&err);

    // Private connection: fetches block on it from worker threads and it
    // must not share a dispatch queue with the control service.
    conn_ = dbus_bus_get_private(DBUS_BUS_SYSTEM, &err);
    if (dbus_error_is_set(&err)) {
        std::cerr << "bluez: failed to connect to system D-Bus: " << err.message << std::endl;
        dbus_error_free(&err);
        conn_ = nullptr;
        return;
    }
    dbus_connection_set_exit_on_disconnect(conn_, FALSE);
}

BluezTransport::~BluezTransport() {
    if (conn_) {
        dbus_connection_close(conn_);
        dbus_connection_unref(conn_);
    }
}

std::optional<std::vector<Device>> BluezTransport::enumerate(std::string& error) {
    if (!conn_) {
        error = "Bluetooth service unavailable.";
        return std::nullopt;
    }

    auto objects = bluez::list_devices(conn_, error);
    if (!objects) {
        return std::nullopt;
    }

    std::vector<Device> devices;
    for (const auto& info : *objects) {
        if (info.has_battery || info.airpods) {
            devices.push_back({info.address, info.name});
        }
    }
    return devices;
}

std::optional<TelemetrySnapshot> BluezTransport::fetch_telemetry(const std::string& id) {
    if (!conn_) {
        return std::nullopt;
    }

    if (!l2cap::valid_address(id)) {
        std::cerr << "bluez: not a Bluetooth address: " << id << std::endl;
        return std::nullopt;
    }

    auto info = bluez::find_device(conn_, id);
    if (!info) {
        std::cerr << "bluez: " << id << " is not known to BlueZ" << std::endl;
        return std::nullopt;
    }
    if (!info->connected) {
        return std::nullopt;
    }

    BatterySources sources;
    sources.accessory = info->airpods;

    // AirPods are read over AAP only. The Battery1 level of an AirPods
    // device is a single reading and would shift the component indices.
    if (info->airpods) {
        sources.accessory_report = aap::read_battery(info->address);
    } else if (info->has_battery) {
        if (auto battery = bluez::read_battery(conn_, info->path)) {
            Reading reading;
            if (battery->percentage >= 0) reading.level = battery->percentage;
            reading.label = battery->source;
            sources.battery_service = reading;
        }
    }

    return compose_snapshot(sources);
}

} // namespace battwatch
