#pragma once

#include <dbus/dbus.h>
#include <optional>
#include <string>
#include <vector>

namespace battwatch::bluez {

constexpr const char* SERVICE = "org.bluez";
constexpr const char* DEVICE_INTERFACE = "org.bluez.Device1";
constexpr const char* BATTERY_INTERFACE = "org.bluez.Battery1";

// AirPods accessory service UUID as listed in Device1.UUIDs
constexpr const char* AIRPODS_UUID = "74ec2172-0bad-4d01-8f77-997b2be0722a";

// Device object as seen in the BlueZ object tree
struct DeviceInfo {
    std::string path;       // D-Bus object path
    std::string address;    // MAC address
    std::string name;       // Alias, falling back to Name, then address
    bool connected = false;
    bool paired = false;
    bool has_battery = false;   // Exposes org.bluez.Battery1
    bool airpods = false;       // Advertises the AirPods service
};

// Battery1 properties
struct BatteryInfo {
    int percentage = -1;
    std::optional<std::string> source;
};

// Check if a UUIDs array contains the AirPods UUID
bool is_airpods(DBusMessageIter* uuids_iter);

// All device objects known to BlueZ. Returns nullopt and sets error if the
// object tree could not be read.
std::optional<std::vector<DeviceInfo>> list_devices(DBusConnection* conn, std::string& error);

// Device object for a MAC address, on any adapter
std::optional<DeviceInfo> find_device(DBusConnection* conn, const std::string& mac_address);

// Read Battery1 on a device object
std::optional<BatteryInfo> read_battery(DBusConnection* conn, const std::string& device_path);

} // namespace battwatch::bluez
