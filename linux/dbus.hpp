#pragma once

#include <monitor/discovery.hpp>
#include <monitor/scheduler.hpp>
#include <types/config.hpp>
#include <types/device.hpp>

#include <dbus/dbus.h>
#include <functional>
#include <string>
#include <vector>

namespace battwatch::dbus_service {

// D-Bus service configuration
constexpr const char* SERVICE_NAME = "io.github.battwatch";
constexpr const char* OBJECT_PATH = "/io/github/battwatch";
constexpr const char* INTERFACE_NAME = "io.github.battwatch.Monitor";
constexpr const char* ERROR_DISCOVERY = "io.github.battwatch.Error.DiscoveryFailed";
constexpr const char* ERROR_UNKNOWN_DEVICE = "io.github.battwatch.Error.UnknownDevice";

// Callbacks for method invocations and property access.
// All are invoked on the thread that calls process_pending().
struct Callbacks {
    std::function<DiscoveryResult()> on_discover;
    std::function<RegisterResult(const std::string& id)> on_register;
    std::function<bool(const std::string& id)> on_unregister;
    std::function<void()> on_reload;
    std::function<std::vector<RegisteredDevice>()> list_devices;
    std::function<Config()> get_config;
    std::function<void(const Config&)> set_config;
};

// Connect to the session bus and register the object path.
// Returns connection (caller owns) or nullptr.
DBusConnection* init(Callbacks* callbacks);

// Request the service name on the bus
bool request_name(DBusConnection* conn);

// Emit PropertiesChanged for the given properties
void emit_properties_changed(DBusConnection* conn, const std::vector<const char*>& property_names);

// Process pending D-Bus messages (call in event loop)
void process_pending(DBusConnection* conn);

// Get file descriptor for polling
int get_fd(DBusConnection* conn);

void cleanup(DBusConnection* conn);

} // namespace battwatch::dbus_service
