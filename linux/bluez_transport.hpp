#pragma once

#include <monitor/interfaces.hpp>
#include <dbus/dbus.h>

namespace battwatch {

// Transport backed by BlueZ over the system bus. AirPods are read over
// their accessory channel (per-component levels); everything else through
// org.bluez.Battery1.
class BluezTransport : public Transport {
public:
    // Opens a private system bus connection. Check is_open().
    BluezTransport();
    ~BluezTransport() override;

    BluezTransport(const BluezTransport&) = delete;
    BluezTransport& operator=(const BluezTransport&) = delete;

    bool is_open() const { return conn_ != nullptr; }

    std::optional<std::vector<Device>> enumerate(std::string& error) override;
    std::optional<TelemetrySnapshot> fetch_telemetry(const std::string& id) override;

private:
    DBusConnection* conn_ = nullptr;
};

} // namespace battwatch
