#pragma once

#include <types/device.hpp>
#include <optional>
#include <string>
#include <vector>

namespace battwatch {

// Peripheral transport. Implementations are called from several threads at
// once and report failure through empty results rather than exceptions.
class Transport {
public:
    virtual ~Transport() = default;

    // List currently discoverable devices. On failure returns nullopt and
    // sets error to a user-facing message.
    virtual std::optional<std::vector<Device>> enumerate(std::string& error) = 0;

    // Read current telemetry for a known device id.
    virtual std::optional<TelemetrySnapshot> fetch_telemetry(const std::string& id) = 0;
};

// Fire-and-forget user notification
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual void notify(const std::string& message) = 0;
};

// Persistent registry storage
class RegistryStore {
public:
    virtual ~RegistryStore() = default;

    // nullopt if the stored registry could not be read
    virtual std::optional<std::vector<RegisteredDevice>> load() = 0;
    virtual bool save(const std::vector<RegisteredDevice>& devices) = 0;
};

} // namespace battwatch
