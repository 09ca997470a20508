#pragma once

#include "interfaces.hpp"
#include <types/device.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace battwatch {

constexpr std::chrono::milliseconds DISCOVERY_TIMEOUT{20000};

constexpr const char* DISCOVERY_FAILED_MESSAGE = "Failed to fetch devices.";
constexpr const char* PERMISSION_HINT = " Please make sure Bluetooth permission is granted.";

// True where the OS gates Bluetooth access behind a runtime permission
constexpr bool platform_gates_bluetooth() {
#if defined(__APPLE__)
    return true;
#else
    return false;
#endif
}

struct DiscoveryOptions {
    std::chrono::milliseconds timeout = DISCOVERY_TIMEOUT;
    bool permission_gated = platform_gates_bluetooth();
};

enum class DiscoveryError {
    None,
    Timeout,
    Transport,
};

struct DiscoveryResult {
    std::vector<Device> devices;
    DiscoveryError error = DiscoveryError::None;
    std::string message;  // User-facing, set when error != None

    bool ok() const { return error == DiscoveryError::None; }
};

// Append the permission hint unless the message already talks about
// permissions or the platform does not gate access.
std::string with_permission_hint(std::string message, bool permission_gated);

// Enumerate devices within options.timeout. The enumeration runs on its own
// thread that shares ownership of `transport`; if the timer wins, that
// thread's eventual result is dropped.
DiscoveryResult discover(std::shared_ptr<Transport> transport,
                         const DiscoveryOptions& options = {});

} // namespace battwatch
