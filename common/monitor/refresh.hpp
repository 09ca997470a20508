#pragma once

#include "interfaces.hpp"
#include <types/config.hpp>
#include <types/device.hpp>
#include <chrono>
#include <functional>

namespace battwatch {

constexpr int CONNECTED_ATTEMPTS = 3;
constexpr int DISCONNECTED_ATTEMPTS = 1;
constexpr std::chrono::milliseconds RETRY_DELAY{500};

struct RetryPolicy {
    std::chrono::milliseconds delay = RETRY_DELAY;

    // Suspends the calling task between attempts. Empty means
    // std::this_thread::sleep_for.
    std::function<void(std::chrono::milliseconds)> sleep;
};

// Everything one refresh cycle reads, captured when the cycle starts
struct RefreshOptions {
    NotificationSettings notifications{};
    RetryPolicy retry{};
};

enum class RefreshState {
    Probing,
    Succeeded,
    Failed,
};

// Fewer attempts for a device already known to be unreachable
int attempt_budget(const RegisteredDevice& device);

// Bring one device up to date. Attempts are sequential and separated by
// retry.delay. Connect and low-battery edges are judged against `previous`,
// never against an intermediate attempt, so repeating a refresh with
// unchanged telemetry emits nothing. Does not touch the registry; the
// caller commits the returned aggregate.
RegisteredDevice refresh_device(const RegisteredDevice& previous,
                                Transport& transport,
                                Notifier& notifier,
                                const RefreshOptions& options);

// Single fetch used on registration. A device that fails is returned
// disconnected with empty telemetry instead of being rejected.
RegisteredDevice initial_fetch(const Device& device, Transport& transport);

} // namespace battwatch
