#include "refresh.hpp"
#include "transition.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <thread>

namespace battwatch {

namespace {

std::optional<TelemetrySnapshot> try_fetch(Transport& transport, const std::string& id) {
    try {
        return transport.fetch_telemetry(id);
    } catch (const std::exception& e) {
        std::cerr << "refresh: fetch for " << id << " threw: " << e.what() << std::endl;
        return std::nullopt;
    } catch (...) {
        std::cerr << "refresh: fetch for " << id << " threw a non-standard exception" << std::endl;
        return std::nullopt;
    }
}

// Delivery is best effort; a failing sink never fails the refresh
void emit(Notifier& notifier, const std::string& message) {
    try {
        notifier.notify(message);
        std::cout << "refresh: notified \"" << message << "\"" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "refresh: notification failed: " << e.what() << std::endl;
    } catch (...) {
        std::cerr << "refresh: notification failed: non-standard exception" << std::endl;
    }
}

void pause(const RetryPolicy& retry) {
    if (retry.sleep) {
        retry.sleep(retry.delay);
    } else {
        std::this_thread::sleep_for(retry.delay);
    }
}

} // namespace

int attempt_budget(const RegisteredDevice& device) {
    return device.disconnected ? DISCONNECTED_ATTEMPTS : CONNECTED_ATTEMPTS;
}

RegisteredDevice refresh_device(const RegisteredDevice& previous,
                                Transport& transport,
                                Notifier& notifier,
                                const RefreshOptions& options) {
    const std::string& id = previous.id();
    const bool was_disconnected = previous.disconnected;
    const int budget = attempt_budget(previous);
    const auto& notify = options.notifications;

    RefreshState state = RefreshState::Probing;
    std::optional<TelemetrySnapshot> snapshot;
    int attempt = 0;

    while (state == RefreshState::Probing) {
        ++attempt;
        std::cout << "refresh: " << id << " attempt " << attempt << "/" << budget << std::endl;

        snapshot = try_fetch(transport, id);
        if (snapshot) {
            state = RefreshState::Succeeded;
        } else if (attempt >= budget) {
            state = RefreshState::Failed;
        } else {
            pause(options.retry);
        }
    }

    RegisteredDevice updated = previous;

    if (state == RefreshState::Failed) {
        updated.disconnected = true;
        std::cerr << "refresh: " << id << " unreachable after " << budget << " attempts" << std::endl;

        // A disconnect edge ends the cycle; low battery is not evaluated
        if (!was_disconnected && notify.allows(NotificationType::Disconnected)) {
            emit(notifier, describe_edge(updated.device, updated.telemetry,
                                         {NotificationType::Disconnected, 0}));
        }
        return updated;
    }

    updated.telemetry = std::move(*snapshot);
    updated.disconnected = false;

    if (was_disconnected && notify.allows(NotificationType::Connected)) {
        emit(notifier, describe_edge(updated.device, updated.telemetry,
                                     {NotificationType::Connected, 0}));
    }

    if (notify.allows(NotificationType::LowBattery)) {
        for (std::size_t index : detect_low_battery_edges(previous.telemetry, updated.telemetry)) {
            emit(notifier, describe_edge(updated.device, updated.telemetry,
                                         {NotificationType::LowBattery, index}));
        }
    }

    return updated;
}

RegisteredDevice initial_fetch(const Device& device, Transport& transport) {
    RegisteredDevice registered;
    registered.device = device;

    std::cout << "refresh: initial fetch for " << device.id << std::endl;
    if (auto snapshot = try_fetch(transport, device.id)) {
        registered.telemetry = std::move(*snapshot);
        registered.disconnected = false;
    } else {
        std::cerr << "refresh: initial fetch for " << device.id
                  << " failed, registering as disconnected" << std::endl;
        registered.disconnected = true;
    }
    return registered;
}

} // namespace battwatch
